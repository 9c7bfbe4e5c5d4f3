#include "taskr/cli/task_format.hpp"

#include <regex>

namespace taskr::cli {

std::string displayDescription(const taskr::tasks::Task& task,
                               const taskr::tasks::LabelMatcher& labels) {
  static const std::regex priority_regex(R"(\s*!+\s*)");

  std::string text = std::regex_replace(task.description, priority_regex, " ");
  text = labels.stripNext(text);

  size_t start = text.find_first_not_of(' ');
  if (start == std::string::npos) {
    return {};
  }
  size_t end = text.find_last_not_of(' ');
  return text.substr(start, end - start + 1);
}

std::string displayDue(const taskr::tasks::Task& task) {
  return task.hasDueDate() ? task.due : std::string();
}

std::string urgencyColor(taskr::util::Urgency urgency) {
  switch (urgency) {
    case taskr::util::Urgency::kHigh:
      return "\033[31m";  // red
    case taskr::util::Urgency::kMedium:
      return "\033[33m";  // yellow
    case taskr::util::Urgency::kAlert:
      return "\033[32m";  // green
    case taskr::util::Urgency::kNone:
      break;
  }
  return {};
}

nlohmann::json taskToJson(const taskr::tasks::Task& task, const std::string& document) {
  nlohmann::json json;
  json["id"] = task.id;
  json["parent"] = task.parent;
  json["document"] = document;
  json["open"] = task.open;
  json["actionable"] = task.actionable;
  json["priority"] = task.priority;
  json["due"] = task.hasDueDate() ? nlohmann::json(task.due) : nlohmann::json(nullptr);
  json["description"] = task.description;
  json["tags"] = taskr::tasks::extractTags(task.description);
  json["has_children"] = task.has_children;
  return json;
}

std::string csvField(const std::string& value) {
  if (value.find_first_of(",\"\n") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

} // namespace taskr::cli
