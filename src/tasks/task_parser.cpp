#include "taskr/tasks/task_parser.hpp"

#include <algorithm>
#include <regex>

#include "taskr/util/date.hpp"

namespace taskr::tasks {

using taskr::util::Date;

DueDateExtraction extractDueDate(std::string_view text) {
  static const std::regex date_regex(R"(\s*\[d:([^\]]+)\])");

  DueDateExtraction result;
  result.text = std::string(text);

  using Iterator = std::string::const_iterator;
  const std::string& source = result.text;
  for (std::regex_iterator<Iterator> it(source.begin(), source.end(), date_regex), end;
       it != end; ++it) {
    const auto& match = *it;
    auto date = Date::parse(match[1].str());
    if (!date) {
      continue;
    }
    std::string remaining = source.substr(0, static_cast<size_t>(match.position(0)));
    remaining += source.substr(static_cast<size_t>(match.position(0) + match.length(0)));
    result.date = Date::toIso(*date);
    result.text = std::move(remaining);
    break;
  }
  return result;
}

TaskParser::TaskParser(const LabelMatcher& labels) : labels_(labels) {}

TaskFields TaskParser::parse(std::string text, bool open,
                             const std::vector<std::string>& global_tags,
                             const std::optional<std::string>& default_date,
                             std::optional<int> default_priority,
                             const std::vector<TaskNode>& siblings) const {
  TaskFields fields;
  fields.open = open;

  int priority = static_cast<int>(std::count(text.begin(), text.end(), '!'));
  if (priority == 0 && default_priority) {
    priority = *default_priority;
  }
  fields.priority = priority;

  for (const auto& tag : global_tags) {
    std::string token = "@" + tag;
    if (text.find(token) == std::string::npos) {
      text += " " + token;
    }
  }

  auto extraction = extractDueDate(text);
  if (extraction.date) {
    fields.due = *extraction.date;
  } else if (default_date) {
    fields.due = *default_date;
  } else {
    fields.due = std::string(taskr::util::kNoDate);
  }
  fields.description = std::move(extraction.text);

  // A "Next:" item waits for its open predecessor
  if (labels_.matchesNext(fields.description) && !siblings.empty()) {
    fields.actionable = !siblings.back().fields.open;
  } else {
    fields.actionable = true;
  }

  return fields;
}

}  // namespace taskr::tasks
