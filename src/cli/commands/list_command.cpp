#include "taskr/cli/commands/list_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "taskr/cli/task_format.hpp"
#include "taskr/query/task_filter.hpp"
#include "taskr/query/task_index.hpp"
#include "taskr/util/date.hpp"

namespace taskr::cli {

ListCommand::ListCommand(Application& app) : app_(app) {
}

void ListCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("filter", filter_words_, "Text to look for, prefix with \"not\" to exclude");
  cmd->add_option("-t,--tag", tags_, "Only tasks with this tag (repeatable)");
  cmd->add_option("-l,--label", labels_, "Only tasks with this label (repeatable)");
  cmd->add_flag("--untagged", untagged_, "Include tasks without tags in the tag filter");
  cmd->add_flag("-a,--actionable", actionable_, "Only actionable tasks");
  cmd->add_flag("--csv", csv_, "Output as CSV");
}

Result<int> ListCommand::execute(const GlobalOptions& options) {
  auto& task_list = app_.taskList();

  taskr::query::FilterCriteria criteria;
  criteria.actionable_only = actionable_;

  std::string text;
  for (const auto& word : filter_words_) {
    if (!text.empty()) text += " ";
    text += word;
  }
  criteria.text = taskr::query::parseTextFilter(text);

  std::vector<std::string> tags;
  for (const auto& tag : tags_) {
    // "@home" and "home" both name the tag
    tags.push_back(tag.starts_with("@") ? tag.substr(1) : tag);
  }
  if (untagged_) {
    tags.emplace_back(taskr::query::kNoTags);
  }
  if (!tags.empty()) {
    criteria.tags = tags;
  }
  if (!labels_.empty()) {
    criteria.labels = labels_;
  }

  auto snapshot = taskr::query::takeSnapshot(task_list);
  if (!snapshot.has_value()) {
    return std::unexpected(snapshot.error());
  }

  taskr::query::TaskFilter filter(task_list.labels(), task_list.config().tag_by_page);
  auto visible = filter.visibleIds(*snapshot, criteria);
  auto rows = taskr::query::visibleTree(*snapshot, visible);

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& row : rows) {
      auto json = taskToJson(row.task, row.document);
      json["depth"] = row.depth;
      output.push_back(json);
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (csv_) {
    std::cout << "id,parent,priority,due,document,actionable,description" << std::endl;
    for (const auto& row : rows) {
      std::cout << row.task.id << "," << row.task.parent << "," << row.task.priority << ","
                << displayDue(row.task) << "," << csvField(row.document) << ","
                << (row.task.actionable ? "true" : "false") << ","
                << csvField(row.task.description) << std::endl;
    }
    return 0;
  }

  if (rows.empty()) {
    if (!options.quiet) {
      std::cout << "No tasks found matching criteria." << std::endl;
    }
    return 0;
  }

  auto today = taskr::util::Date::today();
  bool use_workweek = task_list.config().use_workweek;
  const std::string reset = "\033[0m";
  const std::string dim = "\033[2m";

  for (const auto& row : rows) {
    const auto& task = row.task;
    std::string indent(static_cast<size_t>(row.depth) * 2, ' ');
    std::string marker = task.open ? "[ ]" : "[x]";
    std::string priority = task.priority > 0 ? std::string(static_cast<size_t>(task.priority), '!') + " " : "";
    std::string description = displayDescription(task, task_list.labels());

    std::cout << indent << marker << " " << priority;
    if (!options.no_color && (!task.actionable || !task.open)) {
      std::cout << dim << description << reset;
    } else {
      std::cout << description;
    }

    if (task.hasDueDate()) {
      auto color = urgencyColor(taskr::util::Date::urgency(task.due, today, use_workweek));
      std::cout << "  ";
      if (!options.no_color && !color.empty()) {
        std::cout << color << task.due << reset;
      } else {
        std::cout << task.due;
      }
    }
    std::cout << "  (" << row.document << ", #" << task.id << ")" << std::endl;
  }

  if (options.verbose) {
    std::cout << "\nTotal: " << rows.size() << " tasks" << std::endl;
  }
  return 0;
}

} // namespace taskr::cli
