#include "taskr/cli/commands/tags_command.hpp"

#include <iostream>
#include <iomanip>
#include <nlohmann/json.hpp>

#include "taskr/query/task_filter.hpp"
#include "taskr/query/task_index.hpp"

namespace taskr::cli {

TagsCommand::TagsCommand(Application& app) : app_(app) {
}

Result<int> TagsCommand::execute(const GlobalOptions& options) {
  auto& task_list = app_.taskList();

  auto snapshot = taskr::query::takeSnapshot(task_list);
  if (!snapshot.has_value()) {
    return std::unexpected(snapshot.error());
  }

  taskr::query::TaskFilter filter(task_list.labels(), task_list.config().tag_by_page);
  auto labels = taskr::query::buildLabelIndex(*snapshot, task_list.labels());
  auto tags = taskr::query::buildTagIndex(*snapshot, filter);

  if (options.json) {
    nlohmann::json json_labels = nlohmann::json::array();
    for (const auto& [label, count] : labels) {
      json_labels.push_back({{"name", label}, {"count", count}});
    }
    nlohmann::json json_tags = nlohmann::json::array();
    for (const auto& [key, entry] : tags.entries()) {
      json_tags.push_back({{"name", entry.display}, {"count", entry.count}});
    }

    nlohmann::json output;
    output["labels"] = json_labels;
    output["tags"] = json_tags;
    output["untagged"] = tags.untagged();
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (labels.empty() && tags.entries().empty() && tags.untagged() == 0) {
    if (!options.quiet) {
      std::cout << "No open tasks." << std::endl;
    }
    return 0;
  }

  for (const auto& [label, count] : labels) {
    std::cout << std::setw(20) << std::left << label << " " << count << std::endl;
  }
  if (tags.untagged() > 0) {
    std::cout << std::setw(20) << std::left << "Untagged" << " " << tags.untagged() << std::endl;
  }
  if (!labels.empty() || tags.untagged() > 0) {
    std::cout << std::string(30, '-') << std::endl;
  }
  for (const auto& [key, entry] : tags.entries()) {
    std::cout << std::setw(20) << std::left << ("@" + entry.display) << " " << entry.count << std::endl;
  }
  return 0;
}

} // namespace taskr::cli
