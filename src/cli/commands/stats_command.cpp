#include "taskr/cli/commands/stats_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "taskr/query/task_filter.hpp"
#include "taskr/query/task_index.hpp"

namespace taskr::cli {

StatsCommand::StatsCommand(Application& app) : app_(app) {
}

Result<int> StatsCommand::execute(const GlobalOptions& options) {
  auto snapshot = taskr::query::takeSnapshot(app_.taskList());
  if (!snapshot.has_value()) {
    return std::unexpected(snapshot.error());
  }

  auto stats = taskr::query::buildStatistics(*snapshot);

  if (options.json) {
    nlohmann::json output;
    output["open"] = stats.total;
    output["by_priority"] = stats.by_priority;
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  std::cout << stats.total << " open item" << (stats.total == 1 ? "" : "s");
  if (!stats.by_priority.empty()) {
    std::cout << " (";
    for (size_t i = 0; i < stats.by_priority.size(); ++i) {
      if (i > 0) std::cout << "/";
      std::cout << stats.by_priority[i];
    }
    std::cout << ")";
  }
  std::cout << std::endl;
  return 0;
}

} // namespace taskr::cli
