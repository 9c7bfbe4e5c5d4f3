#include "taskr/cli/commands/index_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "taskr/tasks/indexer.hpp"

namespace taskr::cli {

IndexCommand::IndexCommand(Application& app) : app_(app) {
}

void IndexCommand::setupCommand(CLI::App* cmd) {
  cmd->add_flag("--full", full_, "Reindex every document, even unchanged ones");
}

Result<int> IndexCommand::execute(const GlobalOptions& options) {
  taskr::tasks::Indexer indexer(app_.notebook(), app_.taskList());

  auto report = indexer.indexAll(full_);
  if (!report.has_value()) {
    return std::unexpected(report.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["scanned"] = report->scanned;
    output["indexed"] = report->indexed;
    output["unchanged"] = report->unchanged;
    output["excluded"] = report->excluded;
    output["removed"] = report->removed;
    output["failed"] = report->failed;
    output["tasks"] = report->tasks;
    output["errors"] = report->errors;
    std::cout << output.dump(2) << std::endl;
    return report->failed == 0 ? 0 : 1;
  }

  for (const auto& error : report->errors) {
    std::cerr << "Warning: " << error << std::endl;
  }

  if (!options.quiet) {
    std::cout << "Indexed " << report->indexed << " of " << report->scanned << " documents ("
              << report->tasks << " tasks)";
    if (report->unchanged > 0) {
      std::cout << ", " << report->unchanged << " unchanged";
    }
    if (report->excluded > 0) {
      std::cout << ", " << report->excluded << " excluded";
    }
    if (report->removed > 0) {
      std::cout << ", " << report->removed << " removed";
    }
    std::cout << std::endl;
  }

  return report->failed == 0 ? 0 : 1;
}

} // namespace taskr::cli
