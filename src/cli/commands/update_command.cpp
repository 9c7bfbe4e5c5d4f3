#include "taskr/cli/commands/update_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "taskr/tasks/indexer.hpp"

namespace taskr::cli {

UpdateCommand::UpdateCommand(Application& app) : app_(app) {
}

void UpdateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("document", document_, "Page name (Projects:Garden) or file path")->required();
}

Result<int> UpdateCommand::execute(const GlobalOptions& options) {
  taskr::tasks::Indexer indexer(app_.notebook(), app_.taskList());

  auto outcome = indexer.indexOne(document_);
  if (!outcome.has_value()) {
    return std::unexpected(outcome.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["document"] = document_;
    output["excluded"] = outcome->excluded;
    output["tasks"] = outcome->tasks;
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    if (outcome->excluded) {
      std::cout << document_ << " is outside the indexed subtrees" << std::endl;
    } else {
      std::cout << "Indexed " << outcome->tasks << " task" << (outcome->tasks == 1 ? "" : "s")
                << " from " << document_ << std::endl;
    }
  }
  return 0;
}

} // namespace taskr::cli
