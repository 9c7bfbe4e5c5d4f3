#include "taskr/cli/commands/forget_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

namespace taskr::cli {

ForgetCommand::ForgetCommand(Application& app) : app_(app) {
}

void ForgetCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("document", document_, "Page name, e.g. Projects:Garden")->required();
}

Result<int> ForgetCommand::execute(const GlobalOptions& options) {
  auto removed = app_.taskList().removeDocument(document_);
  if (!removed.has_value()) {
    return std::unexpected(removed.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["document"] = document_;
    output["removed"] = *removed;
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    if (*removed) {
      std::cout << "Removed tasks of " << document_ << std::endl;
    } else {
      std::cout << "No tasks found for " << document_ << std::endl;
    }
  }
  return 0;
}

} // namespace taskr::cli
