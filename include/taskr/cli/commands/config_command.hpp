#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "taskr/cli/application.hpp"

namespace taskr::cli {

class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "config"; }
  std::string description() const override { return "Show or write the configuration"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  bool init_ = false;
  bool force_ = false;
};

} // namespace taskr::cli
