#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "taskr/cli/application.hpp"

namespace taskr::cli {

class ShowCommand : public Command {
public:
  explicit ShowCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "show"; }
  std::string description() const override { return "Show one task"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  long long id_ = 0;
};

} // namespace taskr::cli
