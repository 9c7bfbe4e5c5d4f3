#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "taskr/cli/application.hpp"

namespace taskr::cli {

class ForgetCommand : public Command {
public:
  explicit ForgetCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "forget"; }
  std::string description() const override { return "Remove the tasks of a document"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string document_;
};

} // namespace taskr::cli
