#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "taskr/cli/application.hpp"

namespace taskr::cli {

class UpdateCommand : public Command {
public:
  explicit UpdateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "update"; }
  std::string description() const override { return "Index a single document"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string document_;
};

} // namespace taskr::cli
