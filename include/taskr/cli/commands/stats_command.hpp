#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "taskr/cli/application.hpp"

namespace taskr::cli {

class StatsCommand : public Command {
public:
  explicit StatsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "stats"; }
  std::string description() const override { return "Count open tasks by priority"; }

private:
  Application& app_;
};

} // namespace taskr::cli
