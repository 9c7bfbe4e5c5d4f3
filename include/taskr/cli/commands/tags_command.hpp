#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "taskr/cli/application.hpp"

namespace taskr::cli {

class TagsCommand : public Command {
public:
  explicit TagsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "tags"; }
  std::string description() const override { return "Show labels and tags of open tasks with counts"; }

private:
  Application& app_;
};

} // namespace taskr::cli
