#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "taskr/cli/application.hpp"

namespace taskr::cli {

class IndexCommand : public Command {
public:
  explicit IndexCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "index"; }
  std::string description() const override { return "Scan the notes directory and index every document"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  bool full_ = false;
};

} // namespace taskr::cli
