#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "taskr/cli/application.hpp"

namespace taskr::cli {

class ListCommand : public Command {
public:
  explicit ListCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "list"; }
  std::string description() const override { return "List open tasks"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::vector<std::string> filter_words_;
  std::vector<std::string> tags_;
  std::vector<std::string> labels_;
  bool untagged_ = false;
  bool actionable_ = false;
  bool csv_ = false;
};

} // namespace taskr::cli
