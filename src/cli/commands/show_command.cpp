#include "taskr/cli/commands/show_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "taskr/cli/task_format.hpp"

namespace taskr::cli {

ShowCommand::ShowCommand(Application& app) : app_(app) {
}

void ShowCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("id", id_, "Task id as printed by list")->required();
}

Result<int> ShowCommand::execute(const GlobalOptions& options) {
  auto& task_list = app_.taskList();

  auto task = task_list.getTask(id_);
  if (!task.has_value()) {
    return std::unexpected(task.error());
  }
  if (!task->has_value()) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "No task with id " + std::to_string(id_)));
  }

  auto document = task_list.documentOf(**task);
  if (!document.has_value()) {
    return std::unexpected(document.error());
  }
  std::string document_name = document->has_value() ? (*document)->name : std::string();

  auto children = task_list.listTasks((*task)->id);
  if (!children.has_value()) {
    return std::unexpected(children.error());
  }

  if (options.json) {
    auto output = taskToJson(**task, document_name);
    if (document->has_value()) {
      output["path"] = (*document)->path.string();
    }
    nlohmann::json json_children = nlohmann::json::array();
    for (const auto& child : *children) {
      json_children.push_back(child.id);
    }
    output["children"] = json_children;
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  const auto& row = **task;
  std::cout << "Task:        #" << row.id << std::endl;
  std::cout << "Description: " << row.description << std::endl;
  std::cout << "Status:      " << (row.open ? "open" : "closed")
            << (row.actionable ? "" : ", waiting") << std::endl;
  std::cout << "Priority:    " << row.priority << std::endl;
  std::cout << "Due:         " << (row.hasDueDate() ? row.due : "-") << std::endl;
  std::cout << "Document:    " << (document_name.empty() ? "(unknown)" : document_name) << std::endl;
  if (document->has_value()) {
    std::cout << "File:        " << (*document)->path.string() << std::endl;
  }
  if (row.parent != taskr::tasks::kNoParent) {
    std::cout << "Parent:      #" << row.parent << std::endl;
  }
  if (!children->empty()) {
    std::cout << "Subtasks:   ";
    for (const auto& child : *children) {
      std::cout << " #" << child.id;
    }
    std::cout << std::endl;
  }
  return 0;
}

} // namespace taskr::cli
