#include "taskr/tasks/task.hpp"

namespace taskr::tasks {

size_t countTasks(const TaskForest& forest) {
  size_t count = 0;
  for (const auto& node : forest) {
    count += 1 + countTasks(node.children);
  }
  return count;
}

}  // namespace taskr::tasks
