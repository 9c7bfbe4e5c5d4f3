#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "taskr/util/date.hpp"

namespace taskr::tasks {

using TaskId = std::int64_t;
using DocumentId = std::int64_t;

// Parent id of top-level tasks
inline constexpr TaskId kNoParent = 0;

// Fields inferred for one task item
struct TaskFields {
  bool open = true;
  bool actionable = true;
  int priority = 0;
  std::string due{taskr::util::kNoDate};  // ISO date or kNoDate
  std::string description;

  bool hasDueDate() const { return due != taskr::util::kNoDate; }

  bool operator==(const TaskFields& other) const = default;
};

// Extracted task with its nested tasks, before storage
struct TaskNode {
  TaskFields fields;
  std::vector<TaskNode> children;
};

using TaskForest = std::vector<TaskNode>;

// Stored task row
struct Task : TaskFields {
  TaskId id = 0;
  DocumentId source = 0;
  TaskId parent = kNoParent;
  bool has_children = false;
};

// Number of nodes in a forest, nested ones included
size_t countTasks(const TaskForest& forest);

}  // namespace taskr::tasks
