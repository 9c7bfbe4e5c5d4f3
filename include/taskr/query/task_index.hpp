#pragma once

#include <map>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "taskr/query/task_filter.hpp"
#include "taskr/tasks/labels.hpp"

namespace taskr::query {

// Open tasks per tag. Tags are case-insensitive; the first spelling seen
// is kept for display.
class TagIndex {
 public:
  struct Entry {
    std::string display;
    size_t count = 0;
  };

  void add(const std::vector<std::string>& tags);

  // Entries sorted by lower-case tag
  const std::map<std::string, Entry>& entries() const { return entries_; }

  // Open tasks without any tag
  size_t untagged() const { return untagged_; }

  size_t count(const std::string& tag) const;

 private:
  std::map<std::string, Entry> entries_;
  size_t untagged_ = 0;
};

// Open tasks per label, in configured label order
using LabelIndex = std::vector<std::pair<std::string, size_t>>;

// Open task counts
struct Statistics {
  size_t total = 0;
  std::vector<size_t> by_priority;  // highest priority first, down to 0
};

// One row of the filtered tree, in display order
struct TreeRow {
  Task task;
  std::string document;
  int depth = 0;
};

TagIndex buildTagIndex(const Snapshot& snapshot, const TaskFilter& filter);

LabelIndex buildLabelIndex(const Snapshot& snapshot, const taskr::tasks::LabelMatcher& labels);

Statistics buildStatistics(const Snapshot& snapshot);

// Visible rows depth-first: top-level tasks grouped by document name,
// siblings by priority (highest first) then document order
std::vector<TreeRow> visibleTree(const Snapshot& snapshot,
                                 const std::unordered_set<TaskId>& visible);

}  // namespace taskr::query
