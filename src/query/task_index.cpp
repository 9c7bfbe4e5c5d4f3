#include "taskr/query/task_index.hpp"

#include <algorithm>
#include <unordered_map>

namespace taskr::query {

void TagIndex::add(const std::vector<std::string>& tags) {
  if (tags.empty()) {
    ++untagged_;
    return;
  }
  for (const auto& tag : tags) {
    auto& entry = entries_[taskr::tasks::toLower(tag)];
    if (entry.display.empty()) {
      entry.display = tag;
    }
    ++entry.count;
  }
}

size_t TagIndex::count(const std::string& tag) const {
  auto it = entries_.find(taskr::tasks::toLower(tag));
  return it == entries_.end() ? 0 : it->second.count;
}

TagIndex buildTagIndex(const Snapshot& snapshot, const TaskFilter& filter) {
  TagIndex index;
  for (const auto& task : snapshot.tasks) {
    if (task.open) {
      index.add(filter.tagsOf(task, snapshot.documentName(task)));
    }
  }
  return index;
}

LabelIndex buildLabelIndex(const Snapshot& snapshot, const taskr::tasks::LabelMatcher& labels) {
  std::unordered_map<std::string, size_t> counts;
  for (const auto& task : snapshot.tasks) {
    if (!task.open) {
      continue;
    }
    if (auto label = labels.match(task.description)) {
      ++counts[*label];
    }
  }

  LabelIndex index;
  for (const auto& label : labels.labels()) {
    if (label == labels.nextLabel()) {
      continue;
    }
    auto it = counts.find(label);
    if (it != counts.end()) {
      index.emplace_back(label, it->second);
    }
  }
  return index;
}

Statistics buildStatistics(const Snapshot& snapshot) {
  std::map<int, size_t> by_priority;
  Statistics stats;
  for (const auto& task : snapshot.tasks) {
    if (task.open) {
      ++stats.total;
      ++by_priority[task.priority];
    }
  }

  if (!by_priority.empty()) {
    int highest = std::max(0, by_priority.rbegin()->first);
    for (int priority = highest; priority >= 0; --priority) {
      auto it = by_priority.find(priority);
      stats.by_priority.push_back(it == by_priority.end() ? 0 : it->second);
    }
  }
  return stats;
}

std::vector<TreeRow> visibleTree(const Snapshot& snapshot,
                                 const std::unordered_set<TaskId>& visible) {
  // Children in document order, tasks are stored depth-first
  std::unordered_map<TaskId, std::vector<const Task*>> children;
  std::vector<const Task*> roots;
  for (const auto& task : snapshot.tasks) {
    if (!visible.contains(task.id)) {
      continue;
    }
    if (task.parent == taskr::tasks::kNoParent) {
      roots.push_back(&task);
    } else {
      children[task.parent].push_back(&task);
    }
  }

  auto by_priority = [](const Task* a, const Task* b) {
    if (a->priority != b->priority) {
      return a->priority > b->priority;
    }
    return a->id < b->id;
  };

  std::stable_sort(roots.begin(), roots.end(), [&](const Task* a, const Task* b) {
    const auto& name_a = snapshot.documentName(*a);
    const auto& name_b = snapshot.documentName(*b);
    if (name_a != name_b) {
      return name_a < name_b;
    }
    return by_priority(a, b);
  });

  std::vector<TreeRow> rows;
  std::vector<std::pair<const Task*, int>> pending;
  for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
    pending.emplace_back(*it, 0);
  }

  while (!pending.empty()) {
    auto [task, depth] = pending.back();
    pending.pop_back();
    rows.push_back(TreeRow{*task, snapshot.documentName(*task), depth});

    auto it = children.find(task->id);
    if (it == children.end()) {
      continue;
    }
    auto& kids = it->second;
    std::sort(kids.begin(), kids.end(), by_priority);
    for (auto kid = kids.rbegin(); kid != kids.rend(); ++kid) {
      pending.emplace_back(*kid, depth + 1);
    }
  }
  return rows;
}

}  // namespace taskr::query
