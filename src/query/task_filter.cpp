#include "taskr/query/task_filter.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

#include "taskr/tasks/task_list.hpp"

namespace taskr::query {

using taskr::tasks::toLower;

namespace {

std::string trim(std::string_view text) {
  size_t start = text.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return {};
  }
  size_t end = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(start, end - start + 1));
}

std::vector<std::string> lowered(const std::vector<std::string>& values) {
  std::vector<std::string> result;
  result.reserve(values.size());
  for (const auto& value : values) {
    result.push_back(toLower(value));
  }
  return result;
}

}  // namespace

std::optional<TextFilter> parseTextFilter(std::string_view text) {
  std::string value = trim(text);
  if (value.empty()) {
    return std::nullopt;
  }

  TextFilter filter;
  std::string lower = toLower(value);
  if (lower.starts_with("not ")) {
    filter.negated = true;
    lower = trim(std::string_view(lower).substr(4));
    if (lower.empty()) {
      return std::nullopt;
    }
  }
  filter.needle = std::move(lower);
  return filter;
}

const std::string& Snapshot::documentName(const Task& task) const {
  static const std::string kUnknown;
  auto it = document_names.find(task.source);
  return it == document_names.end() ? kUnknown : it->second;
}

Snapshot Snapshot::fromRows(std::vector<Task> rows,
                            std::unordered_map<DocumentId, std::string> document_names) {
  std::unordered_map<TaskId, const Task*> by_id;
  for (const auto& row : rows) {
    by_id.emplace(row.id, &row);
  }

  // 1 = live, 0 = stale
  std::unordered_map<TaskId, int> state;
  auto live = [&](const Task& row) {
    std::vector<const Task*> chain;
    const Task* current = &row;
    int result = 1;
    while (true) {
      if (auto known = state.find(current->id); known != state.end()) {
        result = known->second;
        break;
      }
      if (!document_names.contains(current->source)) {
        result = 0;
        break;
      }
      chain.push_back(current);
      if (current->parent == taskr::tasks::kNoParent) {
        break;
      }
      auto parent = by_id.find(current->parent);
      if (parent == by_id.end() || chain.size() > rows.size()) {
        result = 0;
        break;
      }
      current = parent->second;
    }
    for (const Task* visited : chain) {
      state[visited->id] = result;
    }
    state[current->id] = result;
    return result == 1;
  };

  Snapshot snapshot;
  for (const auto& row : rows) {
    if (live(row)) {
      snapshot.tasks.push_back(row);
    } else {
      spdlog::debug("Ignoring task {}: source document {} is unknown", row.id, row.source);
    }
  }
  snapshot.document_names = std::move(document_names);
  return snapshot;
}

Result<Snapshot> takeSnapshot(taskr::tasks::TaskList& task_list) {
  auto rows = task_list.allTasks();
  if (!rows) {
    return std::unexpected(rows.error());
  }
  auto documents = task_list.documents();
  if (!documents) {
    return std::unexpected(documents.error());
  }

  std::unordered_map<DocumentId, std::string> names;
  for (auto& document : *documents) {
    names.emplace(document.id, std::move(document.name));
  }
  return Snapshot::fromRows(std::move(*rows), std::move(names));
}

TaskFilter::TaskFilter(const taskr::tasks::LabelMatcher& labels, bool tag_by_page)
    : labels_(labels), tag_by_page_(tag_by_page) {}

std::vector<std::string> TaskFilter::tagsOf(const Task& task,
                                            const std::string& document_name) const {
  std::vector<std::string> tags = taskr::tasks::extractTags(task.description);
  if (tag_by_page_ && !document_name.empty()) {
    size_t start = 0;
    while (true) {
      size_t colon = document_name.find(':', start);
      std::string part = document_name.substr(
          start, colon == std::string::npos ? std::string::npos : colon - start);
      if (!part.empty()) {
        tags.push_back(std::move(part));
      }
      if (colon == std::string::npos) {
        break;
      }
      start = colon + 1;
    }
  }
  return tags;
}

bool TaskFilter::matches(const Task& task, const std::string& document_name,
                         const FilterCriteria& criteria) const {
  if (!task.open || (criteria.actionable_only && !task.actionable)) {
    return false;
  }

  if (criteria.labels && !criteria.labels->empty()) {
    auto label = labels_.match(task.description);
    if (!label) {
      return false;
    }
    auto wanted = lowered(*criteria.labels);
    if (std::find(wanted.begin(), wanted.end(), toLower(*label)) == wanted.end()) {
      return false;
    }
  }

  if (criteria.tags && !criteria.tags->empty()) {
    auto wanted = lowered(*criteria.tags);
    auto tags = lowered(tagsOf(task, document_name));
    bool untagged_wanted =
        std::find(wanted.begin(), wanted.end(), std::string(kNoTags)) != wanted.end();
    bool any = std::any_of(tags.begin(), tags.end(), [&](const std::string& tag) {
      return std::find(wanted.begin(), wanted.end(), tag) != wanted.end();
    });
    if (!(any || (untagged_wanted && tags.empty()))) {
      return false;
    }
  }

  if (criteria.text) {
    bool found = toLower(task.description).find(criteria.text->needle) != std::string::npos ||
                 toLower(document_name).find(criteria.text->needle) != std::string::npos;
    if (found == criteria.text->negated) {
      return false;
    }
  }

  return true;
}

std::unordered_set<TaskId> TaskFilter::visibleIds(const Snapshot& snapshot,
                                                  const FilterCriteria& criteria) const {
  spdlog::debug("Filtering with labels: [{}] tags: [{}] text: '{}'{}",
                fmt::join(criteria.labels.value_or(std::vector<std::string>{}), ", "),
                fmt::join(criteria.tags.value_or(std::vector<std::string>{}), ", "),
                criteria.text ? criteria.text->needle : std::string(),
                criteria.actionable_only ? " actionable only" : "");

  std::unordered_map<TaskId, TaskId> parents;
  for (const auto& task : snapshot.tasks) {
    parents.emplace(task.id, task.parent);
  }

  std::unordered_set<TaskId> visible;
  for (const auto& task : snapshot.tasks) {
    if (!matches(task, snapshot.documentName(task), criteria)) {
      continue;
    }
    visible.insert(task.id);

    // Walk up until the root or an ancestor that is already visible
    TaskId parent = task.parent;
    size_t steps = 0;
    while (parent != taskr::tasks::kNoParent && steps++ < parents.size()) {
      if (!visible.insert(parent).second) {
        break;
      }
      auto it = parents.find(parent);
      if (it == parents.end()) {
        break;
      }
      parent = it->second;
    }
  }
  return visible;
}

}  // namespace taskr::query
