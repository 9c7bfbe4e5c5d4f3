#include "taskr/tasks/task_list.hpp"

#include <spdlog/spdlog.h>

#include "taskr/util/date.hpp"

namespace taskr::tasks {

namespace {

constexpr const char* kFormatKey = "tasklist_format";
constexpr const char* kPreferencesKey = "tasklist_preferences";
constexpr const char* kNeedsRebuildKey = "tasklist_needs_rebuild";

std::string stampKey(const std::string& name) {
  return "mtime:" + name;
}

bool inSubtree(const std::string& name, const std::string& subtree) {
  return name == subtree ||
         (name.size() > subtree.size() && name.compare(0, subtree.size(), subtree) == 0 &&
          name[subtree.size()] == ':');
}

}  // namespace

TaskList::TaskList(taskr::store::TaskStore& store, taskr::config::TaskListConfig config)
    : store_(store),
      config_(std::move(config)),
      extractor_(LabelMatcher::fromConfig(config_), config_.all_checkboxes) {}

Result<void> TaskList::initialize() {
  if (auto result = store_.initialize(); !result) {
    return result;
  }

  auto format = store_.property(kFormatKey);
  if (!format) {
    return std::unexpected(format.error());
  }
  auto preferences = store_.property(kPreferencesKey);
  if (!preferences) {
    return std::unexpected(preferences.error());
  }

  const std::string fingerprint = config_.rebuildFingerprint();
  bool fresh = !format->has_value() && !preferences->has_value();
  bool changed = !fresh && (*format != std::optional<std::string>(std::string(kTableFormat)) ||
                            *preferences != std::optional<std::string>(fingerprint));

  if (changed) {
    spdlog::info("Task list preferences or format changed, dropping stored tasks");
    if (auto result = store_.dropTasks(); !result) {
      return result;
    }
    if (auto result = store_.setProperty(kNeedsRebuildKey, "1"); !result) {
      return result;
    }
    notifyChanged();
  }

  if (fresh || changed) {
    if (auto result = store_.setProperty(kFormatKey, std::string(kTableFormat)); !result) {
      return result;
    }
    if (auto result = store_.setProperty(kPreferencesKey, fingerprint); !result) {
      return result;
    }
  }

  auto pending = store_.property(kNeedsRebuildKey);
  if (!pending) {
    return std::unexpected(pending.error());
  }
  needs_rebuild_ = pending->has_value();
  if (needs_rebuild_) {
    spdlog::debug("Task list waits for a full reindex");
  }
  return {};
}

Result<void> TaskList::markRebuilt() {
  if (!needs_rebuild_) {
    return {};
  }
  if (auto result = store_.removeProperty(kNeedsRebuildKey); !result) {
    return result;
  }
  needs_rebuild_ = false;
  return {};
}

bool TaskList::isIncluded(const std::string& name) const {
  if (!config_.included_subtrees.empty()) {
    bool included = false;
    for (const auto& subtree : config_.included_subtrees) {
      if (inSubtree(name, subtree)) {
        included = true;
        break;
      }
    }
    if (!included) {
      return false;
    }
  }

  for (const auto& subtree : config_.excluded_subtrees) {
    if (inSubtree(name, subtree)) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> TaskList::defaultDueFor(const taskr::core::Document& document) const {
  if (document.defaultDue()) {
    return document.defaultDue();
  }
  if (config_.deadline_by_page) {
    if (auto range = taskr::util::Date::rangeFromDocumentName(document.name())) {
      return taskr::util::Date::toIso(range->end);
    }
  }
  return std::nullopt;
}

Result<IndexOutcome> TaskList::indexDocument(const taskr::core::Document& document) {
  IndexOutcome outcome;

  if (!isIncluded(document.name())) {
    spdlog::debug("Skipping {}: outside the indexed subtrees", document.name());
    outcome.excluded = true;
    auto removed = removeDocument(document.name());
    if (!removed) {
      return std::unexpected(removed.error());
    }
    return outcome;
  }

  auto id = store_.registerDocument(document.name(), document.path());
  if (!id) {
    return std::unexpected(id.error());
  }
  outcome.document = *id;

  TaskForest forest = extractor_.extract(document.tree(), defaultDueFor(document));

  auto stats = store_.replace(*id, forest);
  if (!stats) {
    return std::unexpected(stats.error());
  }
  outcome.tasks = stats->inserted;

  spdlog::debug("Indexed {} tasks for {}", outcome.tasks, document.name());
  if (stats->removed > 0 || stats->inserted > 0) {
    notifyChanged();
  }
  return outcome;
}

Result<bool> TaskList::removeDocument(const std::string& name) {
  auto ref = store_.findDocument(name);
  if (!ref) {
    return std::unexpected(ref.error());
  }
  if (!ref->has_value()) {
    return false;
  }

  auto removed = store_.removeDocument((*ref)->id);
  if (!removed) {
    return std::unexpected(removed.error());
  }
  if (auto result = store_.forgetDocument((*ref)->id); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = store_.removeProperty(stampKey(name)); !result) {
    return std::unexpected(result.error());
  }

  if (*removed) {
    spdlog::debug("Removed tasks of {}", name);
    notifyChanged();
  }
  return *removed;
}

Result<std::vector<Task>> TaskList::listTasks(std::optional<TaskId> parent) {
  return store_.childrenOf(parent);
}

Result<std::optional<Task>> TaskList::getTask(TaskId id) {
  return store_.get(id);
}

Result<std::optional<taskr::store::DocumentRef>> TaskList::documentOf(const Task& task) {
  return store_.document(task.source);
}

Result<std::vector<Task>> TaskList::allTasks() {
  return store_.allTasks();
}

Result<std::vector<taskr::store::DocumentRef>> TaskList::documents() {
  return store_.documents();
}

Result<std::optional<std::string>> TaskList::documentStamp(const std::string& name) {
  return store_.property(stampKey(name));
}

Result<void> TaskList::setDocumentStamp(const std::string& name, const std::string& stamp) {
  return store_.setProperty(stampKey(name), stamp);
}

void TaskList::subscribe(ChangeListener listener) {
  listeners_.push_back(std::move(listener));
}

void TaskList::notifyChanged() {
  for (const auto& listener : listeners_) {
    listener();
  }
}

}  // namespace taskr::tasks
