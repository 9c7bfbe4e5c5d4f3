#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "taskr/common.hpp"
#include "taskr/config/config.hpp"
#include "taskr/core/document.hpp"
#include "taskr/store/task_store.hpp"
#include "taskr/tasks/labels.hpp"
#include "taskr/tasks/task.hpp"
#include "taskr/tasks/task_extractor.hpp"

namespace taskr::tasks {

// Version of the stored row layout
inline constexpr std::string_view kTableFormat = "0.5";

// What indexing one document did
struct IndexOutcome {
  DocumentId document = 0;   // 0 when the document is outside the indexed subtrees
  size_t tasks = 0;
  bool excluded = false;
};

/**
 * @brief Keeps the task store in sync with the notebook
 *
 * Receives "document indexed" and "document removed" triggers, runs the
 * extractor and replaces the document's rows. Listeners are told about
 * every change of the stored rows.
 */
class TaskList {
 public:
  using ChangeListener = std::function<void()>;

  TaskList(taskr::store::TaskStore& store, taskr::config::TaskListConfig config);

  /**
   * @brief Open the store and check the stored format and preferences.
   *
   * When the preferences that influence extraction changed since the rows
   * were written, all rows are dropped and needsRebuild() turns true. The
   * pending rebuild is recorded in the store, so it survives until a full
   * pass clears it with markRebuilt().
   */
  Result<void> initialize();

  // True when every document has to be indexed again
  bool needsRebuild() const { return needs_rebuild_; }
  Result<void> markRebuilt();

  const taskr::config::TaskListConfig& config() const { return config_; }
  const LabelMatcher& labels() const { return extractor_.labels(); }

  // Document name inside included_subtrees and outside excluded_subtrees
  bool isIncluded(const std::string& name) const;

  // Default due date of every task in the document
  std::optional<std::string> defaultDueFor(const taskr::core::Document& document) const;

  // Extract the tasks of a (re)indexed document and replace its rows
  Result<IndexOutcome> indexDocument(const taskr::core::Document& document);

  // Forget a document. Returns false when it had no rows.
  Result<bool> removeDocument(const std::string& name);

  // Queries
  Result<std::vector<Task>> listTasks(std::optional<TaskId> parent = std::nullopt);
  Result<std::optional<Task>> getTask(TaskId id);
  Result<std::optional<taskr::store::DocumentRef>> documentOf(const Task& task);
  Result<std::vector<Task>> allTasks();
  Result<std::vector<taskr::store::DocumentRef>> documents();

  // Modification stamp recorded for incremental indexing
  Result<std::optional<std::string>> documentStamp(const std::string& name);
  Result<void> setDocumentStamp(const std::string& name, const std::string& stamp);

  void subscribe(ChangeListener listener);

 private:
  void notifyChanged();

  taskr::store::TaskStore& store_;
  taskr::config::TaskListConfig config_;
  TaskExtractor extractor_;
  std::vector<ChangeListener> listeners_;
  bool needs_rebuild_ = false;
};

}  // namespace taskr::tasks
