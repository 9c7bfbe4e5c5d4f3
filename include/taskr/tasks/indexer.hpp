#pragma once

#include <string>
#include <vector>

#include "taskr/common.hpp"
#include "taskr/store/notebook.hpp"
#include "taskr/tasks/task_list.hpp"

namespace taskr::tasks {

// Summary of a notebook index run
struct IndexReport {
  size_t scanned = 0;     // documents found on disk
  size_t indexed = 0;     // documents parsed and stored
  size_t unchanged = 0;   // skipped, modification time as recorded
  size_t excluded = 0;    // outside the indexed subtrees
  size_t removed = 0;     // vanished from disk
  size_t failed = 0;      // could not be read or parsed
  size_t tasks = 0;       // tasks stored by this run
  std::vector<std::string> errors;
};

// Feeds notebook documents to the task list
class Indexer {
 public:
  Indexer(taskr::store::Notebook& notebook, TaskList& task_list);

  // Index every document. Documents whose modification time did not
  // change are skipped unless full is set or the task list needs a rebuild.
  // Unreadable documents are reported, not fatal.
  Result<IndexReport> indexAll(bool full);

  // Index a single document given by page name or file path
  Result<IndexOutcome> indexOne(const std::string& name_or_path);

 private:
  Result<IndexOutcome> indexEntry(const taskr::store::DocumentEntry& entry);

  taskr::store::Notebook& notebook_;
  TaskList& task_list_;
};

}  // namespace taskr::tasks
