#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "taskr/common.hpp"
#include "taskr/tasks/task.hpp"

namespace taskr::store {

using taskr::tasks::DocumentId;
using taskr::tasks::Task;
using taskr::tasks::TaskForest;
using taskr::tasks::TaskId;

// Registered source document
struct DocumentRef {
  DocumentId id = 0;
  std::string name;
  std::filesystem::path path;
};

// Row counts of one replace
struct ReplaceStats {
  size_t removed = 0;
  size_t inserted = 0;
};

// Persistent task rows, grouped by source document
class TaskStore {
public:
  virtual ~TaskStore() = default;

  virtual Result<void> initialize() = 0;

  // Task rows
  virtual Result<ReplaceStats> replace(DocumentId document, const TaskForest& forest) = 0;
  virtual Result<bool> removeDocument(DocumentId document) = 0;
  virtual Result<std::vector<Task>> childrenOf(std::optional<TaskId> parent) = 0;
  virtual Result<std::optional<Task>> get(TaskId id) = 0;
  virtual Result<std::vector<Task>> allTasks() = 0;
  virtual Result<void> dropTasks() = 0;

  // Document registry
  virtual Result<DocumentId> registerDocument(const std::string& name,
                                              const std::filesystem::path& path) = 0;
  virtual Result<std::optional<DocumentRef>> document(DocumentId id) = 0;
  virtual Result<std::optional<DocumentRef>> findDocument(const std::string& name) = 0;
  virtual Result<std::vector<DocumentRef>> documents() = 0;
  virtual Result<void> forgetDocument(DocumentId id) = 0;

  // Key/value properties
  virtual Result<std::optional<std::string>> property(const std::string& key) = 0;
  virtual Result<void> setProperty(const std::string& key, const std::string& value) = 0;
  virtual Result<void> removeProperty(const std::string& key) = 0;

  virtual Result<bool> isHealthy() = 0;
};

// Store factory
class TaskStoreFactory {
public:
  static std::unique_ptr<TaskStore> createSqliteStore(const std::filesystem::path& db_path);
};

}  // namespace taskr::store
