#pragma once

#include <sqlite3.h>
#include <filesystem>
#include <mutex>

#include "taskr/store/task_store.hpp"

namespace taskr::store {

// SQLite implementation. One connection guarded by a mutex; every
// multi-statement write runs in its own transaction.
class SqliteTaskStore : public TaskStore {
public:
  explicit SqliteTaskStore(std::filesystem::path db_path);
  ~SqliteTaskStore() override;

  SqliteTaskStore(const SqliteTaskStore&) = delete;
  SqliteTaskStore& operator=(const SqliteTaskStore&) = delete;

  Result<void> initialize() override;

  // Delete the document's rows and insert forest depth-first. On failure
  // the previous rows are kept.
  Result<ReplaceStats> replace(DocumentId document, const TaskForest& forest) override;
  Result<bool> removeDocument(DocumentId document) override;
  Result<std::vector<Task>> childrenOf(std::optional<TaskId> parent) override;
  Result<std::optional<Task>> get(TaskId id) override;
  Result<std::vector<Task>> allTasks() override;
  Result<void> dropTasks() override;

  Result<DocumentId> registerDocument(const std::string& name,
                                      const std::filesystem::path& path) override;
  Result<std::optional<DocumentRef>> document(DocumentId id) override;
  Result<std::optional<DocumentRef>> findDocument(const std::string& name) override;
  Result<std::vector<DocumentRef>> documents() override;
  Result<void> forgetDocument(DocumentId id) override;

  Result<std::optional<std::string>> property(const std::string& key) override;
  Result<void> setProperty(const std::string& key, const std::string& value) override;
  Result<void> removeProperty(const std::string& key) override;

  Result<bool> isHealthy() override;

private:
  // Database management
  Result<void> configureDatabase();
  Result<void> createTables();

  // SQL statement preparation
  Result<void> prepareStatements();
  void finalizeStatements();

  // Transactions, caller holds db_mutex_
  Result<void> begin();
  Result<void> commit();
  void rollback();

  // Caller holds db_mutex_
  Result<void> deleteTasksOf(DocumentId document, int* deleted);
  Result<std::vector<Task>> readTasks(sqlite3_stmt* stmt, const std::string& operation);
  Result<std::vector<DocumentRef>> readDocuments(sqlite3_stmt* stmt, const std::string& operation);
  Result<void> requireOpen() const;

  // Error handling
  Error makeSqliteError(const std::string& operation);
  Result<void> checkSqliteResult(int result, const std::string& operation);

  std::filesystem::path db_path_;
  sqlite3* db_ = nullptr;
  std::mutex db_mutex_;

  // Prepared statements
  sqlite3_stmt* stmt_insert_task_ = nullptr;
  sqlite3_stmt* stmt_delete_tasks_ = nullptr;
  sqlite3_stmt* stmt_children_ = nullptr;
  sqlite3_stmt* stmt_get_task_ = nullptr;
  sqlite3_stmt* stmt_all_tasks_ = nullptr;
  sqlite3_stmt* stmt_upsert_document_ = nullptr;
  sqlite3_stmt* stmt_find_document_ = nullptr;
  sqlite3_stmt* stmt_get_document_ = nullptr;
  sqlite3_stmt* stmt_all_documents_ = nullptr;
  sqlite3_stmt* stmt_delete_document_ = nullptr;
  sqlite3_stmt* stmt_get_property_ = nullptr;
  sqlite3_stmt* stmt_set_property_ = nullptr;
  sqlite3_stmt* stmt_delete_property_ = nullptr;
};

}  // namespace taskr::store
