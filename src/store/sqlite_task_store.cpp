#include "taskr/store/sqlite_task_store.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace taskr::store {

using taskr::tasks::TaskNode;

// SQL schemas and queries
namespace sql {

constexpr const char* kCreateDocumentsTable = R"(
CREATE TABLE IF NOT EXISTS documents (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  name TEXT NOT NULL UNIQUE,
  path TEXT NOT NULL
)
)";

constexpr const char* kCreateTasklistTable = R"(
CREATE TABLE IF NOT EXISTS tasklist (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  source INTEGER NOT NULL,
  parent INTEGER NOT NULL DEFAULT 0,
  haschildren BOOLEAN NOT NULL DEFAULT 0,
  open BOOLEAN NOT NULL,
  actionable BOOLEAN NOT NULL,
  prio INTEGER NOT NULL DEFAULT 0,
  due TEXT NOT NULL,
  description TEXT NOT NULL
)
)";

constexpr const char* kCreatePropertiesTable = R"(
CREATE TABLE IF NOT EXISTS properties (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
)
)";

constexpr const char* kCreateIndexes = R"(
CREATE INDEX IF NOT EXISTS idx_tasklist_source ON tasklist(source);
CREATE INDEX IF NOT EXISTS idx_tasklist_parent ON tasklist(parent);
)";

constexpr const char* kPragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA synchronous = NORMAL;
PRAGMA temp_store = MEMORY;
)";

constexpr const char* kTaskColumns =
    "id, source, parent, haschildren, open, actionable, prio, due, description";

}  // namespace sql

namespace {

std::string columnText(sqlite3_stmt* stmt, int column) {
  const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
  return text ? std::string(text) : std::string();
}

Task taskFromRow(sqlite3_stmt* stmt) {
  Task task;
  task.id = sqlite3_column_int64(stmt, 0);
  task.source = sqlite3_column_int64(stmt, 1);
  task.parent = sqlite3_column_int64(stmt, 2);
  task.has_children = sqlite3_column_int(stmt, 3) != 0;
  task.open = sqlite3_column_int(stmt, 4) != 0;
  task.actionable = sqlite3_column_int(stmt, 5) != 0;
  task.priority = sqlite3_column_int(stmt, 6);
  task.due = columnText(stmt, 7);
  task.description = columnText(stmt, 8);
  return task;
}

DocumentRef documentFromRow(sqlite3_stmt* stmt) {
  DocumentRef ref;
  ref.id = sqlite3_column_int64(stmt, 0);
  ref.name = columnText(stmt, 1);
  ref.path = columnText(stmt, 2);
  return ref;
}

Error notInitialized() {
  return makeError(ErrorCode::kInvalidState, "Task store is not initialized");
}

}  // namespace

SqliteTaskStore::SqliteTaskStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
}

SqliteTaskStore::~SqliteTaskStore() {
  finalizeStatements();
  if (db_) {
    sqlite3_close(db_);
  }
}

Result<void> SqliteTaskStore::initialize() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (db_) {
    return {};
  }

  // Ensure parent directory exists
  auto parent = db_path_.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Failed to create index directory: " + ec.message()));
    }
  }

  int result = sqlite3_open(db_path_.c_str(), &db_);
  if (result != SQLITE_OK) {
    auto error = makeSqliteError("Failed to open database");
    sqlite3_close(db_);
    db_ = nullptr;
    return std::unexpected(error);
  }

  auto setup = configureDatabase()
                   .and_then([this] { return createTables(); })
                   .and_then([this] { return prepareStatements(); });
  if (!setup) {
    finalizeStatements();
    sqlite3_close(db_);
    db_ = nullptr;
    return setup;
  }

  spdlog::debug("Opened task store {}", db_path_.string());
  return {};
}

Result<void> SqliteTaskStore::configureDatabase() {
  return checkSqliteResult(sqlite3_exec(db_, sql::kPragmas, nullptr, nullptr, nullptr),
                           "Configure database pragmas");
}

Result<void> SqliteTaskStore::createTables() {
  const char* schemas[] = {
    sql::kCreateDocumentsTable,
    sql::kCreateTasklistTable,
    sql::kCreatePropertiesTable,
    sql::kCreateIndexes
  };

  for (const char* schema : schemas) {
    auto result = checkSqliteResult(
        sqlite3_exec(db_, schema, nullptr, nullptr, nullptr),
        "Create database schema");
    if (!result.has_value()) {
      return result;
    }
  }

  return {};
}

Result<void> SqliteTaskStore::prepareStatements() {
  struct Statement {
    std::string sql;
    sqlite3_stmt** stmt;
  };

  const std::string columns = sql::kTaskColumns;
  Statement statements[] = {
    {
      R"(INSERT INTO tasklist
         (source, parent, haschildren, open, actionable, prio, due, description)
         VALUES (?, ?, ?, ?, ?, ?, ?, ?))",
      &stmt_insert_task_
    },
    {"DELETE FROM tasklist WHERE source = ?", &stmt_delete_tasks_},
    {"SELECT " + columns + " FROM tasklist WHERE parent = ? ORDER BY id", &stmt_children_},
    {"SELECT " + columns + " FROM tasklist WHERE id = ?", &stmt_get_task_},
    {"SELECT " + columns + " FROM tasklist ORDER BY id", &stmt_all_tasks_},
    {
      R"(INSERT INTO documents (name, path) VALUES (?, ?)
         ON CONFLICT(name) DO UPDATE SET path = excluded.path)",
      &stmt_upsert_document_
    },
    {"SELECT id, name, path FROM documents WHERE name = ?", &stmt_find_document_},
    {"SELECT id, name, path FROM documents WHERE id = ?", &stmt_get_document_},
    {"SELECT id, name, path FROM documents ORDER BY name", &stmt_all_documents_},
    {"DELETE FROM documents WHERE id = ?", &stmt_delete_document_},
    {"SELECT value FROM properties WHERE key = ?", &stmt_get_property_},
    {"INSERT OR REPLACE INTO properties (key, value) VALUES (?, ?)", &stmt_set_property_},
    {"DELETE FROM properties WHERE key = ?", &stmt_delete_property_}
  };

  for (const auto& stmt_def : statements) {
    int result = sqlite3_prepare_v2(db_, stmt_def.sql.c_str(), -1, stmt_def.stmt, nullptr);
    if (result != SQLITE_OK) {
      return std::unexpected(makeSqliteError("Failed to prepare statement"));
    }
  }

  return {};
}

void SqliteTaskStore::finalizeStatements() {
  sqlite3_stmt** statements[] = {
    &stmt_insert_task_, &stmt_delete_tasks_, &stmt_children_, &stmt_get_task_,
    &stmt_all_tasks_, &stmt_upsert_document_, &stmt_find_document_,
    &stmt_get_document_, &stmt_all_documents_, &stmt_delete_document_,
    &stmt_get_property_, &stmt_set_property_, &stmt_delete_property_
  };

  for (auto stmt : statements) {
    if (*stmt) {
      sqlite3_finalize(*stmt);
      *stmt = nullptr;
    }
  }
}

Result<void> SqliteTaskStore::requireOpen() const {
  if (!db_) {
    return std::unexpected(notInitialized());
  }
  return {};
}

Result<void> SqliteTaskStore::begin() {
  return checkSqliteResult(sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr),
                           "Begin transaction");
}

Result<void> SqliteTaskStore::commit() {
  return checkSqliteResult(sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr),
                           "Commit transaction");
}

void SqliteTaskStore::rollback() {
  if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
    spdlog::error("Rollback failed: {}", sqlite3_errmsg(db_));
  }
}

Result<void> SqliteTaskStore::deleteTasksOf(DocumentId document, int* deleted) {
  sqlite3_reset(stmt_delete_tasks_);
  sqlite3_bind_int64(stmt_delete_tasks_, 1, document);
  if (sqlite3_step(stmt_delete_tasks_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to delete tasks"));
  }
  if (deleted) {
    *deleted = sqlite3_changes(db_);
  }
  return {};
}

Result<ReplaceStats> SqliteTaskStore::replace(DocumentId document, const TaskForest& forest) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (auto open = requireOpen(); !open) {
    return std::unexpected(open.error());
  }
  if (auto result = begin(); !result) {
    return std::unexpected(result.error());
  }

  auto insert = [&]() -> Result<ReplaceStats> {
    int deleted = 0;
    if (auto result = deleteTasksOf(document, &deleted); !result) {
      return std::unexpected(result.error());
    }
    ReplaceStats stats;
    stats.removed = static_cast<size_t>(deleted);

    // Depth-first, siblings in order, so ids follow document order
    std::vector<std::pair<const TaskNode*, TaskId>> pending;
    for (auto it = forest.rbegin(); it != forest.rend(); ++it) {
      pending.emplace_back(&*it, taskr::tasks::kNoParent);
    }

    while (!pending.empty()) {
      auto [node, parent] = pending.back();
      pending.pop_back();

      const auto& fields = node->fields;
      sqlite3_reset(stmt_insert_task_);
      sqlite3_bind_int64(stmt_insert_task_, 1, document);
      sqlite3_bind_int64(stmt_insert_task_, 2, parent);
      sqlite3_bind_int(stmt_insert_task_, 3, node->children.empty() ? 0 : 1);
      sqlite3_bind_int(stmt_insert_task_, 4, fields.open ? 1 : 0);
      sqlite3_bind_int(stmt_insert_task_, 5, fields.actionable ? 1 : 0);
      sqlite3_bind_int(stmt_insert_task_, 6, fields.priority);
      sqlite3_bind_text(stmt_insert_task_, 7, fields.due.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_text(stmt_insert_task_, 8, fields.description.c_str(), -1, SQLITE_TRANSIENT);
      if (sqlite3_step(stmt_insert_task_) != SQLITE_DONE) {
        return std::unexpected(makeSqliteError("Failed to insert task"));
      }
      ++stats.inserted;

      TaskId id = sqlite3_last_insert_rowid(db_);
      for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
        pending.emplace_back(&*it, id);
      }
    }
    return stats;
  };

  auto stats = insert();
  if (!stats) {
    rollback();
    return stats;
  }
  if (auto result = commit(); !result) {
    rollback();
    return std::unexpected(result.error());
  }
  return stats;
}

Result<bool> SqliteTaskStore::removeDocument(DocumentId document) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (auto open = requireOpen(); !open) {
    return std::unexpected(open.error());
  }

  int deleted = 0;
  if (auto result = deleteTasksOf(document, &deleted); !result) {
    return std::unexpected(result.error());
  }
  return deleted > 0;
}

Result<std::vector<Task>> SqliteTaskStore::readTasks(sqlite3_stmt* stmt,
                                                     const std::string& operation) {
  std::vector<Task> tasks;
  while (true) {
    int result = sqlite3_step(stmt);
    if (result == SQLITE_DONE) {
      break;
    } else if (result != SQLITE_ROW) {
      return std::unexpected(makeSqliteError(operation));
    }
    tasks.push_back(taskFromRow(stmt));
  }
  return tasks;
}

Result<std::vector<DocumentRef>> SqliteTaskStore::readDocuments(sqlite3_stmt* stmt,
                                                                const std::string& operation) {
  std::vector<DocumentRef> refs;
  while (true) {
    int result = sqlite3_step(stmt);
    if (result == SQLITE_DONE) {
      break;
    } else if (result != SQLITE_ROW) {
      return std::unexpected(makeSqliteError(operation));
    }
    refs.push_back(documentFromRow(stmt));
  }
  return refs;
}

Result<std::vector<Task>> SqliteTaskStore::childrenOf(std::optional<TaskId> parent) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!db_) {
    return std::vector<Task>{};
  }

  sqlite3_reset(stmt_children_);
  sqlite3_bind_int64(stmt_children_, 1, parent.value_or(taskr::tasks::kNoParent));
  return readTasks(stmt_children_, "Children query failed");
}

Result<std::optional<Task>> SqliteTaskStore::get(TaskId id) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!db_) {
    return std::optional<Task>{};
  }

  sqlite3_reset(stmt_get_task_);
  sqlite3_bind_int64(stmt_get_task_, 1, id);
  auto tasks = readTasks(stmt_get_task_, "Task query failed");
  if (!tasks) {
    return std::unexpected(tasks.error());
  }
  if (tasks->empty()) {
    return std::optional<Task>{};
  }
  return std::optional<Task>{std::move(tasks->front())};
}

Result<std::vector<Task>> SqliteTaskStore::allTasks() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!db_) {
    return std::vector<Task>{};
  }

  sqlite3_reset(stmt_all_tasks_);
  return readTasks(stmt_all_tasks_, "Task listing failed");
}

Result<void> SqliteTaskStore::dropTasks() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (auto open = requireOpen(); !open) {
    return open;
  }
  return checkSqliteResult(sqlite3_exec(db_, "DELETE FROM tasklist", nullptr, nullptr, nullptr),
                           "Drop tasks");
}

Result<DocumentId> SqliteTaskStore::registerDocument(const std::string& name,
                                                     const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (auto open = requireOpen(); !open) {
    return std::unexpected(open.error());
  }

  sqlite3_reset(stmt_upsert_document_);
  sqlite3_bind_text(stmt_upsert_document_, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt_upsert_document_, 2, path.string().c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt_upsert_document_) != SQLITE_DONE) {
    return std::unexpected(makeSqliteError("Failed to register document"));
  }

  sqlite3_reset(stmt_find_document_);
  sqlite3_bind_text(stmt_find_document_, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  auto refs = readDocuments(stmt_find_document_, "Document lookup failed");
  if (!refs) {
    return std::unexpected(refs.error());
  }
  if (refs->empty()) {
    return std::unexpected(makeError(ErrorCode::kDatabaseError,
                                     "Document vanished after registration: " + name));
  }
  return refs->front().id;
}

Result<std::optional<DocumentRef>> SqliteTaskStore::document(DocumentId id) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!db_) {
    return std::optional<DocumentRef>{};
  }

  sqlite3_reset(stmt_get_document_);
  sqlite3_bind_int64(stmt_get_document_, 1, id);
  auto refs = readDocuments(stmt_get_document_, "Document query failed");
  if (!refs) {
    return std::unexpected(refs.error());
  }
  if (refs->empty()) {
    return std::optional<DocumentRef>{};
  }
  return std::optional<DocumentRef>{std::move(refs->front())};
}

Result<std::optional<DocumentRef>> SqliteTaskStore::findDocument(const std::string& name) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!db_) {
    return std::optional<DocumentRef>{};
  }

  sqlite3_reset(stmt_find_document_);
  sqlite3_bind_text(stmt_find_document_, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  auto refs = readDocuments(stmt_find_document_, "Document lookup failed");
  if (!refs) {
    return std::unexpected(refs.error());
  }
  if (refs->empty()) {
    return std::optional<DocumentRef>{};
  }
  return std::optional<DocumentRef>{std::move(refs->front())};
}

Result<std::vector<DocumentRef>> SqliteTaskStore::documents() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!db_) {
    return std::vector<DocumentRef>{};
  }

  sqlite3_reset(stmt_all_documents_);
  return readDocuments(stmt_all_documents_, "Document listing failed");
}

Result<void> SqliteTaskStore::forgetDocument(DocumentId id) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (auto open = requireOpen(); !open) {
    return open;
  }
  if (auto result = begin(); !result) {
    return result;
  }

  auto result = deleteTasksOf(id, nullptr).and_then([&]() -> Result<void> {
    sqlite3_reset(stmt_delete_document_);
    sqlite3_bind_int64(stmt_delete_document_, 1, id);
    if (sqlite3_step(stmt_delete_document_) != SQLITE_DONE) {
      return std::unexpected(makeSqliteError("Failed to delete document"));
    }
    return {};
  });
  if (!result) {
    rollback();
    return result;
  }
  if (auto committed = commit(); !committed) {
    rollback();
    return committed;
  }
  return {};
}

Result<std::optional<std::string>> SqliteTaskStore::property(const std::string& key) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!db_) {
    return std::optional<std::string>{};
  }

  sqlite3_reset(stmt_get_property_);
  sqlite3_bind_text(stmt_get_property_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  int result = sqlite3_step(stmt_get_property_);
  if (result == SQLITE_DONE) {
    return std::optional<std::string>{};
  }
  if (result != SQLITE_ROW) {
    return std::unexpected(makeSqliteError("Property query failed"));
  }
  std::string value = columnText(stmt_get_property_, 0);
  sqlite3_reset(stmt_get_property_);
  return std::optional<std::string>{std::move(value)};
}

Result<void> SqliteTaskStore::setProperty(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (auto open = requireOpen(); !open) {
    return open;
  }

  sqlite3_reset(stmt_set_property_);
  sqlite3_bind_text(stmt_set_property_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt_set_property_, 2, value.c_str(), -1, SQLITE_TRANSIENT);
  return checkSqliteResult(sqlite3_step(stmt_set_property_), "Failed to set property");
}

Result<void> SqliteTaskStore::removeProperty(const std::string& key) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (auto open = requireOpen(); !open) {
    return open;
  }

  sqlite3_reset(stmt_delete_property_);
  sqlite3_bind_text(stmt_delete_property_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  return checkSqliteResult(sqlite3_step(stmt_delete_property_), "Failed to remove property");
}

Result<bool> SqliteTaskStore::isHealthy() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  if (!db_) {
    return false;
  }

  // Simple health check - execute a basic query
  sqlite3_stmt* stmt;
  int result = sqlite3_prepare_v2(db_, "SELECT 1", -1, &stmt, nullptr);
  if (result != SQLITE_OK) {
    return false;
  }

  result = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  return result == SQLITE_ROW;
}

Error SqliteTaskStore::makeSqliteError(const std::string& operation) {
  std::string message = operation;
  if (db_) {
    message += ": " + std::string(sqlite3_errmsg(db_));
  }
  spdlog::error("Task store: {}", message);
  return makeError(ErrorCode::kDatabaseError, message);
}

Result<void> SqliteTaskStore::checkSqliteResult(int result, const std::string& operation) {
  if (result == SQLITE_OK || result == SQLITE_DONE || result == SQLITE_ROW) {
    return {};
  }
  return std::unexpected(makeSqliteError(operation));
}

std::unique_ptr<TaskStore> TaskStoreFactory::createSqliteStore(const std::filesystem::path& db_path) {
  return std::make_unique<SqliteTaskStore>(db_path);
}

}  // namespace taskr::store
