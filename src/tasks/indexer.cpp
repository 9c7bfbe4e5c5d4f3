#include "taskr/tasks/indexer.hpp"

#include <set>

#include <spdlog/spdlog.h>

#include "taskr/util/filesystem.hpp"

namespace taskr::tasks {

namespace {

std::string stampOf(std::filesystem::file_time_type time) {
  return std::to_string(time.time_since_epoch().count());
}

}  // namespace

Indexer::Indexer(taskr::store::Notebook& notebook, TaskList& task_list)
    : notebook_(notebook), task_list_(task_list) {}

Result<IndexOutcome> Indexer::indexEntry(const taskr::store::DocumentEntry& entry) {
  auto document = notebook_.loadPath(entry.path);
  if (!document) {
    return std::unexpected(document.error());
  }

  auto outcome = task_list_.indexDocument(*document);
  if (!outcome) {
    return outcome;
  }
  if (!outcome->excluded) {
    if (auto result = task_list_.setDocumentStamp(entry.name, stampOf(entry.modified)); !result) {
      return std::unexpected(result.error());
    }
  }
  return outcome;
}

Result<IndexReport> Indexer::indexAll(bool full) {
  auto entries = notebook_.scan();
  if (!entries) {
    return std::unexpected(entries.error());
  }

  bool everything = full || task_list_.needsRebuild();
  IndexReport report;
  report.scanned = entries->size();

  std::set<std::string> present;
  for (const auto& entry : *entries) {
    present.insert(entry.name);

    if (!everything && task_list_.isIncluded(entry.name)) {
      auto stamp = task_list_.documentStamp(entry.name);
      if (!stamp) {
        return std::unexpected(stamp.error());
      }
      if (*stamp == stampOf(entry.modified)) {
        ++report.unchanged;
        continue;
      }
    }

    auto outcome = indexEntry(entry);
    if (!outcome) {
      if (outcome.error().code() == ErrorCode::kDatabaseError) {
        return std::unexpected(outcome.error());
      }
      spdlog::warn("Cannot index {}: {}", entry.name, outcome.error().toString());
      report.errors.push_back(entry.name + ": " + outcome.error().message());
      ++report.failed;
      continue;
    }

    if (outcome->excluded) {
      ++report.excluded;
    } else {
      ++report.indexed;
      report.tasks += outcome->tasks;
    }
  }

  auto documents = task_list_.documents();
  if (!documents) {
    return std::unexpected(documents.error());
  }
  for (const auto& document : *documents) {
    if (present.contains(document.name)) {
      continue;
    }
    spdlog::info("Document {} vanished, removing its tasks", document.name);
    auto removed = task_list_.removeDocument(document.name);
    if (!removed) {
      return std::unexpected(removed.error());
    }
    ++report.removed;
  }

  if (everything && report.failed == 0) {
    if (auto result = task_list_.markRebuilt(); !result) {
      return std::unexpected(result.error());
    }
  }
  spdlog::info("Indexed {} of {} documents, {} tasks", report.indexed, report.scanned, report.tasks);
  return report;
}

Result<IndexOutcome> Indexer::indexOne(const std::string& name_or_path) {
  std::filesystem::path path(name_or_path);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    auto found = notebook_.pathForName(name_or_path);
    if (!found) {
      return std::unexpected(makeError(ErrorCode::kNotFound,
                                       "Document not found: " + name_or_path));
    }
    path = *found;
  }
  path = std::filesystem::absolute(path, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid path " + name_or_path + ": " + ec.message()));
  }

  auto name = notebook_.nameForPath(path);
  if (!name) {
    return std::unexpected(name.error());
  }
  auto modified = taskr::util::FileSystem::lastModified(path);
  if (!modified) {
    return std::unexpected(modified.error());
  }
  return indexEntry(taskr::store::DocumentEntry{*name, path, *modified});
}

}  // namespace taskr::tasks
