#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "taskr/common.hpp"

namespace taskr::config {

// Preferences of the task extractor ([tasklist] table)
struct TaskListConfig {
  bool all_checkboxes = true;            // Consider all checkboxes as tasks
  bool tag_by_page = false;              // Turn document name parts into tags
  bool deadline_by_page = false;         // Implicit due date on calendar pages
  bool use_workweek = true;              // Skip the weekend for "soon" highlighting
  std::vector<std::string> labels = {"FIXME", "TODO"};
  std::string next_label = "Next:";      // Empty disables the next-item convention
  std::vector<std::string> included_subtrees;  // Empty means everything
  std::vector<std::string> excluded_subtrees;

  // Serialized form of the preferences that change extraction results.
  // A stored index built with another fingerprint must be rebuilt.
  std::string rebuildFingerprint() const;
};

// Configuration for taskr application
class Config {
 public:
  // Defaults based on XDG directories, no file is read
  Config();

  // Core paths
  std::filesystem::path notes_dir;
  std::filesystem::path index_file;
  std::filesystem::path log_dir;

  // Console log level (trace, debug, info, warn, error, off)
  std::string log_level = "warn";

  TaskListConfig tasklist;

  // Load configuration from file, keys missing from the file keep their value
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Validate configuration
  Result<void> validate() const;

  // Path of the last loaded file (empty when running on defaults)
  const std::filesystem::path& configPath() const { return config_path_; }

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;
};

// Split "FIXME, TODO" style preference strings, dropping empty entries
std::vector<std::string> splitList(const std::string& value);

}  // namespace taskr::config
