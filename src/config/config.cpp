#include "taskr/config/config.hpp"

#include <fstream>
#include <sstream>

#include <toml++/toml.hpp>

#include "taskr/util/logging.hpp"
#include "taskr/util/xdg.hpp"

namespace taskr::config {

namespace {

// Accept both `labels = ["FIXME", "TODO"]` and `labels = "FIXME, TODO"`
std::optional<std::vector<std::string>> readList(toml::node_view<toml::node> node) {
  if (auto array = node.as_array()) {
    std::vector<std::string> values;
    for (const auto& element : *array) {
      if (auto value = element.value<std::string>()) {
        if (!value->empty()) {
          values.push_back(*value);
        }
      }
    }
    return values;
  }
  if (auto value = node.value<std::string>()) {
    return splitList(*value);
  }
  return std::nullopt;
}

toml::array toArray(const std::vector<std::string>& values) {
  toml::array array;
  for (const auto& value : values) {
    array.push_back(value);
  }
  return array;
}

std::string join(const std::vector<std::string>& values) {
  std::string joined;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) joined += ",";
    joined += values[i];
  }
  return joined;
}

}  // namespace

std::vector<std::string> splitList(const std::string& value) {
  std::vector<std::string> items;
  std::istringstream iss(value);
  std::string item;
  while (std::getline(iss, item, ',')) {
    auto start = item.find_first_not_of(" \t");
    auto end = item.find_last_not_of(" \t");
    if (start != std::string::npos) {
      items.push_back(item.substr(start, end - start + 1));
    }
  }
  return items;
}

std::string TaskListConfig::rebuildFingerprint() const {
  std::ostringstream oss;
  oss << "all_checkboxes=" << all_checkboxes
      << ";labels=" << join(labels)
      << ";next_label=" << next_label
      << ";deadline_by_page=" << deadline_by_page
      << ";included_subtrees=" << join(included_subtrees)
      << ";excluded_subtrees=" << join(excluded_subtrees);
  return oss.str();
}

Config::Config() {
  notes_dir = taskr::util::Xdg::notesDir();
  index_file = taskr::util::Xdg::indexFile();
  log_dir = taskr::util::Xdg::logDir();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError, 
                                     "Config file not found: " + config_path.string()));
  }
  
  try {
    auto config_data = toml::parse_file(config_path.string());
    
    // Core paths
    if (auto value = config_data["notes_dir"].value<std::string>()) {
      notes_dir = *value;
    }
    if (auto value = config_data["index_file"].value<std::string>()) {
      index_file = *value;
    }
    if (auto value = config_data["log_dir"].value<std::string>()) {
      log_dir = *value;
    }
    if (auto value = config_data["log_level"].value<std::string>()) {
      log_level = *value;
    }
    
    // Task list preferences
    if (auto table = config_data["tasklist"].as_table()) {
      if (auto value = (*table)["all_checkboxes"].value<bool>()) {
        tasklist.all_checkboxes = *value;
      }
      if (auto value = (*table)["tag_by_page"].value<bool>()) {
        tasklist.tag_by_page = *value;
      }
      if (auto value = (*table)["deadline_by_page"].value<bool>()) {
        tasklist.deadline_by_page = *value;
      }
      if (auto value = (*table)["use_workweek"].value<bool>()) {
        tasklist.use_workweek = *value;
      }
      if (auto values = readList((*table)["labels"])) {
        tasklist.labels = *values;
      }
      if (auto value = (*table)["next_label"].value<std::string>()) {
        tasklist.next_label = *value;
      }
      if (auto values = readList((*table)["included_subtrees"])) {
        tasklist.included_subtrees = *values;
      }
      if (auto values = readList((*table)["excluded_subtrees"])) {
        tasklist.excluded_subtrees = *values;
      }
    }
    
    config_path_ = config_path;
    return {};
    
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError, 
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;
  
  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }
  
  toml::table config_data;
  config_data.insert_or_assign("notes_dir", notes_dir.string());
  config_data.insert_or_assign("index_file", index_file.string());
  config_data.insert_or_assign("log_dir", log_dir.string());
  config_data.insert_or_assign("log_level", log_level);
  
  toml::table tasklist_table;
  tasklist_table.insert_or_assign("all_checkboxes", tasklist.all_checkboxes);
  tasklist_table.insert_or_assign("tag_by_page", tasklist.tag_by_page);
  tasklist_table.insert_or_assign("deadline_by_page", tasklist.deadline_by_page);
  tasklist_table.insert_or_assign("use_workweek", tasklist.use_workweek);
  tasklist_table.insert_or_assign("labels", toArray(tasklist.labels));
  tasklist_table.insert_or_assign("next_label", tasklist.next_label);
  tasklist_table.insert_or_assign("included_subtrees", toArray(tasklist.included_subtrees));
  tasklist_table.insert_or_assign("excluded_subtrees", toArray(tasklist.excluded_subtrees));
  config_data.insert_or_assign("tasklist", std::move(tasklist_table));
  
  std::error_code ec;
  auto parent = save_path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Failed to create config directory: " + ec.message()));
    }
  }
  
  std::ofstream file(save_path);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, 
                                     "Failed to open config file for writing: " + save_path.string()));
  }
  file << config_data << "\n";
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, 
                                     "Failed to write config file: " + save_path.string()));
  }
  
  return {};
}

Result<void> Config::validate() const {
  if (notes_dir.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "notes_dir must not be empty"));
  }
  
  if (index_file.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "index_file must not be empty"));
  }
  
  auto level = taskr::util::parseLogLevel(log_level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }
  
  for (const auto& label : tasklist.labels) {
    if (label.empty()) {
      return std::unexpected(makeError(ErrorCode::kConfigError, "Task labels cannot be empty"));
    }
    if (label.find_first_of(" \t\n") != std::string::npos) {
      return std::unexpected(makeError(ErrorCode::kConfigError, 
                                       "Task label cannot contain whitespace: " + label));
    }
  }
  
  if (tasklist.next_label.find_first_of(" \t\n") != std::string::npos) {
    return std::unexpected(makeError(ErrorCode::kConfigError, 
                                     "Next label cannot contain whitespace: " + tasklist.next_label));
  }
  
  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return taskr::util::Xdg::configFile();
}

}  // namespace taskr::config
