#include "taskr/util/xdg.hpp"

#include <cstdlib>

namespace taskr::util {

std::filesystem::path Xdg::baseDir(const char* variable,
                                   const std::filesystem::path& home_relative,
                                   const char* fallback) {
  std::string base = getEnvVar(variable);
  if (!base.empty()) {
    return std::filesystem::path(base) / "taskr";
  }

  std::string home = getEnvVar("HOME");
  if (home.empty()) {
    return std::filesystem::current_path() / fallback;
  }
  return std::filesystem::path(home) / home_relative / "taskr";
}

std::filesystem::path Xdg::dataHome() {
  return baseDir("XDG_DATA_HOME", std::filesystem::path(".local") / "share", ".taskr_data");
}

std::filesystem::path Xdg::configHome() {
  return baseDir("XDG_CONFIG_HOME", ".config", ".taskr_config");
}

std::filesystem::path Xdg::notesDir() {
  std::string override_dir = getEnvVar("TASKR_NOTES_DIR");
  if (!override_dir.empty()) {
    return override_dir;
  }
  return dataHome() / "notes";
}

std::filesystem::path Xdg::indexFile() {
  return dataHome() / ".taskr" / "tasks.sqlite";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::filesystem::path Xdg::logDir() {
  return dataHome() / "logs";
}

std::string Xdg::getEnvVar(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

}  // namespace taskr::util
