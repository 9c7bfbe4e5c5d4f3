#pragma once

#include <filesystem>
#include <string>

namespace taskr::util {

// Default locations below the XDG base directories
class Xdg {
 public:
  // $XDG_DATA_HOME/taskr, ~/.local/share/taskr when unset
  static std::filesystem::path dataHome();

  // $XDG_CONFIG_HOME/taskr, ~/.config/taskr when unset
  static std::filesystem::path configHome();

  // $TASKR_NOTES_DIR if set, else dataHome()/notes
  static std::filesystem::path notesDir();

  // Task database: dataHome()/.taskr/tasks.sqlite
  static std::filesystem::path indexFile();

  static std::filesystem::path configFile();
  static std::filesystem::path logDir();

 private:
  // $variable/taskr, or $HOME/home_relative/taskr
  static std::filesystem::path baseDir(const char* variable,
                                       const std::filesystem::path& home_relative,
                                       const char* fallback);
  static std::string getEnvVar(const char* name);
};

}  // namespace taskr::util
