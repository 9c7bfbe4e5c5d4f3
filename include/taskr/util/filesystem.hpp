#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "taskr/common.hpp"

namespace taskr::util {

// Filesystem utilities
class FileSystem {
 public:
  // Read file with error handling
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Get last modification time
  static Result<std::filesystem::file_time_type> lastModified(const std::filesystem::path& path);

  // Regular files below root whose extension is one of extensions,
  // hidden files and directories skipped
  static Result<std::vector<std::filesystem::path>> listFiles(
      const std::filesystem::path& root,
      const std::vector<std::string>& extensions);
};

}  // namespace taskr::util
