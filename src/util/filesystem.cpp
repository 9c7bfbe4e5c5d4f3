#include "taskr/util/filesystem.hpp"

#include <algorithm>
#include <fstream>

namespace taskr::util {

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot open file: " + path.string()));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Cannot get file size"));
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Read failed: " + path.string()));
  }

  return content;
}

Result<std::filesystem::file_time_type> FileSystem::lastModified(const std::filesystem::path& path) {
  std::error_code ec;
  auto time = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot get modification time of " + path.string() + ": " + ec.message()));
  }
  return time;
}

Result<std::vector<std::filesystem::path>> FileSystem::listFiles(
    const std::filesystem::path& root,
    const std::vector<std::string>& extensions) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                     "Not a directory: " + root.string()));
  }

  std::vector<std::filesystem::path> files;
  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot read directory " + root.string() + ": " + ec.message()));
  }

  for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kFileReadError,
                                       "Directory walk failed: " + ec.message()));
    }

    const auto& path = it->path();
    if (path.filename().string().starts_with(".")) {
      if (it->is_directory(ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!it->is_regular_file(ec)) {
      continue;
    }

    auto extension = path.extension().string();
    if (std::find(extensions.begin(), extensions.end(), extension) != extensions.end()) {
      files.push_back(path);
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace taskr::util
