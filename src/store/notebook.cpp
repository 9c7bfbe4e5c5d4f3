#include "taskr/store/notebook.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "taskr/util/filesystem.hpp"

namespace taskr::store {

Notebook::Notebook(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(root_, ec);
  if (!ec) {
    root_ = absolute.lexically_normal();
  }
}

const std::vector<std::string>& Notebook::extensions() {
  static const std::vector<std::string> kExtensions = {".md", ".txt"};
  return kExtensions;
}

Result<std::vector<DocumentEntry>> Notebook::scan() const {
  auto files = taskr::util::FileSystem::listFiles(root_, extensions());
  if (!files) {
    return std::unexpected(files.error());
  }

  std::vector<DocumentEntry> entries;
  entries.reserve(files->size());
  for (const auto& path : *files) {
    auto name = nameForPath(path);
    if (!name) {
      spdlog::debug("Skipping {}: {}", path.string(), name.error().message());
      continue;
    }
    auto modified = taskr::util::FileSystem::lastModified(path);
    if (!modified) {
      spdlog::warn("Skipping {}: {}", path.string(), modified.error().message());
      continue;
    }
    entries.push_back(DocumentEntry{std::move(*name), path, *modified});
  }

  std::sort(entries.begin(), entries.end(),
            [](const DocumentEntry& a, const DocumentEntry& b) { return a.name < b.name; });
  return entries;
}

Result<std::string> Notebook::nameForPath(const std::filesystem::path& path) const {
  auto relative = path.lexically_normal().lexically_relative(root_.lexically_normal());
  if (relative.empty() || *relative.begin() == "..") {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Path is outside the notebook: " + path.string()));
  }

  relative.replace_extension();
  std::string name;
  for (const auto& part : relative) {
    if (!name.empty()) {
      name += ':';
    }
    name += part.string();
  }
  return name;
}

std::optional<std::filesystem::path> Notebook::pathForName(const std::string& name) const {
  std::filesystem::path relative;
  size_t start = 0;
  while (true) {
    size_t colon = name.find(':', start);
    relative /= name.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
    if (colon == std::string::npos) {
      break;
    }
    start = colon + 1;
  }

  for (const auto& extension : extensions()) {
    auto candidate = root_ / relative;
    candidate += extension;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return std::nullopt;
}

Result<taskr::core::Document> Notebook::load(const std::string& name) const {
  auto path = pathForName(name);
  if (!path) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "Document not found: " + name));
  }
  return loadPath(*path);
}

Result<taskr::core::Document> Notebook::loadPath(const std::filesystem::path& path) const {
  auto name = nameForPath(path);
  if (!name) {
    return std::unexpected(name.error());
  }

  auto content = taskr::util::FileSystem::readFile(path);
  if (!content) {
    return std::unexpected(content.error());
  }

  auto document = taskr::core::Document::fromFileContent(std::move(*name), *content);
  if (!document) {
    return std::unexpected(document.error());
  }
  document->setPath(path);
  return document;
}

}  // namespace taskr::store
