#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "taskr/common.hpp"
#include "taskr/core/document.hpp"

namespace taskr::store {

/**
 * @brief A document file found in the notebook directory
 */
struct DocumentEntry {
  std::string name;                          // "Projects:Garden"
  std::filesystem::path path;
  std::filesystem::file_time_type modified;
};

/**
 * @brief Directory of outline documents
 *
 * Every *.md and *.txt file below the root is a document. Its name is the
 * path relative to the root without extension, with ':' between parts.
 */
class Notebook {
public:
  explicit Notebook(std::filesystem::path root);

  const std::filesystem::path& root() const { return root_; }

  /**
   * @brief All documents, sorted by name
   */
  Result<std::vector<DocumentEntry>> scan() const;

  /**
   * @brief Page name of a file below the root
   * @return kInvalidArgument for paths outside the notebook
   */
  Result<std::string> nameForPath(const std::filesystem::path& path) const;

  // Existing file for a page name, if any
  std::optional<std::filesystem::path> pathForName(const std::string& name) const;

  /**
   * @brief Read and parse a document by page name
   */
  Result<taskr::core::Document> load(const std::string& name) const;

  /**
   * @brief Read and parse a document file
   */
  Result<taskr::core::Document> loadPath(const std::filesystem::path& path) const;

  static const std::vector<std::string>& extensions();

private:
  std::filesystem::path root_;
};

}  // namespace taskr::store
