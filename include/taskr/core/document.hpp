#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "taskr/common.hpp"
#include "taskr/core/parse_tree.hpp"

namespace taskr::core {

// A parsed document of the notebook
class Document {
 public:
  Document() = default;
  Document(std::string name, ParseTree tree);

  // Parse file content: optional YAML front-matter followed by outline markup.
  // Front-matter keys used: "title", "due" (a date, default for every task).
  static Result<Document> fromFileContent(std::string name, const std::string& content);

  // Page name, e.g. "Projects:Garden" or "Journal:2024:03:01"
  const std::string& name() const { return name_; }

  const std::filesystem::path& path() const { return path_; }
  void setPath(std::filesystem::path path) { path_ = std::move(path); }

  const std::optional<std::string>& title() const { return title_; }

  // ISO date from front-matter
  const std::optional<std::string>& defaultDue() const { return default_due_; }
  void setDefaultDue(std::optional<std::string> due) { default_due_ = std::move(due); }

  const ParseTree& tree() const { return tree_; }

 private:
  std::string name_;
  std::filesystem::path path_;
  std::optional<std::string> title_;
  std::optional<std::string> default_due_;
  ParseTree tree_;
};

}  // namespace taskr::core
