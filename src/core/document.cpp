#include "taskr/core/document.hpp"

#include <yaml-cpp/yaml.h>

#include "taskr/core/wiki_parser.hpp"
#include "taskr/util/date.hpp"

namespace taskr::core {

Document::Document(std::string name, ParseTree tree)
    : name_(std::move(name)), tree_(std::move(tree)) {
}

Result<Document> Document::fromFileContent(std::string name, const std::string& content) {
  std::string body = content;
  std::optional<std::string> title;
  std::optional<std::string> due;

  // Look for YAML front-matter delimiters
  const std::string yaml_start = "---\n";
  const std::string yaml_end = "\n---\n";

  if (content.compare(0, yaml_start.length(), yaml_start) == 0) {
    size_t yaml_end_pos = content.find(yaml_end, yaml_start.length());
    if (yaml_end_pos == std::string::npos) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Missing YAML front-matter end delimiter in " + name));
    }

    std::string yaml_content = content.substr(yaml_start.length(),
                                              yaml_end_pos - yaml_start.length());
    body = content.substr(yaml_end_pos + yaml_end.length());

    try {
      YAML::Node node = YAML::Load(yaml_content);
      if (node.IsMap()) {
        if (node["title"]) {
          title = node["title"].as<std::string>();
        }
        if (node["due"]) {
          auto date = taskr::util::Date::parse(node["due"].as<std::string>());
          if (!date) {
            return std::unexpected(makeError(ErrorCode::kParseError,
                                             "Invalid due date in front-matter of " + name));
          }
          due = taskr::util::Date::toIso(*date);
        }
      }
    } catch (const YAML::Exception& e) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "YAML parse error in " + name + ": " + std::string(e.what())));
    }
  }

  WikiParser parser;
  Document document(std::move(name), parser.parse(body));
  document.title_ = std::move(title);
  document.default_due_ = std::move(due);
  return document;
}

}  // namespace taskr::core
