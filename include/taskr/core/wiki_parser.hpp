#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "taskr/core/parse_tree.hpp"

namespace taskr::core {

/**
 * @brief Parser for the outline markup taskr reads
 *
 * Understands the subset of Markdown / zim wiki syntax that matters for
 * task extraction:
 * - blank lines separate paragraphs
 * - "# Title" and "== Title ==" headings
 * - bullets "*", "-", "+", "1." and checkboxes "[ ]", "[*]", "[x]",
 *   "- [ ]", "- [x]", "- [~]", nested by indentation
 * - inline "~~strike~~", "**strong**", "`code`" and "[[link|label]]"
 * - fenced code blocks, which are kept out of paragraphs
 */
class WikiParser {
public:
  ParseTree parse(std::string_view text) const;

  // Parse a single line of inline markup
  static std::vector<Node> parseInline(std::string_view text);

private:
  struct ListLine {
    size_t indent = 0;
    Bullet bullet = Bullet::kPlain;
    std::string text;
  };

  static std::optional<ListLine> matchListLine(const std::string& line);
  static std::optional<std::string> matchHeading(const std::string& line);
  static bool isBlank(const std::string& line);
};

}  // namespace taskr::core
