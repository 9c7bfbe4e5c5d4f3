#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "taskr/config/config.hpp"

namespace taskr::tasks {

// Recognizes task labels ("TODO", "FIXME", ...) at the start of item text
// and the designated next-item label ("Next:").
class LabelMatcher {
 public:
  LabelMatcher(std::vector<std::string> labels, std::string next_label);

  static LabelMatcher fromConfig(const taskr::config::TaskListConfig& config);

  // True when no label at all is configured; label matching is then disabled
  bool empty() const { return labels_.empty(); }

  // Label found at the start of text, e.g. "TODO" for "TODO: call mum"
  std::optional<std::string> match(std::string_view text) const;

  // True if text starts with the next-item label
  bool matchesNext(std::string_view text) const;

  // Text with a leading next-item label removed
  std::string stripNext(const std::string& text) const;

  // Configured labels, next label last
  const std::vector<std::string>& labels() const { return labels_; }

  // Empty when the next-item convention is disabled
  const std::string& nextLabel() const { return next_label_; }

 private:
  std::vector<std::string> labels_;
  std::string next_label_;
  std::regex label_regex_;
  std::optional<std::regex> next_regex_;
};

// Tags ("@word" preceded by whitespace or start of text) without the "@".
// Word characters include any non-ASCII UTF-8 sequence.
std::vector<std::string> extractTags(std::string_view text);

// Unicode lower-case copy of UTF-8 text
std::string toLower(std::string_view text);

}  // namespace taskr::tasks
