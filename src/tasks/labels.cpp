#include "taskr/tasks/labels.hpp"

#include <unicode/unistr.h>

namespace taskr::tasks {

namespace {

std::string escapeRegex(const std::string& text) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string escaped;
  for (char c : text) {
    if (special.find(c) != std::string::npos) {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

}  // namespace

LabelMatcher::LabelMatcher(std::vector<std::string> labels, std::string next_label)
    : labels_(std::move(labels)), next_label_(std::move(next_label)) {
  if (!next_label_.empty()) {
    // Lets "Next: do this" count as a task without "TODO: Next: do this"
    next_regex_ = std::regex("^" + escapeRegex(next_label_) + R"(:?\s+)");
    labels_.push_back(next_label_);
  }

  std::string alternatives;
  for (size_t i = 0; i < labels_.size(); ++i) {
    if (i > 0) alternatives += "|";
    alternatives += escapeRegex(labels_[i]);
  }
  // Label must not run into a word, "TODOS" is not "TODO"
  label_regex_ = std::regex("^(" + alternatives + R"()(?!\w))");
}

LabelMatcher LabelMatcher::fromConfig(const taskr::config::TaskListConfig& config) {
  return LabelMatcher(config.labels, config.next_label);
}

std::optional<std::string> LabelMatcher::match(std::string_view text) const {
  if (labels_.empty()) {
    return std::nullopt;
  }
  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_search(text.begin(), text.end(), match, label_regex_)) {
    return match[1].str();
  }
  return std::nullopt;
}

bool LabelMatcher::matchesNext(std::string_view text) const {
  if (!next_regex_) {
    return false;
  }
  return std::regex_search(text.begin(), text.end(), *next_regex_);
}

std::string LabelMatcher::stripNext(const std::string& text) const {
  if (!next_regex_) {
    return text;
  }
  return std::regex_replace(text, *next_regex_, "", std::regex_constants::format_first_only);
}

std::vector<std::string> extractTags(std::string_view text) {
  // Bytes from 0x80 up belong to UTF-8 sequences and count as word characters
  static const std::regex tag_regex(R"((?:^|\s)@([\w\x80-\xFF]+))");

  std::vector<std::string> tags;
  for (std::regex_iterator<std::string_view::const_iterator> it(text.begin(), text.end(), tag_regex), end;
       it != end; ++it) {
    tags.push_back((*it)[1].str());
  }
  return tags;
}

std::string toLower(std::string_view text) {
  std::string lower;
  icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())))
      .toLower()
      .toUTF8String(lower);
  return lower;
}

}  // namespace taskr::tasks
