#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "taskr/tasks/labels.hpp"
#include "taskr/tasks/task.hpp"

namespace taskr::tasks {

// Result of removing a due date directive from task text
struct DueDateExtraction {
  std::optional<std::string> date;  // ISO date, set when a directive parsed
  std::string text;                 // text with that directive removed
};

// Find the first "[d:<date>]" directive whose value is a valid date and
// remove it (with its leading whitespace). Directives that do not parse
// stay in the text.
DueDateExtraction extractDueDate(std::string_view text);

// Turns the raw text of one item into task fields
class TaskParser {
 public:
  explicit TaskParser(const LabelMatcher& labels);

  /**
   * @brief Parse one task item
   * @param text Item text as written
   * @param open False for checked and cancelled boxes
   * @param global_tags Tags of the paragraph header, without "@"
   * @param default_date Inherited due date (ISO), if any
   * @param default_priority Priority of the parent task, if any
   * @param siblings Tasks already collected at the same level
   */
  TaskFields parse(std::string text, bool open,
                   const std::vector<std::string>& global_tags,
                   const std::optional<std::string>& default_date,
                   std::optional<int> default_priority,
                   const std::vector<TaskNode>& siblings) const;

 private:
  const LabelMatcher& labels_;
};

}  // namespace taskr::tasks
