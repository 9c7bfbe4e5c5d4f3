#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "taskr/common.hpp"
#include "taskr/tasks/labels.hpp"
#include "taskr/tasks/task.hpp"

namespace taskr::tasks {
class TaskList;
}

namespace taskr::query {

using taskr::tasks::DocumentId;
using taskr::tasks::Task;
using taskr::tasks::TaskId;

// Synthetic tag matching tasks without tags, must be lower case
inline constexpr std::string_view kNoTags = "__no_tags__";

// Free text condition, needle in lower case
struct TextFilter {
  bool negated = false;
  std::string needle;
};

// "not @waiting" -> negated "@waiting"; blank input -> no text filter
std::optional<TextFilter> parseTextFilter(std::string_view text);

// All conditions combine with AND
struct FilterCriteria {
  bool actionable_only = false;
  std::optional<std::vector<std::string>> tags;    // any of, kNoTags for untagged
  std::optional<std::vector<std::string>> labels;  // any of
  std::optional<TextFilter> text;

  bool empty() const { return !actionable_only && !tags && !labels && !text; }
};

// Rows of the store together with the names of their documents. Rows of
// unknown documents and rows below missing parents are left out.
struct Snapshot {
  std::vector<Task> tasks;
  std::unordered_map<DocumentId, std::string> document_names;

  const std::string& documentName(const Task& task) const;

  static Snapshot fromRows(std::vector<Task> rows,
                           std::unordered_map<DocumentId, std::string> document_names);
};

// Read every row and document name of the task list
Result<Snapshot> takeSnapshot(taskr::tasks::TaskList& task_list);

// Evaluates filter criteria over a snapshot
class TaskFilter {
 public:
  TaskFilter(const taskr::tasks::LabelMatcher& labels, bool tag_by_page);

  // Tags of a row in display form: "@word" tags of the description, plus
  // the parts of the document name with tag_by_page
  std::vector<std::string> tagsOf(const Task& task, const std::string& document_name) const;

  // Row matches on its own, ancestors not considered
  bool matches(const Task& task, const std::string& document_name,
               const FilterCriteria& criteria) const;

  // Matching rows and every ancestor of a matching row
  std::unordered_set<TaskId> visibleIds(const Snapshot& snapshot,
                                        const FilterCriteria& criteria) const;

 private:
  const taskr::tasks::LabelMatcher& labels_;
  bool tag_by_page_;
};

}  // namespace taskr::query
