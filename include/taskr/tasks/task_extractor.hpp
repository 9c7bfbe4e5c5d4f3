#pragma once

#include <optional>
#include <string>
#include <vector>

#include "taskr/core/parse_tree.hpp"
#include "taskr/tasks/flattener.hpp"
#include "taskr/tasks/labels.hpp"
#include "taskr/tasks/task.hpp"

namespace taskr::tasks {

// Builds the task forest of a document from its paragraphs
class TaskExtractor {
 public:
  TaskExtractor(LabelMatcher labels, bool all_checkboxes);

  // Tasks of the whole tree. Text-line tasks and top-level list tasks of
  // every paragraph share one top-level list.
  TaskForest extract(const taskr::core::ParseTree& tree,
                     const std::optional<std::string>& default_date) const;

  // Tags declared by a task-list header ("TODO: @home @phone" followed by
  // a list), without "@". nullopt when items do not start with a header.
  std::optional<std::vector<std::string>> detectHeader(const std::vector<Item>& items) const;

  const LabelMatcher& labels() const { return labels_; }

 private:
  void extractParagraph(const taskr::core::Node& paragraph,
                        const std::optional<std::string>& default_date,
                        TaskForest& forest) const;

  LabelMatcher labels_;
  bool all_checkboxes_;
};

}  // namespace taskr::tasks
