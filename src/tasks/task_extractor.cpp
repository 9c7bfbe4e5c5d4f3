#include "taskr/tasks/task_extractor.hpp"

#include <sstream>

#include "taskr/tasks/task_parser.hpp"

namespace taskr::tasks {

using taskr::core::Bullet;
using taskr::core::Node;
using taskr::core::NodeKind;

namespace {

struct Frame {
  int level;
  TaskNode* task;
};

std::string stripColons(const std::string& text) {
  size_t start = text.find_first_not_of(':');
  if (start == std::string::npos) {
    return {};
  }
  size_t end = text.find_last_not_of(':');
  return text.substr(start, end - start + 1);
}

}  // namespace

TaskExtractor::TaskExtractor(LabelMatcher labels, bool all_checkboxes)
    : labels_(std::move(labels)), all_checkboxes_(all_checkboxes) {}

TaskForest TaskExtractor::extract(const taskr::core::ParseTree& tree,
                                  const std::optional<std::string>& default_date) const {
  TaskForest forest;
  for (const auto& block : tree.blocks) {
    if (block.kind == NodeKind::kParagraph) {
      extractParagraph(block, default_date, forest);
    }
  }
  return forest;
}

std::optional<std::vector<std::string>> TaskExtractor::detectHeader(
    const std::vector<Item>& items) const {
  if (items.size() < 2 || items[0].isListEntry() || !items[1].isListEntry()) {
    return std::nullopt;
  }
  if (labels_.empty() || !labels_.match(items[0].text)) {
    return std::nullopt;
  }

  std::istringstream words(stripColons(items[0].text));
  std::string word;
  words >> word;  // the label itself

  std::vector<std::string> tags;
  while (words >> word) {
    if (word.front() != '@') {
      return std::nullopt;
    }
    tags.push_back(word.substr(1));
  }
  return tags;
}

void TaskExtractor::extractParagraph(const Node& paragraph,
                                     const std::optional<std::string>& default_date,
                                     TaskForest& forest) const {
  std::vector<Item> items = flattenParagraph(paragraph);

  std::vector<std::string> global_tags;
  bool is_task_list = false;
  size_t first = 0;
  if (auto header = detectHeader(items)) {
    global_tags = std::move(*header);
    is_task_list = true;
    first = 1;
  }

  TaskParser parser(labels_);

  // Frames point into their parent's children. Only the top frame's
  // children (or the forest when the stack is empty) ever grow.
  std::vector<Frame> stack;
  std::optional<int> pruned_level;

  for (size_t i = first; i < items.size(); ++i) {
    const Item& item = items[i];

    if (!item.isListEntry()) {
      stack.clear();
      pruned_level.reset();
      if (!labels_.empty() && labels_.match(item.text)) {
        forest.push_back(TaskNode{
            parser.parse(item.text, true, global_tags, default_date, std::nullopt, forest), {}});
      }
      continue;
    }

    if (pruned_level) {
      if (item.level > *pruned_level) {
        continue;  // below a non-task entry
      }
      pruned_level.reset();
    }

    while (!stack.empty() && stack.back().level >= item.level) {
      stack.pop_back();
    }

    bool is_task = (isCheckbox(item.bullet) && (is_task_list || all_checkboxes_)) ||
                   (!labels_.empty() && labels_.match(item.text));
    if (!is_task) {
      pruned_level = item.level;
      continue;
    }

    std::optional<std::string> date = default_date;
    std::optional<int> priority;
    if (!stack.empty()) {
      const TaskFields& parent = stack.back().task->fields;
      if (parent.hasDueDate()) {
        date = parent.due;
      }
      priority = parent.priority;
    }

    bool open = item.bullet != Bullet::kChecked && item.bullet != Bullet::kCancelled;
    TaskForest& target = stack.empty() ? forest : stack.back().task->children;
    TaskFields fields = parser.parse(item.text, open, global_tags, date, priority, target);
    target.push_back(TaskNode{std::move(fields), {}});
    stack.push_back(Frame{item.level, &target.back()});
  }
}

}  // namespace taskr::tasks
