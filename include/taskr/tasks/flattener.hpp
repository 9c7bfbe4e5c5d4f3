#pragma once

#include <string>
#include <vector>

#include "taskr/core/parse_tree.hpp"

namespace taskr::tasks {

// One line of a flattened paragraph: a plain text line or a list entry
struct Item {
  enum class Kind {
    kText,
    kListEntry
  };

  Kind kind = Kind::kText;
  taskr::core::Bullet bullet = taskr::core::Bullet::kPlain;  // kListEntry only
  int level = 0;                                             // kListEntry only
  std::string text;

  bool isListEntry() const { return kind == Kind::kListEntry; }

  static Item makeText(std::string text) {
    return Item{Kind::kText, taskr::core::Bullet::kPlain, 0, std::move(text)};
  }

  static Item makeEntry(taskr::core::Bullet bullet, int level, std::string text) {
    return Item{Kind::kListEntry, bullet, level, std::move(text)};
  }
};

// Flatten a paragraph into text lines and list entries, in document order.
// Struck-through spans are dropped, unknown nodes are skipped.
std::vector<Item> flattenParagraph(const taskr::core::Node& paragraph);

// All text below node, struck-through spans excluded
std::string flattenText(const taskr::core::Node& node);

}  // namespace taskr::tasks
