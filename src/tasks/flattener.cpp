#include "taskr/tasks/flattener.hpp"

namespace taskr::tasks {

using taskr::core::Node;
using taskr::core::NodeKind;

namespace {

// Split like Python's str.splitlines(): no trailing empty line
void appendLines(const std::string& text, std::vector<Item>& items) {
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      items.push_back(Item::makeText(text.substr(start)));
      break;
    }
    items.push_back(Item::makeText(text.substr(start, end - start)));
    start = end + 1;
  }
}

void flattenList(const Node& list, int level, std::vector<Item>& items) {
  for (const auto& child : list.children) {
    if (child.kind == NodeKind::kList) {
      flattenList(child, level + 1, items);
    } else if (child.kind == NodeKind::kListItem) {
      items.push_back(Item::makeEntry(child.bullet, level, flattenText(child)));
    }
    // anything else inside a list is ignored
  }
}

}  // namespace

std::vector<Item> flattenParagraph(const Node& paragraph) {
  std::vector<Item> items;
  std::string text;

  for (const auto& child : paragraph.children) {
    switch (child.kind) {
      case NodeKind::kText:
        text += child.text;
        break;
      case NodeKind::kList:
        appendLines(text, items);
        text.clear();
        flattenList(child, 0, items);
        break;
      case NodeKind::kStrike:
      case NodeKind::kUnknown:
      case NodeKind::kParagraph:
      case NodeKind::kHeading:
      case NodeKind::kListItem:
        break;
      default:
        text += flattenText(child);
        break;
    }
  }

  appendLines(text, items);
  return items;
}

std::string flattenText(const Node& node) {
  if (node.kind == NodeKind::kStrike) {
    return {};
  }
  if (node.kind == NodeKind::kText) {
    return node.text;
  }

  std::string text;
  for (const auto& child : node.children) {
    text += flattenText(child);
  }
  return text;
}

}  // namespace taskr::tasks
