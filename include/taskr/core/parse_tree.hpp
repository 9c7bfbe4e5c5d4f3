#pragma once

#include <string>
#include <vector>

namespace taskr::core {

// Kinds of nodes in a document parse tree
enum class NodeKind {
  kParagraph,  // Block: text runs and lists
  kHeading,    // Block: never carries tasks
  kText,       // Inline text run (may contain newlines)
  kList,       // Bullet/checkbox list: kListItem and nested kList children
  kListItem,   // One bullet, its text as inline children
  kStrike,     // Struck-through span
  kStrong,     // Bold span
  kCode,       // Verbatim span
  kLink,       // Link, children hold the label
  kUnknown     // Anything a producer could not classify
};

// Bullet of a list item
enum class Bullet {
  kUnchecked,
  kChecked,
  kCancelled,
  kPlain
};

inline bool isCheckbox(Bullet bullet) {
  return bullet != Bullet::kPlain;
}

// Node of a document parse tree. Text runs are nodes of their own, so a
// paragraph is an ordered list of children.
struct Node {
  NodeKind kind = NodeKind::kUnknown;
  std::string text;                 // kText payload, kLink target
  Bullet bullet = Bullet::kPlain;   // kListItem only
  std::vector<Node> children;

  static Node makeText(std::string text) {
    Node node;
    node.kind = NodeKind::kText;
    node.text = std::move(text);
    return node;
  }

  static Node make(NodeKind kind, std::vector<Node> children = {}) {
    Node node;
    node.kind = kind;
    node.children = std::move(children);
    return node;
  }

  static Node makeListItem(Bullet bullet, std::vector<Node> children) {
    Node node;
    node.kind = NodeKind::kListItem;
    node.bullet = bullet;
    node.children = std::move(children);
    return node;
  }
};

// Parsed document: ordered block nodes
struct ParseTree {
  std::vector<Node> blocks;

  bool empty() const { return blocks.empty(); }
};

}  // namespace taskr::core
