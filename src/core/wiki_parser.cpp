#include "taskr/core/wiki_parser.hpp"

#include <regex>
#include <sstream>

namespace taskr::core {

namespace {

size_t indentWidth(const std::string& prefix) {
  size_t width = 0;
  for (char c : prefix) {
    width += (c == '\t') ? 4 : 1;
  }
  return width;
}

// Flush pending plain text into the node list
void flushText(std::string& pending, std::vector<Node>& nodes) {
  if (!pending.empty()) {
    nodes.push_back(Node::makeText(pending));
    pending.clear();
  }
}

}  // namespace

ParseTree WikiParser::parse(std::string_view text) const {
  ParseTree tree;

  std::optional<Node> paragraph;
  // Open lists of the current paragraph, outermost first. Only the last
  // frame's list is appended to, so the pointers stay valid.
  struct ListFrame {
    size_t indent;
    Node* list;
  };
  std::vector<ListFrame> lists;

  auto closeParagraph = [&]() {
    lists.clear();
    if (paragraph && !paragraph->children.empty()) {
      tree.blocks.push_back(std::move(*paragraph));
    }
    paragraph.reset();
  };

  auto ensureParagraph = [&]() {
    if (!paragraph) {
      paragraph = Node::make(NodeKind::kParagraph);
    }
  };

  std::istringstream input{std::string(text)};
  std::string line;
  bool in_fence = false;
  Node fence;

  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.rfind("```", 0) == 0) {
      if (in_fence) {
        tree.blocks.push_back(std::move(fence));
        in_fence = false;
      } else {
        closeParagraph();
        fence = Node::make(NodeKind::kCode);
        in_fence = true;
      }
      continue;
    }
    if (in_fence) {
      fence.children.push_back(Node::makeText(line + "\n"));
      continue;
    }

    if (isBlank(line)) {
      closeParagraph();
      continue;
    }

    if (auto heading = matchHeading(line)) {
      closeParagraph();
      tree.blocks.push_back(Node::make(NodeKind::kHeading, parseInline(*heading)));
      continue;
    }

    if (auto item = matchListLine(line)) {
      ensureParagraph();

      while (!lists.empty() && item->indent < lists.back().indent) {
        lists.pop_back();
      }

      if (lists.empty()) {
        paragraph->children.push_back(Node::make(NodeKind::kList));
        lists.push_back({item->indent, &paragraph->children.back()});
      } else if (item->indent > lists.back().indent) {
        Node* parent = lists.back().list;
        parent->children.push_back(Node::make(NodeKind::kList));
        lists.push_back({item->indent, &parent->children.back()});
      }

      lists.back().list->children.push_back(
          Node::makeListItem(item->bullet, parseInline(item->text)));
      continue;
    }

    // Plain text line, ends any open list
    ensureParagraph();
    lists.clear();
    auto inline_nodes = parseInline(line);
    for (auto& node : inline_nodes) {
      paragraph->children.push_back(std::move(node));
    }
    paragraph->children.push_back(Node::makeText("\n"));
  }

  if (in_fence) {
    tree.blocks.push_back(std::move(fence));
  }
  closeParagraph();

  return tree;
}

std::vector<Node> WikiParser::parseInline(std::string_view text) {
  std::vector<Node> nodes;
  std::string pending;

  size_t i = 0;
  while (i < text.size()) {
    auto rest = text.substr(i);

    if (rest.starts_with("~~") || rest.starts_with("**")) {
      auto marker = rest.substr(0, 2);
      auto close = text.find(marker, i + 2);
      if (close != std::string_view::npos && close > i + 2) {
        flushText(pending, nodes);
        NodeKind kind = (marker == "~~") ? NodeKind::kStrike : NodeKind::kStrong;
        nodes.push_back(Node::make(kind, parseInline(text.substr(i + 2, close - i - 2))));
        i = close + 2;
        continue;
      }
    } else if (rest.starts_with("`")) {
      auto close = text.find('`', i + 1);
      if (close != std::string_view::npos) {
        flushText(pending, nodes);
        nodes.push_back(Node::make(NodeKind::kCode,
                                   {Node::makeText(std::string(text.substr(i + 1, close - i - 1)))}));
        i = close + 1;
        continue;
      }
    } else if (rest.starts_with("[[")) {
      auto close = text.find("]]", i + 2);
      if (close != std::string_view::npos) {
        flushText(pending, nodes);
        std::string inner(text.substr(i + 2, close - i - 2));
        Node link = Node::make(NodeKind::kLink);
        auto bar = inner.find('|');
        link.text = inner.substr(0, bar);
        std::string label = (bar == std::string::npos) ? inner : inner.substr(bar + 1);
        link.children.push_back(Node::makeText(label));
        nodes.push_back(std::move(link));
        i = close + 2;
        continue;
      }
    }

    pending += text[i];
    ++i;
  }

  flushText(pending, nodes);
  return nodes;
}

std::optional<WikiParser::ListLine> WikiParser::matchListLine(const std::string& line) {
  // indent, bullet, checkbox, text
  static const std::regex list_regex(
      R"(^([ \t]*)(?:([*+-]|\d+[.)])[ \t]+)?(?:\[([ xX*~-])\][ \t]+)?(.*)$)");

  std::smatch match;
  if (!std::regex_match(line, match, list_regex)) {
    return std::nullopt;
  }

  bool has_bullet = match[2].matched;
  bool has_box = match[3].matched;
  if (!has_bullet && !has_box) {
    return std::nullopt;
  }

  ListLine item;
  item.indent = indentWidth(match[1]);
  item.text = match[4];

  if (!has_box) {
    item.bullet = Bullet::kPlain;
  } else {
    char box = match[3].str()[0];
    switch (box) {
      case ' ':
        item.bullet = Bullet::kUnchecked;
        break;
      case '*':
        item.bullet = Bullet::kChecked;
        break;
      case 'x':
      case 'X':
        // "- [x]" is a done Markdown item, a bare "[x]" is a cancelled zim item
        item.bullet = has_bullet ? Bullet::kChecked : Bullet::kCancelled;
        break;
      default:
        item.bullet = Bullet::kCancelled;
        break;
    }
  }

  return item;
}

std::optional<std::string> WikiParser::matchHeading(const std::string& line) {
  static const std::regex md_heading(R"(^#{1,6}[ \t]+(.*?)[ \t#]*$)");
  static const std::regex zim_heading(R"(^={2,}[ \t]+(.*?)[ \t]+={2,}[ \t]*$)");

  std::smatch match;
  if (std::regex_match(line, match, md_heading) || std::regex_match(line, match, zim_heading)) {
    return match[1].str();
  }
  return std::nullopt;
}

bool WikiParser::isBlank(const std::string& line) {
  return line.find_first_not_of(" \t") == std::string::npos;
}

}  // namespace taskr::core
