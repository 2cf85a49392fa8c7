#include "minire/visualize.hpp"
#include "minire/common.hpp"

#include <cstddef>
#include <format>
#include <ostream>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <variant>

using namespace minire;

namespace {
constexpr auto is_metacharacter(char c) -> bool {
  switch (c) {
  case '$':
  case '(':
  case ')':
  case '+':
  case '.':
  case '?':
  case '[':
  case '\\':
  case '^':
  case '|':
    return true;
  default:
    return false;
  }
}

auto pretty_format(MatcherNode const &node) -> std::string;

auto pretty_format(std::span<MatcherNode const> nodes) -> std::string {
  std::string output;
  bool follows_backreference = false;
  for (auto const &node : nodes) {
    auto formatted = pretty_format(node);
    // A digit right after `\n` would read back as part of the group number
    if (follows_backreference and not formatted.empty() and
        formatted[0] >= '0' and formatted[0] <= '9') {
      formatted.replace(0, 1, std::format("[{}]", formatted[0]));
    }
    output += formatted;
    follows_backreference =
        std::holds_alternative<MatcherNode::Backreference>(node.type);
  }
  return output;
}

auto pretty_format(MatcherNode::WordChar) -> std::string { return "\\w"; }

auto pretty_format(MatcherNode::Digit) -> std::string { return "\\d"; }

auto pretty_format(MatcherNode::Wildcard) -> std::string { return "."; }

auto pretty_format(MatcherNode::Literal literal) -> std::string {
  if (is_metacharacter(literal.value)) {
    return std::format("\\{}", literal.value);
  }
  return std::string(1, literal.value);
}

auto pretty_format(MatcherNode::CharClass const &expression) -> std::string {
  return std::format("[{}{}]", expression.is_complement ? "^" : "",
                     expression.source);
}

auto pretty_format(MatcherNode::Repeat1 const &repeat) -> std::string {
  return pretty_format(*repeat.inner) + "+";
}

auto pretty_format(MatcherNode::Optional const &optional) -> std::string {
  return pretty_format(*optional.inner) + "?";
}

auto pretty_format(MatcherNode::Group const &group) -> std::string {
  if (group.right.empty()) {
    return std::format("({})", pretty_format(group.left));
  }
  return std::format("({}|{})", pretty_format(group.left),
                     pretty_format(group.right));
}

auto pretty_format(MatcherNode::Backreference reference) -> std::string {
  return std::format("\\{}", reference.group_number);
}

auto pretty_format(MatcherNode const &node) -> std::string {
  return std::visit(
      [](auto const &type) -> std::string { return pretty_format(type); },
      node.type);
}

auto output_subtree(std::ostream &out_stream,
                    std::span<MatcherNode const> nodes, size_t depth) -> void;

auto output_node(std::ostream &out_stream, MatcherNode const &node,
                 size_t depth) -> void {
  std::string const indent(2 * depth, ' ');
  std::visit(
      Overload{
          [&](MatcherNode::Repeat1 const &repeat) {
            std::print(out_stream, "{}one-or-more\n", indent);
            output_node(out_stream, *repeat.inner, depth + 1);
          },
          [&](MatcherNode::Optional const &optional) {
            std::print(out_stream, "{}zero-or-one\n", indent);
            output_node(out_stream, *optional.inner, depth + 1);
          },
          [&](MatcherNode::Group const &group) {
            std::print(out_stream, "{}group\n", indent);
            std::print(out_stream, "{}  left\n", indent);
            output_subtree(out_stream, group.left, depth + 2);
            if (not group.right.empty()) {
              std::print(out_stream, "{}  right\n", indent);
              output_subtree(out_stream, group.right, depth + 2);
            }
          },
          [&](auto const &leaf) {
            std::print(out_stream, "{}{}\n", indent, pretty_format(leaf));
          },
      },
      node.type);
}

auto output_subtree(std::ostream &out_stream,
                    std::span<MatcherNode const> nodes, size_t depth) -> void {
  for (auto const &node : nodes) {
    output_node(out_stream, node, depth);
  }
}
} // namespace

auto minire::format_pattern(Expression const &expression) -> std::string {
  std::string output;
  if (expression.anchored_start) {
    output += "^";
  }
  output += pretty_format(expression.nodes);
  if (expression.anchored_end) {
    output += "$";
  }
  return output;
}

auto minire::output_tree(std::ostream &out_stream,
                         Expression const &expression) -> void {
  std::print(out_stream,
             "expression (anchored start: {}, end: {}, groups: {})\n",
             expression.anchored_start, expression.anchored_end,
             expression.group_count);
  output_subtree(out_stream, expression.nodes, 1);
}
