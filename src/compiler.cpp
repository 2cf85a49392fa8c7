#include "minire/compiler.hpp"
#include "minire/common.hpp"
#include "minire/expression.hpp"

#include <cassert>
#include <cstddef>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace minire;

namespace {
// Tokens that steer compilation rather than becoming nodes themselves
namespace token {
struct StartAnchor {};
struct EndAnchor {};
struct OneOrMore {};
struct ZeroOrOne {};
struct GroupOpen {};
struct GroupClose {};
struct Alternation {};
} // namespace token

using Token =
    std::variant<token::StartAnchor, token::EndAnchor, token::OneOrMore,
                 token::ZeroOrOne, token::GroupOpen, token::GroupClose,
                 token::Alternation, MatcherNode>;

struct GroupFrame {
  size_t start_index;
  std::optional<size_t> alternative_index;
  size_t pattern_offset;
};

struct Cursor {
  std::string_view text;
  size_t offset;

  constexpr auto is_at_end() const -> bool { return offset >= text.size(); }

  constexpr auto peek() const -> char {
    assert(offset < text.size());
    return text[offset];
  }

  constexpr auto eat_next() -> char { return text[offset++]; }

  constexpr auto try_eat(char to_eat) -> bool {
    if (is_next(to_eat)) {
      eat_next();
      return true;
    }
    return false;
  }

  constexpr auto is_next(char test_char) const -> bool {
    if (is_at_end()) {
      return false;
    }
    return peek() == test_char;
  }
};

constexpr auto is_digit(char c) -> bool { return '0' <= c && c <= '9'; }

constexpr auto is_ascii_letter(char c) -> bool {
  return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}

auto parse_group_number(Cursor &cursor) -> size_t {
  size_t const start_offset = cursor.offset;

  size_t result = 0;
  while (not cursor.is_at_end() && is_digit(cursor.peek())) {
    auto const digit = static_cast<size_t>(cursor.eat_next() - '0');
    if (result > (std::numeric_limits<size_t>::max() - digit) / 10) {
      throw CompileError(CompileErrorKind::invalid_backreference,
                         start_offset - 1,
                         "Backreference at offset {} is out of range",
                         start_offset - 1);
    }
    result = result * 10 + digit;
  }
  return result;
}

auto parse_escape(Cursor &cursor) -> MatcherNode {
  size_t const escape_offset = cursor.offset;
  cursor.eat_next(); // '\'

  if (cursor.is_at_end()) {
    throw CompileError(CompileErrorKind::malformed_pattern, escape_offset,
                       "Pattern ends with an unfinished escape at offset {}",
                       escape_offset);
  }

  char const next_char = cursor.peek();
  if (next_char == 'd') {
    cursor.eat_next();
    return {MatcherNode::Digit{}};
  }
  if (next_char == 'w') {
    cursor.eat_next();
    return {MatcherNode::WordChar{}};
  }
  if (is_digit(next_char)) {
    return {MatcherNode::Backreference{parse_group_number(cursor)}};
  }
  if (is_ascii_letter(next_char)) {
    throw CompileError(CompileErrorKind::malformed_pattern, escape_offset,
                       "Unrecognized escape '\\{}' at offset {}", next_char,
                       escape_offset);
  }

  // Escaped metacharacter, or any other symbol standing for itself
  return {MatcherNode::Literal{cursor.eat_next()}};
}

auto parse_character_class(Cursor &cursor) -> MatcherNode {
  size_t const class_offset = cursor.offset;
  cursor.eat_next(); // '['

  MatcherNode::CharClass result;
  result.is_complement = cursor.try_eat('^');

  // The class ends at the very first ']', so "[]" is empty and "[^]" is
  // anything
  size_t const end = cursor.text.find(']', cursor.offset);
  if (end == std::string_view::npos) {
    throw CompileError(CompileErrorKind::malformed_pattern, class_offset,
                       "Character class at offset {} is missing a ']'",
                       class_offset);
  }

  std::string_view const body =
      cursor.text.substr(cursor.offset, end - cursor.offset);
  for (size_t i = 0; i < body.size(); i += 1) {
    // A '-' at either end of the body is literal
    if (i + 2 < body.size() && body[i + 1] == '-') {
      auto const lower = static_cast<unsigned char>(body[i]);
      auto const upper = static_cast<unsigned char>(body[i + 2]);
      if (lower > upper) {
        throw CompileError(CompileErrorKind::malformed_pattern,
                           cursor.offset + i,
                           "Range '{}-{}' at offset {} is out of order",
                           body[i], body[i + 2], cursor.offset + i);
      }
      for (unsigned c = lower; c <= upper; c += 1) {
        result.members.set(c);
      }
      i += 2;
      continue;
    }
    result.members.set(static_cast<unsigned char>(body[i]));
  }

  result.source = std::string{body};
  cursor.offset = end + 1;
  return {std::move(result)};
}

auto next_token(Cursor &cursor) -> Token {
  switch (cursor.peek()) {
  default:
    return MatcherNode{MatcherNode::Literal{cursor.eat_next()}};
  case '^':
    cursor.eat_next();
    return token::StartAnchor{};
  case '$':
    cursor.eat_next();
    return token::EndAnchor{};
  case '\\':
    return parse_escape(cursor);
  case '[':
    return parse_character_class(cursor);
  case '+':
    cursor.eat_next();
    return token::OneOrMore{};
  case '?':
    cursor.eat_next();
    return token::ZeroOrOne{};
  case '.':
    cursor.eat_next();
    return MatcherNode{MatcherNode::Wildcard{}};
  case '(':
    cursor.eat_next();
    return token::GroupOpen{};
  case ')':
    cursor.eat_next();
    return token::GroupClose{};
  case '|':
    cursor.eat_next();
    return token::Alternation{};
  }
}

class ExpressionBuilder {
public:
  auto add(Token next, size_t token_offset) -> void {
    std::visit(
        Overload{
            [&](token::StartAnchor) { m_anchored_start = true; },
            [&](token::EndAnchor) { m_anchored_end = true; },
            [&](token::OneOrMore) {
              wrap_last_node<MatcherNode::Repeat1>('+', token_offset);
            },
            [&](token::ZeroOrOne) {
              wrap_last_node<MatcherNode::Optional>('?', token_offset);
            },
            [&](token::GroupOpen) { open_group(token_offset); },
            [&](token::GroupClose) { close_group(token_offset); },
            [&](token::Alternation) { split_group(token_offset); },
            [&](MatcherNode &node) { add_node(std::move(node), token_offset); },
        },
        next);
  }

  auto finish() && -> Expression {
    if (not m_open_groups.empty()) {
      auto const &frame = m_open_groups.back();
      throw CompileError(CompileErrorKind::unclosed_group,
                         frame.pattern_offset,
                         "Group opened at offset {} is never closed",
                         frame.pattern_offset);
    }

    return {
        .nodes = std::move(m_nodes),
        .anchored_start = m_anchored_start,
        .anchored_end = m_anchored_end,
        .group_count = m_closed_groups,
    };
  }

private:
  // Nodes before this index belong to an enclosing branch and may not be
  // touched by a quantifier
  auto branch_start() const -> size_t {
    if (m_open_groups.empty()) {
      return 0;
    }
    auto const &frame = m_open_groups.back();
    return frame.alternative_index.value_or(frame.start_index);
  }

  template <typename Quantifier>
  auto wrap_last_node(char symbol, size_t token_offset) -> void {
    if (m_nodes.size() <= branch_start()) {
      throw CompileError(CompileErrorKind::dangling_quantifier, token_offset,
                         "Quantifier '{}' at offset {} has nothing to repeat",
                         symbol, token_offset);
    }

    auto inner = std::make_unique<MatcherNode>(std::move(m_nodes.back()));
    m_nodes.pop_back();
    m_nodes.push_back(MatcherNode{Quantifier{std::move(inner)}});
  }

  auto open_group(size_t token_offset) -> void {
    m_open_groups.push_back({
        .start_index = m_nodes.size(),
        .alternative_index = std::nullopt,
        .pattern_offset = token_offset,
    });
  }

  auto split_group(size_t token_offset) -> void {
    if (m_open_groups.empty()) {
      throw CompileError(CompileErrorKind::alternation_outside_group,
                         token_offset,
                         "Alternation at offset {} is not inside a group",
                         token_offset);
    }

    auto &frame = m_open_groups.back();
    if (frame.alternative_index.has_value()) {
      throw CompileError(CompileErrorKind::double_alternation, token_offset,
                         "Second alternation in group opened at offset {} "
                         "(at offset {})",
                         frame.pattern_offset, token_offset);
    }
    frame.alternative_index = m_nodes.size();
  }

  auto close_group(size_t token_offset) -> void {
    if (m_open_groups.empty()) {
      throw CompileError(CompileErrorKind::stray_group_close, token_offset,
                         "Unmatched ')' at offset {}", token_offset);
    }

    auto const frame = m_open_groups.back();
    m_open_groups.pop_back();

    size_t const split = frame.alternative_index.value_or(m_nodes.size());
    auto const group_begin =
        m_nodes.begin() + static_cast<std::ptrdiff_t>(frame.start_index);
    auto const split_point =
        m_nodes.begin() + static_cast<std::ptrdiff_t>(split);

    MatcherNode::Group group;
    group.left.assign(std::make_move_iterator(group_begin),
                      std::make_move_iterator(split_point));
    group.right.assign(std::make_move_iterator(split_point),
                       std::make_move_iterator(m_nodes.end()));
    m_nodes.erase(group_begin, m_nodes.end());

    m_closed_groups += 1;
    group.number = m_closed_groups;
    m_nodes.push_back(MatcherNode{std::move(group)});
  }

  auto add_node(MatcherNode node, size_t token_offset) -> void {
    if (auto const *reference =
            std::get_if<MatcherNode::Backreference>(&node.type)) {
      if (reference->group_number == 0 ||
          reference->group_number > m_closed_groups) {
        throw CompileError(
            CompileErrorKind::invalid_backreference, token_offset,
            "Backreference \\{} at offset {} refers to an undefined group "
            "({} closed so far)",
            reference->group_number, token_offset, m_closed_groups);
      }
    }
    m_nodes.push_back(std::move(node));
  }

  std::vector<MatcherNode> m_nodes;
  std::vector<GroupFrame> m_open_groups;
  size_t m_closed_groups = 0;
  bool m_anchored_start = false;
  bool m_anchored_end = false;
};
} // namespace

auto minire::compile(std::string_view pattern) -> Expression {
  Cursor cursor{.text = pattern, .offset = 0};
  ExpressionBuilder builder;

  while (not cursor.is_at_end()) {
    size_t const token_offset = cursor.offset;
    builder.add(next_token(cursor), token_offset);
  }
  return std::move(builder).finish();
}
