#pragma once

#include "minire/expression.hpp"

#include <cstddef>
#include <string_view>

namespace minire::evaluation {
struct Range {
  char lower;
  char upper;
};

constexpr auto is_in_range(char c, Range range) -> bool {
  return range.lower <= c && c <= range.upper;
}

constexpr auto is_digit(char c) -> bool { return is_in_range(c, {'0', '9'}); }

// ASCII only, independent of the C locale
constexpr auto is_word_char(char c) -> bool {
  return c == '_' || is_in_range(c, {'A', 'Z'}) ||
         is_in_range(c, {'a', 'z'}) || is_digit(c);
}

constexpr auto evaluate_condition(char c, MatcherNode::WordChar const &)
    -> bool {
  return is_word_char(c);
}

constexpr auto evaluate_condition(char c, MatcherNode::Digit const &) -> bool {
  return is_digit(c);
}

constexpr auto evaluate_condition(char, MatcherNode::Wildcard const &) -> bool {
  return true;
}

constexpr auto evaluate_condition(char c, MatcherNode::Literal const &literal)
    -> bool {
  return c == literal.value;
}

inline auto evaluate_condition(char c, MatcherNode::CharClass const &expression)
    -> bool {
  return expression.contains(c) != expression.is_complement;
}

constexpr auto sub_unchecked(std::string_view view, size_t start_index)
    -> std::string_view {
  return {view.data() + start_index, view.size() - start_index};
}
} // namespace minire::evaluation
