#pragma once

#include <bitset>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace minire {
// A compiled pattern is a sequence of matcher nodes. Each node consumes a
// prefix of the remaining subject or fails; nodes never give characters back
// once they have matched.
struct MatcherNode {
  // ASCII predicates, each consumes exactly one character
  struct WordChar {};
  struct Digit {};
  struct Wildcard {};

  struct Literal {
    char value;
  };

  struct CharClass {
    // Indexed by the unsigned value of the subject byte
    std::bitset<256> members;
    // Bracket body as written, kept for printing
    std::string source;
    bool is_complement;

    auto contains(char c) const -> bool {
      return members.test(static_cast<unsigned char>(c));
    }
  };

  struct Repeat1 {
    std::unique_ptr<MatcherNode> inner;
  };

  struct Optional {
    std::unique_ptr<MatcherNode> inner;
  };

  // An empty `right` means the group had no alternation bar.
  struct Group {
    std::vector<MatcherNode> left;
    std::vector<MatcherNode> right;
    size_t number; // 1-based, in the order groups close in the pattern
  };

  struct Backreference {
    size_t group_number; // 1-based
  };

  using NodeVariant = std::variant<WordChar, Digit, Wildcard, Literal,
                                   CharClass, Repeat1, Optional, Group,
                                   Backreference>;
  NodeVariant type;
};

struct Expression {
  std::vector<MatcherNode> nodes;
  bool anchored_start;
  bool anchored_end;
  size_t group_count;
};

// One slot per group, indexed by group number - 1. A slot holds the text of
// the group's most recent match, or nothing if the group has not matched.
using CaptureList = std::vector<std::optional<std::string_view>>;
} // namespace minire
