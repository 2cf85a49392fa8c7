#pragma once

#include "expression.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace minire {
// Searches `subject` for the first offset at which the whole expression
// matches. Only offset 0 is tried for a `^` pattern.
auto is_match(Expression const &expression, std::string_view subject) -> bool;

// Matches one node against the start of `tail`, returning how many characters
// it consumed. A group that matches stores its text in its `captures` slot.
auto match_node(MatcherNode const &node, std::string_view tail,
                CaptureList &captures) -> std::optional<size_t>;
} // namespace minire
