#pragma once

#include "expression.hpp"

#include <ostream>
#include <string>

namespace minire {
auto format_pattern(Expression const &) -> std::string;
auto output_tree(std::ostream &, Expression const &) -> void;
} // namespace minire
