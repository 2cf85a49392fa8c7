#pragma once

#include "common.hpp"
#include "expression.hpp"

#include <string_view>

namespace minire {
// Throws CompileError on any pattern it cannot accept.
auto compile(std::string_view pattern) -> Expression;
} // namespace minire
