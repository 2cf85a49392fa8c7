#pragma once

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace minire {

template <typename... Ts> struct Overload : Ts... {
  using Ts::operator()...;
};
template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

class RegexError : public std::runtime_error {
public:
  template <typename... T>
  explicit RegexError(std::format_string<T...> fmt_string, T &&...args)
      : std::runtime_error(
            std::format(fmt_string, std::forward<T>(args)...)) {}
};

enum class CompileErrorKind {
  malformed_pattern,
  unclosed_group,
  stray_group_close,
  double_alternation,
  invalid_backreference,
  dangling_quantifier,
  alternation_outside_group,
};

constexpr auto to_string(CompileErrorKind kind) -> std::string_view {
  switch (kind) {
  case CompileErrorKind::malformed_pattern:
    return "malformed pattern";
  case CompileErrorKind::unclosed_group:
    return "unclosed group";
  case CompileErrorKind::stray_group_close:
    return "stray group close";
  case CompileErrorKind::double_alternation:
    return "double alternation";
  case CompileErrorKind::invalid_backreference:
    return "invalid backreference";
  case CompileErrorKind::dangling_quantifier:
    return "dangling quantifier";
  case CompileErrorKind::alternation_outside_group:
    return "alternation outside group";
  }
  return "unknown error";
}

// Raised by `compile`, never by matching. `offset` is the position in the
// pattern of the token that could not be accepted.
class CompileError : public RegexError {
public:
  template <typename... T>
  CompileError(CompileErrorKind kind, size_t offset,
               std::format_string<T...> fmt_string, T &&...args)
      : RegexError(fmt_string, std::forward<T>(args)...), m_kind{kind},
        m_offset{offset} {}

  auto kind() const -> CompileErrorKind { return m_kind; }
  auto offset() const -> size_t { return m_offset; }

private:
  CompileErrorKind m_kind;
  size_t m_offset;
};
} // namespace minire
