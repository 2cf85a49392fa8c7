#include "minire/engine.hpp"
#include "minire/common.hpp"

#include "private/evaluation.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

using namespace minire;
using namespace minire::evaluation;

namespace {
auto match_sequence(std::span<MatcherNode const> nodes, std::string_view tail,
                    CaptureList &captures) -> std::optional<size_t> {
  size_t consumed = 0;
  for (auto const &node : nodes) {
    auto result = match_node(node, sub_unchecked(tail, consumed), captures);
    if (not result.has_value()) {
      return std::nullopt;
    }
    consumed += *result;
  }
  return consumed;
}

// Tries one side of a group. An empty side is a missing alternative and never
// matches. A failed attempt leaves every capture slot as it found it.
auto match_alternative(std::vector<MatcherNode> const &alternative,
                       std::string_view tail, CaptureList &captures)
    -> std::optional<size_t> {
  if (alternative.empty()) {
    return std::nullopt;
  }

  CaptureList const captures_before = captures;
  auto result = match_sequence(alternative, tail, captures);
  if (not result.has_value()) {
    captures = captures_before;
  }
  return result;
}

template <typename Predicate>
auto match_single(Predicate const &predicate, std::string_view tail)
    -> std::optional<size_t> {
  if (tail.empty() || not evaluate_condition(tail.front(), predicate)) {
    return std::nullopt;
  }
  return 1;
}

auto match_repeat(MatcherNode::Repeat1 const &repeat, std::string_view tail,
                  CaptureList &captures) -> std::optional<size_t> {
  size_t consumed = 0;
  size_t repetitions = 0;
  while (true) {
    auto result =
        match_node(*repeat.inner, sub_unchecked(tail, consumed), captures);
    if (not result.has_value()) {
      break;
    }
    repetitions += 1;
    consumed += *result;

    // A zero width repetition would match forever
    if (*result == 0) {
      break;
    }
  }

  if (repetitions == 0) {
    return std::nullopt;
  }
  return consumed;
}

auto match_group(MatcherNode::Group const &group, std::string_view tail,
                 CaptureList &captures) -> std::optional<size_t> {
  auto result = match_alternative(group.left, tail, captures);
  if (not result.has_value()) {
    result = match_alternative(group.right, tail, captures);
  }
  if (result.has_value()) {
    if (captures.size() < group.number) {
      captures.resize(group.number);
    }
    // A repeated group keeps only its latest match
    captures[group.number - 1] = tail.substr(0, *result);
  }
  return result;
}

auto match_backreference(MatcherNode::Backreference const &reference,
                         std::string_view tail, CaptureList const &captures)
    -> std::optional<size_t> {
  // The group may legitimately be unmatched, eg. `(a)?b\1` against "b"
  if (reference.group_number == 0 ||
      reference.group_number > captures.size() ||
      not captures[reference.group_number - 1].has_value()) {
    return std::nullopt;
  }

  auto const captured = *captures[reference.group_number - 1];
  if (not tail.starts_with(captured)) {
    return std::nullopt;
  }
  return captured.size();
}
} // namespace

auto minire::match_node(MatcherNode const &node, std::string_view tail,
                        CaptureList &captures) -> std::optional<size_t> {
  return std::visit(
      Overload{
          [&](MatcherNode::Repeat1 const &repeat) {
            return match_repeat(repeat, tail, captures);
          },
          [&](MatcherNode::Optional const &optional) {
            return std::optional<size_t>{
                match_node(*optional.inner, tail, captures).value_or(0)};
          },
          [&](MatcherNode::Group const &group) {
            return match_group(group, tail, captures);
          },
          [&](MatcherNode::Backreference const &reference) {
            return match_backreference(reference, tail, captures);
          },
          [&](auto const &predicate) { return match_single(predicate, tail); },
      },
      node.type);
}

auto minire::is_match(Expression const &expression, std::string_view subject)
    -> bool {
  size_t const last_offset = expression.anchored_start ? 0 : subject.size();
  for (size_t offset = 0; offset <= last_offset; offset += 1) {
    // Captures from a failed offset must not leak into the next one
    CaptureList captures(expression.group_count);
    auto consumed = match_sequence(expression.nodes,
                                   sub_unchecked(subject, offset), captures);
    if (not consumed.has_value()) {
      continue;
    }

    if (expression.anchored_end && offset + *consumed != subject.size()) {
      continue;
    }
    return true;
  }
  return false;
}
