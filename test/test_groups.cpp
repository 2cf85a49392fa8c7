#include "minire/compiler.hpp"
#include "minire/engine.hpp"
#include "regex_test_common.hpp"
#include "testing.hpp"

#include <optional>
#include <string_view>

using namespace std::literals;

TEST_CASE(alternation, "[minire][groups]") {
  CHECK(does_match("(cat|dog)", "I have a dog"));
  CHECK(does_match("(cat|dog)", "I have a cat"));
  CHECK(!does_match("(cat|dog)", "I have a fish"));

  CHECK(does_match("^(cat|dog)s?$", "cats"));
  CHECK(does_match("^(cat|dog)s?$", "dog"));
  CHECK(!does_match("^(cat|dog)s?$", "cow"));
}

TEST_CASE(plain_group, "[minire][groups]") {
  CHECK(does_match("a(b)c", "abc"));
  CHECK(!does_match("a(b)c", "ac"));
  CHECK(does_match("^(ab)+c$", "ababc"));
  CHECK(does_match("(a|b)+", "abba"));
  CHECK(!does_match("^(a|b)+$", "abca"));
}

TEST_CASE(nested_groups, "[minire][groups]") {
  CHECK(does_match("(a(b|c)d)", "acd"));
  CHECK(does_match("(a(b|c)d)", "xabd"));
  CHECK(!does_match("(a(b|c)d)", "aed"));
  CHECK(does_match("^((a|b)(c|d))+$", "acbdad"));
}

TEST_CASE(empty_alternative_never_matches, "[minire][groups]") {
  CHECK(does_match("x(|a)y", "xay"));
  CHECK(!does_match("x(|a)y", "xy"));
  CHECK(!does_match("x(a|)y", "xy"));
  CHECK(!does_match("x()y", "xy"));
}

TEST_CASE(backreference, "[minire][groups]") {
  CHECK(does_match(R"(([abc]+)-\1)", "cab-cab"));
  CHECK(!does_match(R"(^([abc]+)-\1$)", "cab-abc"));
  // Searching finds "ab-ab" inside the subject
  CHECK(does_match(R"(([abc]+)-\1)", "cab-abc"));
  CHECK(!does_match(R"(([abc]+)-\1)", "cab-xyz"));

  CHECK(does_match(R"((\w+) and \1)", "cat and cat"));
  CHECK(!does_match(R"((\w+) and \1)", "cat and dog"));
}

TEST_CASE(multiple_backreferences, "[minire][groups]") {
  CHECK(does_match(R"((\d+)-(\w+) \1 \2)", "12-ab 12 ab"));
  CHECK(!does_match(R"(^(\d+)-(\w+) \1 \2$)", "12-ab ab 12"));
  CHECK(does_match(R"((a)(b)\2\1)", "abba"));
  CHECK(!does_match(R"((a)(b)\2\1)", "abab"));
}

TEST_CASE(groups_numbered_by_closing_order, "[minire][groups]") {
  // The inner group closes first, so it is group 1
  CHECK(does_match(R"(^((a)b)\1\2$)", "abaab"));
  CHECK(!does_match(R"(^((a)b)\1\2$)", "ababa"));
}

TEST_CASE(backreference_to_skipped_group, "[minire][groups]") {
  CHECK(!does_match(R"(^(a)?b\1$)", "b"));
  CHECK(does_match(R"(^(a)?b\1$)", "aba"));
}

TEST_CASE(zero_width_repetition_terminates, "[minire][groups]") {
  CHECK(does_match("^(a?)+b$", "b"));
  CHECK(does_match("^(a?)+b$", "aaab"));
}

TEST_CASE(backreference_to_group_after_skipped_group, "[minire][groups]") {
  CHECK(does_match(R"((a)?(b)\2)", "bb"));
  CHECK(does_match(R"(^(a)?(b)\2$)", "abb"));
  CHECK(!does_match(R"(^(a)?(b)\2$)", "ba"));
}

TEST_CASE(backreference_after_repeated_group, "[minire][groups]") {
  CHECK(does_match(R"(^(a)+(b)\2$)", "aabb"));
  CHECK(!does_match(R"(^(a)+(b)\2$)", "aaba"));
}

TEST_CASE(repeated_group_keeps_last_match, "[minire][groups]") {
  CHECK(does_match(R"(^(a|b)+-\1$)", "ab-b"));
  CHECK(!does_match(R"(^(a|b)+-\1$)", "ab-a"));
  CHECK(does_match(R"(^(\d)+=\1$)", "123=3"));
}

TEST_CASE(group_records_capture, "[minire][groups]") {
  auto const expression = minire::compile("(a(b)x|ab)");
  REQUIRE(expression.nodes.size() == 1);
  REQUIRE(expression.group_count == 2);

  // The left side captures "b" before failing on 'x', that capture is dropped
  minire::CaptureList captures(expression.group_count);
  auto consumed = minire::match_node(expression.nodes[0], "abc", captures);
  REQUIRE(consumed.has_value());
  CHECK(*consumed == 2);
  REQUIRE(captures.size() == 2);
  CHECK(not captures[0].has_value());
  CHECK(captures[1] == "ab"sv);
}

TEST_CASE(failed_group_leaves_captures_untouched, "[minire][groups]") {
  auto const expression = minire::compile("((a)b|(c)d)");
  REQUIRE(expression.nodes.size() == 1);
  REQUIRE(expression.group_count == 3);

  minire::CaptureList captures(expression.group_count);
  captures[1] = "earlier"sv;
  auto consumed = minire::match_node(expression.nodes[0], "ax", captures);
  CHECK(not consumed.has_value());
  REQUIRE(captures.size() == 3);
  CHECK(not captures[0].has_value());
  CHECK(captures[1] == "earlier"sv);
  CHECK(not captures[2].has_value());
}

TEST_CASE(captures_indexed_by_group_number, "[minire][groups]") {
  auto const expression = minire::compile("(x(y)(z))");
  REQUIRE(expression.nodes.size() == 1);

  minire::CaptureList captures(expression.group_count);
  auto consumed = minire::match_node(expression.nodes[0], "xyz!", captures);
  REQUIRE(consumed.has_value());
  CHECK(*consumed == 3);
  REQUIRE(captures.size() == 3);
  CHECK(captures[0] == "y"sv);
  CHECK(captures[1] == "z"sv);
  CHECK(captures[2] == "xyz"sv);
}

TEST_CASE(repeated_group_overwrites_its_slot, "[minire][groups]") {
  auto const expression = minire::compile("(a|b)+");
  REQUIRE(expression.nodes.size() == 1);

  minire::CaptureList captures(expression.group_count);
  auto consumed = minire::match_node(expression.nodes[0], "abba-", captures);
  REQUIRE(consumed.has_value());
  CHECK(*consumed == 4);
  REQUIRE(captures.size() == 1);
  CHECK(captures[0] == "a"sv);
}
