#include "minire/compiler.hpp"
#include "minire/engine.hpp"
#include "minire/visualize.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <string_view>

using namespace std::literals;

namespace {
struct Options {
  std::string_view pattern;
  bool dump_tree;
};

auto parse_arguments(int argc, char *argv[]) -> std::optional<Options> {
  Options options{.pattern = {}, .dump_tree = false};
  bool has_pattern = false;

  for (int i = 1; i < argc; i += 1) {
    std::string_view const argument = argv[i];
    if (argument == "--dump"sv) {
      options.dump_tree = true;
    } else if (argument == "-E"sv && i + 1 < argc && not has_pattern) {
      options.pattern = argv[++i];
      has_pattern = true;
    } else {
      return std::nullopt;
    }
  }

  if (not has_pattern) {
    return std::nullopt;
  }
  return options;
}
} // namespace

// Usage: echo <input_text> | minigrep -E <pattern> [--dump]
int main(int argc, char *argv[]) {
  auto const options = parse_arguments(argc, argv);
  if (not options.has_value()) {
    std::println(std::cerr, "Usage: {} -E <pattern> [--dump]",
                 argc > 0 ? argv[0] : "minigrep");
    return EXIT_FAILURE;
  }

  std::string input_line;
  std::getline(std::cin, input_line);

  try {
    auto const expression = minire::compile(options->pattern);
    if (options->dump_tree) {
      minire::output_tree(std::cerr, expression);
    }
    return minire::is_match(expression, input_line) ? EXIT_SUCCESS
                                                    : EXIT_FAILURE;
  } catch (minire::CompileError const &error) {
    std::println(std::cerr, "Error: {} ({})", error.what(),
                 minire::to_string(error.kind()));
    return EXIT_FAILURE;
  }
}
