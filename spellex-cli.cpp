#include "spellex/spellex.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <ostream>
#include <print>
#include <string_view>
#include <vector>

using namespace std::literals;

namespace {
constexpr int exit_usage_or_input_error = 2;

constexpr auto usage =
    "usage: spellex [-h] [--version] [--keep-accents] [--explain] "
    "text1 [text2]"sv;

constexpr auto description = R"(
Generate a regex that matches any combination of uppercase/lowercase and
compresses repeats. Parentheses become optional (recursive), {digit/number}
placeholders match either side and accented letters also match their
unaccented counterparts.

positional arguments:
  text1           First word or sentence to convert into a regex (wrap in
                  quotes for multi-word).
  text2           Optional second word or sentence; if provided, the output
                  regex matches either input.

options:
  -h, --help      show this help message and exit
  --version       show program's version number and exit
  --keep-accents  accented letters only match themselves (á -> [áÁ])
  --explain       print how each part of the input was compiled to stderr
)"sv;

constexpr auto examples = R"(Examples:
  spellex Hello
  spellex "Good   job!!"
  spellex "colo(u)r"
  spellex "a(b(c)d)e"
  spellex "I have {2/two} cats"
  spellex "I have {2/two} cats" "Tengo {2/dos} gatos"
)"sv;

struct Arguments {
  std::vector<std::string_view> texts;
  spellex::Options options;
  bool explain = false;
  bool show_help = false;
  bool show_version = false;
};

auto parse_arguments(int argc, char *argv[]) -> std::optional<Arguments> {
  Arguments result;
  bool options_ended = false;
  for (int index = 1; index < argc; index += 1) {
    std::string_view argument = argv[index];
    if (options_ended || not argument.starts_with('-') || argument == "-") {
      result.texts.push_back(argument);
    } else if (argument == "--") {
      options_ended = true;
    } else if (argument == "-h" || argument == "--help") {
      result.show_help = true;
    } else if (argument == "--version") {
      result.show_version = true;
    } else if (argument == "--keep-accents") {
      result.options.accent_insensitive = false;
    } else if (argument == "--explain") {
      result.explain = true;
    } else {
      std::println(std::cerr, "{}\nspellex: error: unrecognized argument: {}",
                   usage, argument);
      return std::nullopt;
    }
  }

  if (result.show_help || result.show_version) {
    return result;
  }

  if (result.texts.empty()) {
    std::println(std::cerr,
                 "{}\nspellex: error: the following arguments are required: "
                 "text1",
                 usage);
    return std::nullopt;
  }
  if (result.texts.size() > 2) {
    std::println(std::cerr, "{}\nspellex: error: unrecognized argument: {}",
                 usage, result.texts[2]);
    return std::nullopt;
  }
  return result;
}
} // namespace

int main(int argc, char *argv[]) {
  auto arguments = parse_arguments(argc, argv);
  if (not arguments.has_value()) {
    return exit_usage_or_input_error;
  }

  if (arguments->show_help) {
    std::print("{}\n{}\n{}", usage, description, examples);
    return EXIT_SUCCESS;
  }
  if (arguments->show_version) {
    std::println("spellex {}", spellex::version);
    return EXIT_SUCCESS;
  }

  std::optional<std::string_view> text2;
  if (arguments->texts.size() == 2) {
    text2 = arguments->texts[1];
  }

  try {
    if (arguments->explain) {
      for (auto text : arguments->texts) {
        spellex::explain(std::cerr, text, arguments->options);
      }
    }
    std::println("{}", spellex::generate(arguments->texts[0], text2,
                                         arguments->options));
  } catch (spellex::SpellexError const &error) {
    std::println(std::cerr, "Error: {}", error.what());
    return exit_usage_or_input_error;
  }
  return EXIT_SUCCESS;
}
