#pragma once

#include <format>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace spellex {
inline constexpr std::string_view version = "1.0";

class SpellexError : public std::runtime_error {
public:
  template <typename... T>
  explicit constexpr SpellexError(std::string_view fmt_string, T &&...args)
      : std::runtime_error(std::vformat(
            fmt_string, std::make_format_args(args...))) {}
};

class UnmatchedParenError : public SpellexError {
public:
  using SpellexError::SpellexError;
};

class UnmatchedBraceError : public SpellexError {
public:
  using SpellexError::SpellexError;
};

class InvalidPlaceholderError : public SpellexError {
public:
  using SpellexError::SpellexError;
};

struct Options {
  // Accented letters also match their unaccented base letter (á -> [aAáÁ])
  bool accent_insensitive = true;
};

// Compiles one text into a pattern. Offsets in error messages are code point
// offsets into `text`.
auto build(std::string_view text, Options const &options = {}) -> std::string;

// Compiles `text1` and, if given, `text2`. Two texts are joined as
// (?:p1)|(?:p2).
auto generate(std::string_view text1,
              std::optional<std::string_view> text2 = std::nullopt,
              Options const &options = {}) -> std::string;

// Writes a segment-by-segment trace of compiling `text`, then the pattern.
auto explain(std::ostream &, std::string_view text, Options const &options = {})
    -> void;
} // namespace spellex
