#include "spellex/spellex.hpp"

#include "private/segmenter.hpp"
#include "private/unicode.hpp"

#include <format>
#include <string_view>

using namespace spellex;

auto spellex::build(std::string_view text, Options const &options)
    -> std::string {
  auto const codepoints = decode_utf8(text);
  return build_scope({.text = codepoints, .origin = 0}, options);
}

auto spellex::generate(std::string_view text1,
                       std::optional<std::string_view> text2,
                       Options const &options) -> std::string {
  auto pattern1 = build(text1, options);
  if (not text2.has_value()) {
    return pattern1;
  }

  auto pattern2 = build(*text2, options);
  return std::format("(?:{})|(?:{})", pattern1, pattern2);
}
