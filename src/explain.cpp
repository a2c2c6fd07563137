#include "spellex/spellex.hpp"

#include "private/segmenter.hpp"
#include "private/unicode.hpp"

#include <ostream>
#include <span>
#include <print>
#include <string>

using namespace spellex;

namespace {
auto pretty_format(std::span<Codepoint const> source) -> std::string {
  std::string output;
  for (auto codepoint : source) {
    codepoint_to_utf8(output, codepoint);
  }
  return output;
}
} // namespace

auto spellex::explain(std::ostream &output, std::string_view text,
                      Options const &options) -> void {
  auto const codepoints = decode_utf8(text);
  Scope const scope{.text = codepoints, .origin = 0};

  // Top-level segments only, groups and placeholders show their compiled
  // contents
  std::string pattern;
  for_each_segment(scope, options, [&](size_t cursor, Segment next_segment) {
    auto source = scope.text.subspan(cursor, next_segment.next - cursor);
    std::println(output, "{}-{} {} '{}' -> {}", cursor, next_segment.next,
                 to_string(next_segment.kind), pretty_format(source),
                 next_segment.fragment);
    pattern += next_segment.fragment;
  });
  std::println(output, "pattern: {}", pattern);
}
