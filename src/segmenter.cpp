#include "private/segmenter.hpp"
#include "private/unicode.hpp"

#include <algorithm>
#include <cassert>
#include <format>
#include <initializer_list>
#include <string_view>
#include <vector>

using namespace spellex;
using namespace std::string_view_literals;

namespace {
constexpr auto is_char(Codepoint codepoint, char c) -> bool {
  return codepoint.value == static_cast<unsigned char>(c);
}

// Characters that must be quoted to stand for themselves in a pattern
constexpr auto needs_escape(Codepoint codepoint) -> bool {
  constexpr auto special = "()[]{}?*+-|^$\\.&~# \t\n\r\v\f"sv;
  return codepoint.value < 0x80 &&
         special.contains(static_cast<char>(codepoint.value));
}

auto append_count(std::string &output, size_t count) -> void {
  if (count > 1) {
    output += std::format("{{{}}}", count);
  }
}

auto trim(Scope scope) -> Scope {
  size_t begin = 0;
  size_t end = scope.text.size();
  while (begin < end && is_whitespace(scope.text[begin])) {
    begin += 1;
  }
  while (end > begin && is_whitespace(scope.text[end - 1])) {
    end -= 1;
  }
  return scope.sub_scope(begin, end);
}

// [lower upper], preceded by the unaccented base letter's cases when accents
// are ignored. Never lists a character twice.
auto letter_class(Codepoint letter, Options const &options) -> std::string {
  std::vector<Codepoint> members;
  auto add_cases = [&](Codepoint codepoint) {
    for (auto variant : {to_lower(codepoint), to_upper(codepoint)}) {
      if (std::ranges::find(members, variant) == members.end()) {
        members.push_back(variant);
      }
    }
  };

  if (options.accent_insensitive) {
    auto base = strip_accents(letter);
    if (is_letter(base) && to_lower(base) != to_lower(letter)) {
      add_cases(base);
    }
  }
  add_cases(letter);

  std::string output = "[";
  for (auto member : members) {
    codepoint_to_utf8(output, member);
  }
  output += "]";
  return output;
}

auto segment_whitespace(Scope scope, size_t cursor) -> Segment {
  size_t end = cursor + 1;
  while (end < scope.text.size() && is_whitespace(scope.text[end])) {
    end += 1;
  }
  return {.kind = SegmentKind::whitespace, .fragment = R"(\s+)", .next = end};
}

auto segment_group(Scope scope, size_t cursor, Options const &options)
    -> Segment {
  size_t close = find_matching_close(scope, cursor);
  auto inner = build_scope(scope.sub_scope(cursor + 1, close), options);
  return {
      .kind = SegmentKind::group,
      .fragment = std::format("(?:{})?", inner),
      .next = close + 1,
  };
}

auto segment_placeholder(Scope scope, size_t cursor, Options const &options)
    -> Segment {
  size_t close = cursor + 1;
  while (close < scope.text.size() && not is_char(scope.text[close], '}')) {
    close += 1;
  }
  if (close >= scope.text.size()) {
    throw UnmatchedBraceError("Unmatched '{{' at offset {}; expected '}}' "
                              "closing placeholder {{digit/number}}",
                              scope.origin + cursor);
  }

  auto content = scope.sub_scope(cursor + 1, close);
  size_t separator = 0;
  while (separator < content.text.size() &&
         not is_char(content.text[separator], '/')) {
    separator += 1;
  }
  if (separator == content.text.size()) {
    throw InvalidPlaceholderError(
        "Invalid placeholder at offset {}; expected format {{digit/number}}",
        scope.origin + cursor);
  }

  // Each side is a text of its own: spaces, groups and repeats all apply
  auto left = build_scope(trim(content.sub_scope(0, separator)), options);
  auto right = build_scope(
      trim(content.sub_scope(separator + 1, content.text.size())), options);
  return {
      .kind = SegmentKind::placeholder,
      .fragment = std::format("(?:{})|(?:{})", left, right),
      .next = close + 1,
  };
}

auto segment_letter(Scope scope, size_t cursor, Options const &options)
    -> Segment {
  auto const letter = scope.text[cursor];
  auto const lower = to_lower(letter);

  // 'A' followed by 'a' is a single run
  size_t end = cursor + 1;
  while (end < scope.text.size() && is_letter(scope.text[end]) &&
         to_lower(scope.text[end]) == lower) {
    end += 1;
  }

  auto fragment = letter_class(letter, options);
  append_count(fragment, end - cursor);
  return {.kind = SegmentKind::letter, .fragment = fragment, .next = end};
}

auto segment_literal(Scope scope, size_t cursor) -> Segment {
  auto const literal = scope.text[cursor];

  // A stray ')' is always a run of one
  size_t end = cursor + 1;
  while (end < scope.text.size() && not is_char(literal, ')') &&
         scope.text[end] == literal) {
    end += 1;
  }

  std::string fragment;
  if (needs_escape(literal)) {
    fragment.push_back('\\');
  }
  codepoint_to_utf8(fragment, literal);
  append_count(fragment, end - cursor);
  return {.kind = SegmentKind::literal, .fragment = fragment, .next = end};
}
} // namespace

auto spellex::find_matching_close(Scope scope, size_t open_index) -> size_t {
  assert(is_char(scope.text[open_index], '('));

  size_t depth = 0;
  for (size_t index = open_index; index < scope.text.size(); index += 1) {
    if (is_char(scope.text[index], '(')) {
      depth += 1;
    } else if (is_char(scope.text[index], ')')) {
      depth -= 1;
      if (depth == 0) {
        return index;
      }
    }
  }
  throw UnmatchedParenError("Unmatched '(' at offset {}",
                            scope.origin + open_index);
}

auto spellex::segment(Scope scope, size_t cursor, Options const &options)
    -> Segment {
  assert(cursor < scope.text.size());
  auto const first = scope.text[cursor];

  if (is_whitespace(first)) {
    return segment_whitespace(scope, cursor);
  }
  if (is_char(first, '(')) {
    return segment_group(scope, cursor, options);
  }
  if (is_char(first, '{')) {
    return segment_placeholder(scope, cursor, options);
  }
  if (is_letter(first)) {
    return segment_letter(scope, cursor, options);
  }
  return segment_literal(scope, cursor);
}

auto spellex::build_scope(Scope scope, Options const &options) -> std::string {
  std::string pattern;
  for_each_segment(scope, options, [&](size_t, Segment next_segment) {
    pattern += next_segment.fragment;
  });
  return pattern;
}
