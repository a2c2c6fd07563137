#pragma once

#include "private/unicode.hpp"
#include "spellex/spellex.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace spellex {
enum class SegmentKind { whitespace, group, placeholder, letter, literal };

constexpr auto to_string(SegmentKind kind) -> std::string_view {
  switch (kind) {
  case SegmentKind::whitespace:
    return "whitespace";
  case SegmentKind::group:
    return "group";
  case SegmentKind::placeholder:
    return "placeholder";
  case SegmentKind::letter:
    return "letter";
  case SegmentKind::literal:
    return "literal";
  }
  return "unknown";
}

struct Segment {
  SegmentKind kind;
  std::string fragment;
  size_t next;
};

// The region being compiled. Indices are local to `text`; `origin` is the
// offset of text[0] in the user's text and is only used in error messages.
struct Scope {
  std::span<Codepoint const> text;
  size_t origin;

  constexpr auto sub_scope(size_t begin, size_t end) const -> Scope {
    return {.text = text.subspan(begin, end - begin), .origin = origin + begin};
  }
};

// Index of the ')' closing the '(' at `open_index`, searching only `scope`.
auto find_matching_close(Scope scope, size_t open_index) -> size_t;

// Classifies scope.text[cursor] and compiles the run starting there.
auto segment(Scope scope, size_t cursor, Options const &options) -> Segment;

template <typename Visitor>
auto for_each_segment(Scope scope, Options const &options, Visitor &&visitor)
    -> void {
  size_t cursor = 0;
  while (cursor < scope.text.size()) {
    auto next_segment = segment(scope, cursor, options);
    size_t next = next_segment.next;
    visitor(cursor, std::move(next_segment));
    cursor = next;
  }
}

auto build_scope(Scope scope, Options const &options) -> std::string;
} // namespace spellex
