#pragma once

#include "spellex/spellex.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace spellex {
struct Codepoint {
  unsigned value;

  constexpr auto operator==(Codepoint const &) const -> bool = default;

  static constexpr auto invalid_sentinel() -> Codepoint { return {0xfffdU}; };
};

// Decodes the character starting at text[offset] and advances offset past it.
// A truncated or malformed sequence consumes one byte and yields U+FFFD.
constexpr auto parse_utf8_char(std::string_view text, size_t &offset)
    -> Codepoint {
  auto byte_at = [&](size_t index) -> unsigned {
    return (uint8_t)text[index];
  };

  unsigned first_byte = byte_at(offset);
  if ((first_byte & 0x80U) == 0U) [[likely]] {
    // ASCII range
    offset += 1;
    return {first_byte};
  }

  size_t length;
  unsigned value;
  if ((first_byte & 0xe0U) == 0xc0U) {
    length = 2;
    value = first_byte & 0x1fU;
  } else if ((first_byte & 0xf0U) == 0xe0U) {
    length = 3;
    value = first_byte & 0x0fU;
  } else if ((first_byte & 0xf8U) == 0xf0U) {
    length = 4;
    value = first_byte & 0x07U;
  } else {
    offset += 1;
    return Codepoint::invalid_sentinel();
  }

  if (offset + length > text.size()) {
    offset += 1;
    return Codepoint::invalid_sentinel();
  }

  for (size_t i = 1; i < length; i += 1) {
    unsigned next_byte = byte_at(offset + i);
    if ((next_byte & 0xc0U) != 0x80U) {
      offset += 1;
      return Codepoint::invalid_sentinel();
    }
    value = (value << 6U) + (next_byte & 0x3fU);
  }
  offset += length;

  // Surrogates and out of range values cannot be re-encoded
  if ((0xd800 <= value && value <= 0xdfff) || value > 0x10ffff) {
    return Codepoint::invalid_sentinel();
  }
  return {value};
}

constexpr auto decode_utf8(std::string_view text) -> std::vector<Codepoint> {
  std::vector<Codepoint> result;
  size_t offset = 0;
  while (offset < text.size()) {
    result.push_back(parse_utf8_char(text, offset));
  }
  return result;
}

constexpr auto codepoint_to_utf8(std::string &output, Codepoint codepoint)
    -> void {
  if (codepoint.value <= 0x7f) [[likely]] {
    output.push_back(codepoint.value);
    return;
  }

  if (codepoint.value <= 0x07ff) {
    output.push_back(0xc0 | ((codepoint.value >> 6) & 0x1f));
    output.push_back(0x80 | (codepoint.value & 0x3f));
    return;
  }

  if (codepoint.value <= 0xd7ff ||
      (0xe000 <= codepoint.value && codepoint.value <= 0xffff)) {
    output.push_back(0xe0 | ((codepoint.value >> 12) & 0x0f));
    output.push_back(0x80 | ((codepoint.value >> 6) & 0x3f));
    output.push_back(0x80 | (codepoint.value & 0x3f));
    return;
  }

  if (0x10000 <= codepoint.value && codepoint.value <= 0x10ffff) {
    output.push_back(0xf0 | ((codepoint.value >> 18) & 0x07));
    output.push_back(0x80 | ((codepoint.value >> 12) & 0x3f));
    output.push_back(0x80 | ((codepoint.value >> 6) & 0x3f));
    output.push_back(0x80 | (codepoint.value & 0x3f));
    return;
  }

  throw SpellexError("Cannot encode invalid codepoint {:x}", codepoint.value);
}

// Unicode properties (ICU, root locale)
auto is_letter(Codepoint codepoint) -> bool;     // General category L*
auto is_whitespace(Codepoint codepoint) -> bool; // White_Space property
auto to_lower(Codepoint codepoint) -> Codepoint;
auto to_upper(Codepoint codepoint) -> Codepoint;

// Canonically decomposes `codepoint` and drops the combining marks. Returns
// `codepoint` unchanged unless exactly one base character remains.
auto strip_accents(Codepoint codepoint) -> Codepoint;
} // namespace spellex
