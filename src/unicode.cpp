#include "private/unicode.hpp"

#include <optional>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

using namespace spellex;

namespace {
constexpr auto to_icu(Codepoint codepoint) -> UChar32 {
  return static_cast<UChar32>(codepoint.value);
}

constexpr auto from_icu(UChar32 character) -> Codepoint {
  return {static_cast<unsigned>(character)};
}

auto nfd_normalizer() -> icu::Normalizer2 const & {
  UErrorCode status = U_ZERO_ERROR;
  auto const *normalizer = icu::Normalizer2::getNFDInstance(status);
  if (U_FAILURE(status) || normalizer == nullptr) {
    throw SpellexError("Cannot load NFD normalization data: {}",
                       u_errorName(status));
  }
  return *normalizer;
}
} // namespace

auto spellex::is_letter(Codepoint codepoint) -> bool {
  return u_isalpha(to_icu(codepoint)) != 0;
}

auto spellex::is_whitespace(Codepoint codepoint) -> bool {
  return u_isUWhiteSpace(to_icu(codepoint)) != 0;
}

auto spellex::to_lower(Codepoint codepoint) -> Codepoint {
  return from_icu(u_tolower(to_icu(codepoint)));
}

auto spellex::to_upper(Codepoint codepoint) -> Codepoint {
  return from_icu(u_toupper(to_icu(codepoint)));
}

auto spellex::strip_accents(Codepoint codepoint) -> Codepoint {
  icu::UnicodeString decomposition;
  if (not nfd_normalizer().getDecomposition(to_icu(codepoint),
                                            decomposition)) {
    return codepoint;
  }

  std::optional<Codepoint> base;
  for (int32_t index = 0; index < decomposition.length();
       index = decomposition.moveIndex32(index, 1)) {
    UChar32 character = decomposition.char32At(index);
    if (u_getCombiningClass(character) != 0) {
      continue;
    }
    if (base.has_value()) {
      // Several base characters (e.g. Hangul syllables), nothing to strip
      return codepoint;
    }
    base = from_icu(character);
  }
  return base.value_or(codepoint);
}
