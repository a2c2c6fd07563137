#include "spellex/spellex.hpp"

#include "testing.hpp"

#include <sstream>
#include <string>
#include <string_view>

using namespace std::literals;

namespace {
auto explained(std::string_view text,
               spellex::Options const &options = {}) -> std::string {
  std::ostringstream output;
  spellex::explain(output, text, options);
  return output.str();
}
} // namespace

TEST_CASE(explain_segments, "[spellex][explain]") {
  CHECK(explained("Hi!!") == "0-1 letter 'H' -> [hH]\n"
                             "1-2 letter 'i' -> [iI]\n"
                             "2-4 literal '!!' -> !{2}\n"
                             "pattern: [hH][iI]!{2}\n");

  CHECK(explained("colo(u)r  {2/two}") ==
        "0-1 letter 'c' -> [cC]\n"
        "1-2 letter 'o' -> [oO]\n"
        "2-3 letter 'l' -> [lL]\n"
        "3-4 letter 'o' -> [oO]\n"
        "4-7 group '(u)' -> (?:[uU])?\n"
        "7-8 letter 'r' -> [rR]\n"
        "8-10 whitespace '  ' -> \\s+\n"
        "10-17 placeholder '{2/two}' -> (?:2)|(?:[tT][wW][oO])\n"
        "pattern: [cC][oO][lL][oO](?:[uU])?[rR]\\s+(?:2)|(?:[tT][wW][oO])\n");
}

TEST_CASE(explain_offsets_are_codepoints, "[spellex][explain]") {
  CHECK(explained("éa") == "0-1 letter 'é' -> [eEéÉ]\n"
                           "1-2 letter 'a' -> [aA]\n"
                           "pattern: [eEéÉ][aA]\n");
  CHECK(explained("é", {.accent_insensitive = false}) ==
        "0-1 letter 'é' -> [éÉ]\n"
        "pattern: [éÉ]\n");
}

TEST_CASE(explain_matches_build, "[spellex][explain]") {
  for (auto text : {"I have {2/two} cats"sv, "a(b(c)d)e"sv, ""sv}) {
    auto trace = explained(text);
    CHECK(trace.ends_with("pattern: " + spellex::build(text) + "\n"));
  }
}

TEST_CASE(explain_reports_errors, "[spellex][explain][errors]") {
  CHECK_THROWS(explained("colo(u"), spellex::UnmatchedParenError);
  CHECK_THROWS(explained("{2 two}"), spellex::InvalidPlaceholderError);
}
