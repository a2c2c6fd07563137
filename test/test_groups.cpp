#include "spellex/spellex.hpp"

#include "testing.hpp"

#include <string>
#include <string_view>

using namespace std::literals;

namespace {
auto error_message(std::string_view text) -> std::string {
  try {
    spellex::build(text);
  } catch (spellex::SpellexError const &error) {
    return error.what();
  }
  return "";
}
} // namespace

TEST_CASE(optional_group, "[spellex][groups]") {
  CHECK(spellex::build("colo(u)r") == R"([cC][oO][lL][oO](?:[uU])?[rR])");
  CHECK(spellex::build("(a)") == R"((?:[aA])?)");
  CHECK(spellex::build("()") == R"((?:)?)");
  CHECK(spellex::build("walk(ed)") == R"([wW][aA][lL][kK](?:[eE][dD])?)");
}

TEST_CASE(nested_groups, "[spellex][groups]") {
  CHECK(spellex::build("a(b(c)d)e") ==
        R"([aA](?:[bB](?:[cC])?[dD])?[eE])");
  CHECK(spellex::build("((a))") == R"((?:(?:[aA])?)?)");
  CHECK(spellex::build("x(y(z(w)))") ==
        R"([xX](?:[yY](?:[zZ](?:[wW])?)?)?)");
}

TEST_CASE(sibling_groups, "[spellex][groups]") {
  // Each group resolves its own ')' and never reaches into its sibling
  CHECK(spellex::build("(a)(b)") == R"((?:[aA])?(?:[bB])?)");
  CHECK(spellex::build("(a)b(c)") == R"((?:[aA])?[bB](?:[cC])?)");
  CHECK(spellex::build("(a(b))(c)") == R"((?:[aA](?:[bB])?)?(?:[cC])?)");
}

TEST_CASE(group_contents, "[spellex][groups]") {
  CHECK(spellex::build("good (old) days") ==
        R"([gG][oO]{2}[dD]\s+(?:[oO][lL][dD])?\s+[dD][aA][yY][sS])");
  CHECK(spellex::build("(very  good)") ==
        R"((?:[vV][eE][rR][yY]\s+[gG][oO]{2}[dD])?)");
  CHECK(spellex::build("(!!)") == R"((?:!{2})?)");

  // Runs stop at a group boundary
  CHECK(spellex::build("aa(a)") == R"([aA]{2}(?:[aA])?)");
}

TEST_CASE(unmatched_paren, "[spellex][groups][errors]") {
  CHECK_THROWS(spellex::build("colo(u"), spellex::UnmatchedParenError);
  CHECK_THROWS(spellex::build("("), spellex::UnmatchedParenError);
  CHECK_THROWS(spellex::build("a(b(c)d"), spellex::UnmatchedParenError);
  CHECK_THROWS(spellex::build("(a)(b"), spellex::UnmatchedParenError);
  CHECK_THROWS(spellex::generate("fine", "(broken"),
               spellex::UnmatchedParenError);
}

TEST_CASE(unmatched_paren_message, "[spellex][groups][errors]") {
  CHECK(error_message("colo(u") == "Unmatched '(' at offset 4");
  CHECK(error_message("(a)(b") == "Unmatched '(' at offset 3");

  // Offsets are reported against the whole text, also from nested groups
  CHECK(error_message("ab({(c/d})x)") == "Unmatched '(' at offset 4");
}
