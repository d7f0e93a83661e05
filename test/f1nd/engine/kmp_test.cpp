#include <doctest/doctest.h>

#include "f1nd/engine/kmp.hpp"
#include "f1nd/test_helpers.hpp"

namespace {

using f1nd::engine::build_border_table;
using f1nd::engine::kmp_search;
using f1nd::test_helpers::chars;

} // namespace

TEST_CASE("kmp search finds the first occurrence in sample text") {
  for (const auto& sample : f1nd::test_helpers::k_sample_cases) {
    CAPTURE(sample.pattern);
    auto borders = build_border_table(chars(sample.pattern));
    CHECK(kmp_search(chars(sample.pattern), chars(f1nd::test_helpers::k_sample_text), borders) == sample.want);
  }
}

TEST_CASE("kmp search reuses a border table across texts") {
  auto borders = build_border_table(chars("abab"));
  CHECK(kmp_search(chars("abab"), chars("abacabab"), borders) == 4);
  CHECK(kmp_search(chars("abab"), chars("ababab"), borders) == 0);
  CHECK(kmp_search(chars("abab"), chars("aabab"), borders) == 1);
  CHECK_FALSE(kmp_search(chars("abab"), chars("abaabba"), borders).has_value());
}

TEST_CASE("kmp search shifts by the border after a partial match") {
  CHECK(kmp_search(chars("aab"), chars("aaab")) == 1);
  CHECK(kmp_search(chars("aabaa"), chars("aababaabaa")) == 5);
  CHECK(kmp_search(chars("ababaca"), chars("abababacaba")) == 2);
}

TEST_CASE("kmp search boundary policies") {
  SUBCASE("empty pattern matches at zero") {
    CHECK(kmp_search(chars(""), chars("abc")) == 0);
    CHECK(kmp_search(chars(""), chars("")) == 0);
  }

  SUBCASE("pattern longer than text") { CHECK_FALSE(kmp_search(chars("abcd"), chars("abc")).has_value()); }

  SUBCASE("pattern equal to the remaining text") {
    CHECK(kmp_search(chars("cd"), chars("abcd")) == 2);
    CHECK_FALSE(kmp_search(chars("cde"), chars("abcd")).has_value());
  }

  SUBCASE("table from another pattern is rejected") {
    auto borders = build_border_table(chars("ab"));
    CHECK_FALSE(kmp_search(chars("abc"), chars("xabc"), borders).has_value());
  }

  SUBCASE("table with an entry that is not a proper border is rejected") {
    f1nd::border_table bogus = {0, 0, 2, 3};
    CHECK_FALSE(kmp_search(chars("abc"), chars("abxabc"), bogus).has_value());
  }
}
