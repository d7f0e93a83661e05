#include <doctest/doctest.h>

#include "f1nd/engine/bad_char_table.hpp"
#include "f1nd/test_helpers.hpp"

#include <cstdint>
#include <random>
#include <string>

namespace {

using f1nd::engine::build_bad_char_table;
using f1nd::test_helpers::bytes;

} // namespace

TEST_CASE("bad character table keeps the rightmost occurrence") {
  auto table = build_bad_char_table(bytes("abca"));
  CHECK(table['a'] == 0);
  CHECK(table['c'] == 1);
  CHECK(table['b'] == 2);
  CHECK(table['d'] == 4);
  CHECK(table[0x00] == 4);
  CHECK(table[0xff] == 4);
}

TEST_CASE("bad character table degenerate patterns") {
  SUBCASE("empty pattern") {
    auto table = build_bad_char_table(bytes(""));
    for (size_t shift : table) {
      CHECK(shift == 0);
    }
  }

  SUBCASE("single byte") {
    auto table = build_bad_char_table(bytes("x"));
    CHECK(table['x'] == 0);
    CHECK(table['y'] == 1);
  }
}

TEST_CASE("bad character table handles high bytes") {
  const uint8_t raw[] = {0xff, 0x00, 0x80, 0xff};
  auto table = build_bad_char_table(raw);
  CHECK(table[0xff] == 0);
  CHECK(table[0x80] == 1);
  CHECK(table[0x00] == 2);
  CHECK(table[0x7f] == 4);
}

TEST_CASE("bad character table entries stay within pattern length") {
  std::mt19937 rng(42);
  for (int round = 0; round < 100; ++round) {
    std::string pattern = f1nd::test_helpers::random_string(rng, 12, "abcdef");
    auto table = build_bad_char_table(bytes(pattern));
    for (size_t b = 0; b < table.size(); ++b) {
      CHECK(table[b] <= pattern.size());
      size_t rightmost = pattern.find_last_of(static_cast<char>(b));
      if (rightmost == std::string::npos) {
        CHECK(table[b] == pattern.size());
      } else {
        CHECK(table[b] == pattern.size() - 1 - rightmost);
      }
    }
  }
}
