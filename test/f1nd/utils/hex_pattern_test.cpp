#include <doctest/doctest.h>

#include "f1nd/utils/hex_pattern.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

using f1nd::error_code;
using f1nd::utils::format_hex_bytes;
using f1nd::utils::is_valid_hex_pattern;
using f1nd::utils::normalize_hex_pattern;
using f1nd::utils::parse_hex_bytes;

} // namespace

TEST_CASE("hex pattern parsing handles valid byte patterns") {
  auto parsed = parse_hex_bytes("48 89 E5 90");
  REQUIRE(parsed.ok());
  CHECK(parsed.value == std::vector<uint8_t>{0x48, 0x89, 0xe5, 0x90});
}

TEST_CASE("hex pattern parsing strips whitespace and comments") {
  CHECK(normalize_hex_pattern("  48\t89 // mov\n e5 -- ebp\n90 # nop\nff ; end") == "4889e590ff");

  auto parsed = parse_hex_bytes("48 89 // mov rbp, rsp\ne5");
  REQUIRE(parsed.ok());
  CHECK(parsed.value.size() == 3);
}

TEST_CASE("hex pattern parsing rejects invalid patterns") {
  SUBCASE("empty") {
    auto parsed = parse_hex_bytes("  // nothing");
    CHECK_FALSE(parsed.ok());
    CHECK(parsed.status_info.code == error_code::invalid_pattern);
  }

  SUBCASE("odd digit count") { CHECK(parse_hex_bytes("48 8").status_info.code == error_code::invalid_pattern); }

  SUBCASE("non hex characters") { CHECK(parse_hex_bytes("zz 90").status_info.code == error_code::invalid_pattern); }

  SUBCASE("wildcards") {
    auto parsed = parse_hex_bytes("48 ?? e5");
    CHECK_FALSE(parsed.ok());
    CHECK(parsed.status_info.code == error_code::invalid_pattern);
    CHECK(parsed.status_info.message == "wildcards are not supported");
  }
}

TEST_CASE("hex pattern validation") {
  CHECK(is_valid_hex_pattern("deadBEEF"));
  CHECK_FALSE(is_valid_hex_pattern(""));
  CHECK_FALSE(is_valid_hex_pattern("de ad b"));
}

TEST_CASE("hex bytes formatting truncates long input") {
  std::vector<uint8_t> short_data = {0x00, 0x0a, 0xff};
  CHECK(format_hex_bytes(short_data.data(), short_data.size()) == "00 0a ff");

  std::vector<uint8_t> long_data(20, 0x90);
  std::string rendered = format_hex_bytes(long_data.data(), long_data.size());
  CHECK(rendered.rfind("90 90", 0) == 0);
  CHECK(rendered.find("... (+4 bytes)") != std::string::npos);

  CHECK(format_hex_bytes(nullptr, 0).empty());
}
