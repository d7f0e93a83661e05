#pragma once

#include <string_view>

// core types
#include "core/result.hpp"
#include "core/types.hpp"

// matchers and tables
#include "engine/bad_char_table.hpp"
#include "engine/bmh.hpp"
#include "engine/border_table.hpp"
#include "engine/kmp.hpp"
#include "engine/linear.hpp"
#include "engine/pattern_handle.hpp"

// utilities
#include "utils/hex_pattern.hpp"
#include "utils/utf8.hpp"

namespace f1nd {

using engine::basic_pattern;
using engine::byte_pattern;
using engine::pattern;

// runtime configuration read from F1ND_* environment variables
struct config {
  int debug_level = 0; // 0 = keep current level, 1 info, 2 verbose, 3 trace, 4 pedantic
  table_policy policy = table_policy::lazy;

  static config from_environment();
};

// apply the configured debug level to redlog
void configure_logging(const config& cfg);

/**
 * @brief string level searches
 *
 * linear_search and kmp_search decode both arguments as utf-8 and return an
 * index in unicode scalar values; malformed utf-8 is reported as not found.
 * bmh_search works on the raw bytes and returns a byte index. for text with
 * multi-byte characters the two index units differ.
 */
match linear_search(std::string_view pattern, std::string_view text);
match kmp_search(std::string_view pattern, std::string_view text);
match bmh_search(std::string_view pattern, std::string_view text);

// pattern handles built from strings; the single-argument forms use the
// table policy from the environment
result<pattern> make_pattern(std::string_view text, table_policy policy);
result<pattern> make_pattern(std::string_view text);
byte_pattern make_byte_pattern(std::string_view bytes, table_policy policy);
byte_pattern make_byte_pattern(std::string_view bytes);
result<byte_pattern> make_byte_pattern_from_hex(std::string_view hex, table_policy policy = table_policy::lazy);

} // namespace f1nd
