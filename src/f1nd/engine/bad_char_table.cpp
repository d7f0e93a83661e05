#include "bad_char_table.hpp"
#include "utils/hex_pattern.hpp"
#include <redlog.hpp>

namespace f1nd::engine {

bad_char_table build_bad_char_table(std::span<const uint8_t> pattern) {
  const size_t pattern_len = pattern.size();

  bad_char_table table;
  table.fill(pattern_len);

  // later positions overwrite earlier ones
  for (size_t i = 0; i < pattern_len; ++i) {
    table[pattern[i]] = pattern_len - 1 - i;
  }

  if (static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::trace)) {
    auto log = redlog::get_logger("f1nd.bad_char_table");
    size_t distinct = 0;
    for (size_t shift : table) {
      if (shift != pattern_len) {
        ++distinct;
      }
    }
    log.trc(
        "built bad character table", redlog::field("pattern_size", pattern_len),
        redlog::field("pattern", utils::format_hex_bytes(pattern.data(), pattern_len)),
        redlog::field("distinct_bytes", distinct)
    );
  }

  return table;
}

} // namespace f1nd::engine
