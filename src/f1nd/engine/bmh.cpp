#include "bmh.hpp"

namespace f1nd::engine {

match bmh_search(std::span<const uint8_t> pattern, std::span<const uint8_t> text, const bad_char_table& table) {
  const size_t pattern_len = pattern.size();
  const size_t text_len = text.size();
  if (pattern_len == 0 || pattern_len > text_len) {
    return std::nullopt;
  }

  const size_t last = pattern_len - 1;
  size_t t = 0;
  while (t + pattern_len <= text_len) {
    size_t p = last;
    while (text[t + p] == pattern[p]) {
      if (p == 0) {
        return t;
      }
      --p;
    }

    // the pattern's own last byte stores 0
    size_t skip = table[text[t + last]];
    if (skip == 0) {
      skip = 1;
    }
    t += skip;
  }

  return std::nullopt;
}

match bmh_search(std::span<const uint8_t> pattern, std::span<const uint8_t> text) {
  if (pattern.empty()) {
    return std::nullopt;
  }
  return bmh_search(pattern, text, build_bad_char_table(pattern));
}

} // namespace f1nd::engine
