#pragma once

#include "core/types.hpp"
#include <concepts>
#include <cstddef>
#include <span>

namespace f1nd::engine {

/**
 * @brief build the kmp failure function for a pattern
 *
 * entry i holds the length of the longest proper border (prefix that is also a
 * suffix) of the first i pattern elements. entries 0 and 1 are always 0. the
 * table has m + 1 entries, or none for an empty pattern.
 */
template <std::equality_comparable element_type> border_table build_border_table(std::span<const element_type> pattern) {
  const size_t pattern_len = pattern.size();
  if (pattern_len == 0) {
    return {};
  }

  border_table borders(pattern_len + 1, 0);
  for (size_t i = 2; i <= pattern_len; ++i) {
    size_t b = borders[i - 1];
    while (b != 0 && !(pattern[b] == pattern[i - 1])) {
      b = borders[b];
    }
    borders[i] = pattern[b] == pattern[i - 1] ? b + 1 : 0;
  }

  return borders;
}

} // namespace f1nd::engine
