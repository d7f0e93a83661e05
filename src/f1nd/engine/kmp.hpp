#pragma once

#include "border_table.hpp"
#include "core/types.hpp"
#include <concepts>
#include <cstddef>
#include <span>

namespace f1nd::engine {

// knuth-morris-pratt scan; borders must come from build_border_table(pattern)
template <std::equality_comparable element_type>
match kmp_search(
    std::span<const element_type> pattern, std::span<const element_type> text, const border_table& borders
) {
  const size_t pattern_len = pattern.size();
  const size_t text_len = text.size();
  if (pattern_len == 0) {
    return 0;
  }
  if (pattern_len > text_len || borders.size() != pattern_len + 1) {
    return std::nullopt;
  }

  // t is the candidate start, p the number of pattern elements matched at t
  size_t t = 0;
  size_t p = 0;
  while (t + p < text_len) {
    if (text[t + p] == pattern[p]) {
      ++p;
      if (p == pattern_len) {
        return t;
      }
    } else if (p == 0) {
      ++t;
    } else if (borders[p] >= p) {
      // not a border table of this pattern
      return std::nullopt;
    } else {
      t += p - borders[p];
      p = borders[p];
    }
  }

  return std::nullopt;
}

template <std::equality_comparable element_type>
match kmp_search(std::span<const element_type> pattern, std::span<const element_type> text) {
  return kmp_search(pattern, text, build_border_table(pattern));
}

} // namespace f1nd::engine
