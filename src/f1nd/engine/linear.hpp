#pragma once

#include "core/types.hpp"
#include <concepts>
#include <cstddef>
#include <span>

namespace f1nd::engine {

// brute-force scan, baseline for the table driven matchers
template <std::equality_comparable element_type>
match linear_search(std::span<const element_type> pattern, std::span<const element_type> text) {
  const size_t pattern_len = pattern.size();
  const size_t text_len = text.size();
  if (pattern_len == 0) {
    return 0;
  }
  if (pattern_len > text_len) {
    return std::nullopt;
  }

  for (size_t start = 0; start + pattern_len <= text_len; ++start) {
    size_t i = 0;
    while (i < pattern_len && text[start + i] == pattern[i]) {
      ++i;
    }
    if (i == pattern_len) {
      return start;
    }
  }

  return std::nullopt;
}

} // namespace f1nd::engine
