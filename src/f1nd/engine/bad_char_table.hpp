#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <span>

namespace f1nd::engine {

// horspool shift table: every byte maps to m, a byte present in the pattern
// maps to m - 1 - i for its rightmost position i
bad_char_table build_bad_char_table(std::span<const uint8_t> pattern);

} // namespace f1nd::engine
