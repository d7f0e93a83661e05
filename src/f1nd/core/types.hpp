#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace f1nd {

// start index of the first occurrence, in element units; nullopt when absent
using match = std::optional<size_t>;

// border_table[i] is the longest proper border of the first i pattern elements
using border_table = std::vector<size_t>;

// shift distance per byte value, rightmost occurrence wins
using bad_char_table = std::array<size_t, 256>;

// when a pattern handle builds its search tables
enum class table_policy {
  lazy, // on first search that needs the table
  eager // at construction
};

} // namespace f1nd
