#pragma once

#include "bad_char_table.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <span>

namespace f1nd::engine {

/**
 * @brief boyer-moore-horspool search over bytes
 *
 * compares each window right to left and on mismatch shifts by the table entry
 * of the text byte under the pattern's last position (at least one). an empty
 * pattern never matches.
 *
 * @param table must come from build_bad_char_table(pattern)
 */
match bmh_search(std::span<const uint8_t> pattern, std::span<const uint8_t> text, const bad_char_table& table);

match bmh_search(std::span<const uint8_t> pattern, std::span<const uint8_t> text);

} // namespace f1nd::engine
