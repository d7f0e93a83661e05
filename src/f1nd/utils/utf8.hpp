#pragma once

#include "core/result.hpp"
#include <string>
#include <string_view>

namespace f1nd::utils {

// decode utf-8 into unicode scalar values; malformed input yields invalid_encoding
result<std::u32string> decode_utf8(std::string_view bytes);

// number of bytes in a well-formed utf-8 sequence starting with lead, or 0
size_t utf8_sequence_length(unsigned char lead) noexcept;

} // namespace f1nd::utils
