#pragma once

#include "core/result.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace f1nd::utils {

// byte pattern parsing, "48 89 e5" style; wildcards are not accepted
std::string strip_comments_hex_pattern(std::string_view pattern);
std::string normalize_hex_pattern(std::string_view pattern);
bool is_valid_hex_pattern(std::string_view pattern);
result<std::vector<uint8_t>> parse_hex_bytes(std::string_view pattern);

// hex digit helpers
bool is_hex_digit(char c);
uint8_t parse_hex_digit(char c);

// log rendering
std::string format_hex_bytes(const uint8_t* data, size_t size, size_t max_bytes = 16);

} // namespace f1nd::utils
