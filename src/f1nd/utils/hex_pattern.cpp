#include "hex_pattern.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace f1nd::utils {

std::string strip_comments_hex_pattern(std::string_view pattern) {
  std::string result;
  std::istringstream stream{std::string(pattern)};
  std::string line;

  while (std::getline(stream, line)) {
    size_t comment_pos = std::string::npos;
    for (const char* marker : {"--", "//", "#", ";"}) {
      size_t pos = line.find(marker);
      if (pos != std::string::npos && pos < comment_pos) {
        comment_pos = pos;
      }
    }

    if (comment_pos != std::string::npos) {
      line = line.substr(0, comment_pos);
    }

    if (!result.empty() && !line.empty()) {
      result += " ";
    }
    result += line;
  }

  return result;
}

std::string normalize_hex_pattern(std::string_view pattern) {
  std::string stripped = strip_comments_hex_pattern(pattern);

  std::string result;
  result.reserve(stripped.length());

  for (char c : stripped) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      continue;
    }
    result.push_back(static_cast<char>(std::tolower(uc)));
  }

  return result;
}

bool is_hex_digit(char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }

uint8_t parse_hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  } else if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  } else if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return 0; // invalid
}

bool is_valid_hex_pattern(std::string_view pattern) {
  std::string normalized = normalize_hex_pattern(pattern);
  if (normalized.empty() || normalized.length() % 2 != 0) {
    return false;
  }
  return std::all_of(normalized.begin(), normalized.end(), is_hex_digit);
}

result<std::vector<uint8_t>> parse_hex_bytes(std::string_view pattern) {
  auto log = redlog::get_logger("f1nd.hex_pattern");

  std::string normalized = normalize_hex_pattern(pattern);
  if (normalized.empty()) {
    log.wrn("empty hex pattern");
    return error_result<std::vector<uint8_t>>(error_code::invalid_pattern, "empty hex pattern");
  }
  if (normalized.find('?') != std::string::npos) {
    log.err("wildcards are not supported", redlog::field("pattern", std::string(pattern)));
    return error_result<std::vector<uint8_t>>(error_code::invalid_pattern, "wildcards are not supported");
  }
  if (!is_valid_hex_pattern(normalized)) {
    log.err("invalid hex pattern", redlog::field("pattern", std::string(pattern)));
    return error_result<std::vector<uint8_t>>(error_code::invalid_pattern, "invalid hex pattern");
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(normalized.size() / 2);
  for (size_t i = 0; i < normalized.size(); i += 2) {
    uint8_t high = parse_hex_digit(normalized[i]);
    uint8_t low = parse_hex_digit(normalized[i + 1]);
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }

  return ok_result(std::move(bytes));
}

std::string format_hex_bytes(const uint8_t* data, size_t size, size_t max_bytes) {
  std::ostringstream oss;
  size_t display_size = std::min(size, max_bytes);

  for (size_t i = 0; i < display_size; i++) {
    oss << std::hex << std::setw(2) << std::setfill('0') << std::nouppercase << static_cast<int>(data[i]);
    if (i < display_size - 1) {
      oss << " ";
    }
  }

  if (size > max_bytes) {
    oss << " ... (+" << std::dec << (size - max_bytes) << " bytes)";
  }

  return oss.str();
}

} // namespace f1nd::utils
