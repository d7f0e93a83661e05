#include "utf8.hpp"
#include <redlog.hpp>

namespace f1nd::utils {

namespace {

constexpr char32_t k_max_scalar = 0x10FFFF;
constexpr char32_t k_surrogate_first = 0xD800;
constexpr char32_t k_surrogate_last = 0xDFFF;

bool is_continuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

result<std::u32string> malformed(size_t offset, const char* reason) {
  auto log = redlog::get_logger("f1nd.utf8");
  log.dbg("malformed utf-8", redlog::field("offset", offset), redlog::field("reason", reason));
  return error_result<std::u32string>(
      error_code::invalid_encoding, std::string(reason) + " at byte " + std::to_string(offset)
  );
}

} // namespace

size_t utf8_sequence_length(unsigned char lead) noexcept {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  return 0;
}

result<std::u32string> decode_utf8(std::string_view bytes) {
  std::u32string decoded;
  decoded.reserve(bytes.size());

  size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    const size_t length = utf8_sequence_length(lead);
    if (length == 0) {
      return malformed(i, "invalid lead byte");
    }
    if (i + length > bytes.size()) {
      return malformed(i, "truncated sequence");
    }

    char32_t scalar = 0;
    switch (length) {
    case 1:
      scalar = lead;
      break;
    case 2:
      scalar = lead & 0x1F;
      break;
    case 3:
      scalar = lead & 0x0F;
      break;
    default:
      scalar = lead & 0x07;
      break;
    }

    for (size_t k = 1; k < length; ++k) {
      const auto byte = static_cast<unsigned char>(bytes[i + k]);
      if (!is_continuation(byte)) {
        return malformed(i + k, "missing continuation byte");
      }
      scalar = (scalar << 6) | (byte & 0x3F);
    }

    // shortest form only
    static constexpr char32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
    if (scalar < min_for_length[length]) {
      return malformed(i, "overlong encoding");
    }
    if (scalar >= k_surrogate_first && scalar <= k_surrogate_last) {
      return malformed(i, "surrogate code point");
    }
    if (scalar > k_max_scalar) {
      return malformed(i, "code point out of range");
    }

    decoded.push_back(scalar);
    i += length;
  }

  return ok_result(std::move(decoded));
}

} // namespace f1nd::utils
