#include "result.hpp"

namespace f1nd {

const char* to_string(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_pattern:
    return "invalid_pattern";
  case error_code::invalid_encoding:
    return "invalid_encoding";
  }
  return "unknown";
}

} // namespace f1nd
