#include "env_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>

namespace f1nd::utils {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? trim(value) : std::string();
}

std::string env_config::to_lower(const std::string& value) {
  std::string result = value;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

std::string env_config::trim(const std::string& value) {
  size_t first = value.find_first_not_of(' ');
  if (std::string::npos == first) {
    return std::string();
  }
  size_t last = value.find_last_not_of(' ');
  return value.substr(first, (last - first + 1));
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoi(value);
  } catch (const std::exception& e) {
    auto log = redlog::get_logger("f1nd.config");
    log.wrn(
        "failed to parse as int, using default", redlog::field("variable", build_env_name(name)),
        redlog::field("error", e.what())
    );
    return default_value;
  }
}

} // namespace f1nd::utils
