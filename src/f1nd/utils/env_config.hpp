#pragma once

#include <redlog.hpp>
#include <initializer_list>
#include <string>
#include <utility>

namespace f1nd::utils {

// typed access to PREFIX_NAME environment variables
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  template <typename enum_type>
  enum_type get_enum(
      const std::initializer_list<std::pair<const char*, enum_type>>& mapping, const std::string& name,
      enum_type default_value
  ) const;

private:
  std::string prefix_;
  std::string build_env_name(const std::string& name) const;
  std::string get_env_value(const std::string& name) const;
  static std::string to_lower(const std::string& value);
  static std::string trim(const std::string& value);
};

template <typename enum_type>
enum_type env_config::get_enum(
    const std::initializer_list<std::pair<const char*, enum_type>>& mapping, const std::string& name,
    enum_type default_value
) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);

  for (const auto& pair : mapping) {
    if (to_lower(pair.first) == lower_value) {
      return pair.second;
    }
  }

  auto log = redlog::get_logger("f1nd.config");
  log.wrn("unknown value, using default", redlog::field("variable", build_env_name(name)), redlog::field("value", value));
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const;

} // namespace f1nd::utils
