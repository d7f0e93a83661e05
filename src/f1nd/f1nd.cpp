#include "f1nd.hpp"
#include "utils/env_config.hpp"
#include <redlog.hpp>
#include <span>

namespace f1nd {

namespace {

std::span<const uint8_t> as_bytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

// decodes both arguments, logging and returning false on malformed input
bool decode_pair(
    std::string_view pattern, std::string_view text, std::u32string& pattern_out, std::u32string& text_out
) {
  auto decoded_pattern = utils::decode_utf8(pattern);
  auto decoded_text = utils::decode_utf8(text);
  if (!decoded_pattern.ok() || !decoded_text.ok()) {
    auto log = redlog::get_logger("f1nd.text_search");
    const status& failed = decoded_pattern.ok() ? decoded_text.status_info : decoded_pattern.status_info;
    log.wrn(
        "cannot search malformed utf-8", redlog::field("argument", decoded_pattern.ok() ? "text" : "pattern"),
        redlog::field("error", failed.message)
    );
    return false;
  }
  pattern_out = std::move(decoded_pattern.value);
  text_out = std::move(decoded_text.value);
  return true;
}

} // namespace

config config::from_environment() {
  utils::env_config env("F1ND");

  config cfg;
  cfg.debug_level = env.get<int>("DEBUG", 0);
  cfg.policy = env.get_enum<table_policy>(
      {{"lazy", table_policy::lazy}, {"eager", table_policy::eager}}, "TABLE_POLICY", table_policy::lazy
  );
  return cfg;
}

void configure_logging(const config& cfg) {
  if (cfg.debug_level <= 0) {
    return;
  }

  // map debug levels: 1=info, 2=verbose, 3=trace, 4+=pedantic
  redlog::level log_level = redlog::level::info;
  switch (cfg.debug_level) {
  case 1:
    log_level = redlog::level::info;
    break;
  case 2:
    log_level = redlog::level::verbose;
    break;
  case 3:
    log_level = redlog::level::trace;
    break;
  default:
    log_level = redlog::level::pedantic;
    break;
  }
  redlog::set_level(log_level);

  auto log = redlog::get_logger("f1nd.config");
  log.dbg("logging configured", redlog::field("debug_level", cfg.debug_level));
}

match linear_search(std::string_view pattern, std::string_view text) {
  std::u32string pattern_chars;
  std::u32string text_chars;
  if (!decode_pair(pattern, text, pattern_chars, text_chars)) {
    return std::nullopt;
  }
  return engine::linear_search<char32_t>(pattern_chars, text_chars);
}

match kmp_search(std::string_view pattern, std::string_view text) {
  std::u32string pattern_chars;
  std::u32string text_chars;
  if (!decode_pair(pattern, text, pattern_chars, text_chars)) {
    return std::nullopt;
  }
  return engine::kmp_search<char32_t>(pattern_chars, text_chars);
}

match bmh_search(std::string_view pattern, std::string_view text) {
  return engine::bmh_search(as_bytes(pattern), as_bytes(text));
}

result<pattern> make_pattern(std::string_view text, table_policy policy) {
  auto decoded = utils::decode_utf8(text);
  if (!decoded.ok()) {
    return error_result<pattern>(decoded.status_info.code, decoded.status_info.message);
  }
  return ok_result(pattern(decoded.value, policy));
}

result<pattern> make_pattern(std::string_view text) { return make_pattern(text, config::from_environment().policy); }

byte_pattern make_byte_pattern(std::string_view bytes, table_policy policy) {
  return byte_pattern(as_bytes(bytes), policy);
}

byte_pattern make_byte_pattern(std::string_view bytes) {
  return make_byte_pattern(bytes, config::from_environment().policy);
}

result<byte_pattern> make_byte_pattern_from_hex(std::string_view hex, table_policy policy) {
  auto parsed = utils::parse_hex_bytes(hex);
  if (!parsed.ok()) {
    return error_result<byte_pattern>(parsed.status_info.code, parsed.status_info.message);
  }
  return ok_result(byte_pattern(parsed.value, policy));
}

} // namespace f1nd
