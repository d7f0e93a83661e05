#pragma once

#include "bad_char_table.hpp"
#include "bmh.hpp"
#include "border_table.hpp"
#include "core/types.hpp"
#include "kmp.hpp"
#include "linear.hpp"
#include <redlog.hpp>
#include <concepts>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <type_traits>
#include <vector>

namespace f1nd::engine {

namespace detail {

inline bool pedantic_enabled() {
  return static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::pedantic);
}

inline bool trace_enabled() {
  return static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::trace);
}

inline size_t longest_border(const border_table& borders) {
  size_t longest = 0;
  for (size_t border : borders) {
    longest = border > longest ? border : longest;
  }
  return longest;
}

} // namespace detail

/**
 * @brief owned search pattern with memoized search tables
 *
 * each table is built at most once per handle, either on the first search that
 * needs it (table_policy::lazy) or during construction (table_policy::eager).
 * first-use construction is guarded by std::call_once, so a const handle can be
 * shared between threads. bmh is only available for byte patterns.
 */
template <std::equality_comparable element_type> class basic_pattern {
public:
  using value_type = element_type;

  basic_pattern() : basic_pattern(std::span<const element_type>{}) {}

  explicit basic_pattern(std::span<const element_type> elements, table_policy policy = table_policy::lazy)
      : elements_(elements.begin(), elements.end()), policy_(policy), cache_(std::make_unique<table_cache>()) {
    if (policy_ == table_policy::eager) {
      borders();
      if constexpr (std::is_same_v<element_type, uint8_t>) {
        bad_chars();
      }
    }
  }

  basic_pattern(const basic_pattern&) = delete;
  basic_pattern& operator=(const basic_pattern&) = delete;
  // a moved-from handle is left as an empty pattern with its own cache
  basic_pattern(basic_pattern&& other)
      : elements_(std::move(other.elements_)), policy_(other.policy_), cache_(std::move(other.cache_)) {
    other.reset();
  }

  basic_pattern& operator=(basic_pattern&& other) {
    if (this != &other) {
      elements_ = std::move(other.elements_);
      policy_ = other.policy_;
      cache_ = std::move(other.cache_);
      other.reset();
    }
    return *this;
  }

  std::span<const element_type> elements() const noexcept { return elements_; }
  size_t size() const noexcept { return elements_.size(); }
  bool empty() const noexcept { return elements_.empty(); }
  table_policy policy() const noexcept { return policy_; }

  match linear(std::span<const element_type> text) const { return linear_search(elements(), text); }

  match kmp(std::span<const element_type> text) const {
    match found = kmp_search(elements(), text, borders());
    if (detail::pedantic_enabled()) {
      auto log = redlog::get_logger("f1nd.pattern");
      log.ped(
          "kmp search", redlog::field("pattern_size", size()), redlog::field("text_size", text.size()),
          redlog::field("found", found.has_value())
      );
    }
    return found;
  }

  match bmh(std::span<const uint8_t> text) const
    requires std::same_as<element_type, uint8_t>
  {
    match found = bmh_search(elements(), text, bad_chars());
    if (detail::pedantic_enabled()) {
      auto log = redlog::get_logger("f1nd.pattern");
      log.ped(
          "bmh search", redlog::field("pattern_size", size()), redlog::field("text_size", text.size()),
          redlog::field("found", found.has_value())
      );
    }
    return found;
  }

  const border_table& borders() const {
    std::call_once(cache_->borders_once, [this] {
      cache_->borders = build_border_table(elements());
      if (detail::trace_enabled()) {
        auto log = redlog::get_logger("f1nd.pattern");
        log.trc(
            "built border table", redlog::field("pattern_size", size()),
            redlog::field("longest_border", detail::longest_border(cache_->borders))
        );
      }
    });
    return cache_->borders;
  }

  const bad_char_table& bad_chars() const
    requires std::same_as<element_type, uint8_t>
  {
    std::call_once(cache_->bad_chars_once, [this] { cache_->bad_chars = build_bad_char_table(elements()); });
    return cache_->bad_chars;
  }

private:
  void reset() {
    elements_.clear();
    cache_ = std::make_unique<table_cache>();
  }

  struct table_cache {
    std::once_flag borders_once;
    border_table borders;
    std::once_flag bad_chars_once;
    bad_char_table bad_chars{};
  };

  std::vector<element_type> elements_;
  table_policy policy_ = table_policy::lazy;
  std::unique_ptr<table_cache> cache_;
};

// unicode scalar value pattern, searched with linear and kmp
using pattern = basic_pattern<char32_t>;

// raw byte pattern, additionally searchable with bmh
using byte_pattern = basic_pattern<uint8_t>;

} // namespace f1nd::engine
