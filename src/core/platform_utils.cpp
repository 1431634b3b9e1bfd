#include "vectra/core/platform_utils.hpp"

#include <charconv>
#include <cmath>

namespace vectra::core {

auto parse_bool(std::string_view text) -> std::expected<bool, error> {
  if (text == "1" || text == "true" || text == "on" || text == "yes") return true;
  if (text == "0" || text == "false" || text == "off" || text == "no") return false;
  return make_unexpected(error_code::config_invalid,
                         "not a boolean: '" + std::string(text) + "'", "core.env");
}

auto parse_uint(std::string_view text) -> std::expected<std::uint64_t, error> {
  std::uint64_t v = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return make_unexpected(error_code::config_invalid,
                           "not an unsigned integer: '" + std::string(text) + "'", "core.env");
  }
  return v;
}

auto parse_float(std::string_view text) -> std::expected<float, error> {
  float v = 0.0f;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (text.empty() || ec != std::errc{} || ptr != last || !std::isfinite(v)) {
    return make_unexpected(error_code::config_invalid,
                           "not a finite number: '" + std::string(text) + "'", "core.env");
  }
  return v;
}

} // namespace vectra::core
