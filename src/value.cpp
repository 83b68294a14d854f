#include "grainguard/value.hpp"

#include <array>
#include <charconv>
#include <string>
#include <system_error>
#include <type_traits>

namespace grainguard {

auto format_double(double v) -> std::string {
  std::array<char, 64> buf{};
  auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
  if (ec != std::errc{}) return std::to_string(v);
  return std::string(buf.data(), ptr);
}

auto to_text(const scalar_value& v) -> std::string {
  return std::visit([](const auto& x) -> std::string {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::string>) {
      return x;
    } else if constexpr (std::is_same_v<T, double>) {
      return format_double(x);
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
      return std::to_string(x);
    } else {
      return x ? "true" : "false";
    }
  }, v);
}

auto to_text(const cell_value& v) -> std::string {
  return std::visit([](const auto& x) -> std::string {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      return {};
    } else if constexpr (std::is_same_v<T, bool>) {
      return x ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
      return std::to_string(x);
    } else if constexpr (std::is_same_v<T, double>) {
      return format_double(x);
    } else {
      return x;
    }
  }, v);
}

} // namespace grainguard
