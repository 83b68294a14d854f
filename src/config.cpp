#include "grainguard/config.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <system_error>

#include "grainguard/core/platform_utils.hpp"

namespace grainguard {

namespace {

auto parse_u64(const char* name, const std::string& text)
    -> std::expected<std::uint64_t, core::error> {
  std::uint64_t v{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return core::make_unexpected(core::error_code::config_invalid,
                                 std::string(name) + " must be a non-negative integer", "config.env");
  }
  return v;
}

} // namespace

auto validate(const engine_config& cfg) -> std::expected<void, core::error> {
  if (cfg.default_row_limit == 0 || cfg.max_row_limit == 0) {
    return core::make_unexpected(core::error_code::config_invalid,
                                 "row limits must be positive", "config.validate");
  }
  if (cfg.default_row_limit > cfg.max_row_limit) {
    return core::make_unexpected(core::error_code::config_invalid,
                                 "default row limit exceeds max row limit", "config.validate");
  }
  if (cfg.execution_timeout.count() < 0) {
    return core::make_unexpected(core::error_code::config_invalid,
                                 "execution timeout must not be negative", "config.validate");
  }
  return {};
}

auto load_config_from_env() -> std::expected<engine_config, core::error> {
  engine_config cfg{};
  if (auto v = core::safe_getenv("GRAINGUARD_INPUT_DIR"); v && !v->empty()) cfg.input_dir = *v;
  if (auto v = core::safe_getenv("GRAINGUARD_OUTPUT_DIR"); v && !v->empty()) cfg.output_dir = *v;
  if (auto v = core::safe_getenv("GRAINGUARD_EXEC_TIMEOUT_MS")) {
    auto ms = parse_u64("GRAINGUARD_EXEC_TIMEOUT_MS", *v);
    if (!ms) return std::unexpected(ms.error());
    cfg.execution_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(*ms));
  }
  if (auto v = core::safe_getenv("GRAINGUARD_ROW_LIMIT")) {
    auto n = parse_u64("GRAINGUARD_ROW_LIMIT", *v);
    if (!n) return std::unexpected(n.error());
    cfg.default_row_limit = static_cast<std::size_t>(*n);
  }
  if (auto v = core::safe_getenv("GRAINGUARD_MAX_ROW_LIMIT")) {
    auto n = parse_u64("GRAINGUARD_MAX_ROW_LIMIT", *v);
    if (!n) return std::unexpected(n.error());
    cfg.max_row_limit = static_cast<std::size_t>(*n);
  }
  cfg.debug = core::debug_enabled();
  if (auto ok = validate(cfg); !ok) return std::unexpected(ok.error());
  return cfg;
}

auto clamp_row_limit(const engine_config& cfg, std::size_t requested) -> std::size_t {
  if (requested == 0) return cfg.default_row_limit;
  return requested > cfg.max_row_limit ? cfg.max_row_limit : requested;
}

} // namespace grainguard
