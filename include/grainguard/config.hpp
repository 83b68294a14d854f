#pragma once

/** \file config.hpp
 *  \brief Runtime knobs for dataset resolution, execution limits and diagnostics.
 *
 * Defaults are usable as-is; load_config_from_env() overlays GRAINGUARD_* variables.
 */

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>

#include "grainguard/error.hpp"

namespace grainguard {

struct engine_config {
  std::filesystem::path input_dir{"data/input"};    /**< canonical dataset files (<id>.csv) */
  std::filesystem::path output_dir{"data/output"};  /**< export artifacts */
  std::chrono::milliseconds execution_timeout{30000}; /**< 0 disables the deadline */
  std::size_t default_row_limit{200};  /**< sample/distinct limit when the caller gives none */
  std::size_t max_row_limit{1000};     /**< hard cap on any caller-supplied limit */
  bool debug{false};                   /**< mirrors GRAINGUARD_DEBUG */
};

/** \brief Reject zero limits and a default above the cap. */
auto validate(const engine_config& cfg) -> std::expected<void, core::error>;

/** \brief Defaults overlaid with GRAINGUARD_INPUT_DIR, GRAINGUARD_OUTPUT_DIR,
 *  GRAINGUARD_EXEC_TIMEOUT_MS, GRAINGUARD_ROW_LIMIT, GRAINGUARD_MAX_ROW_LIMIT and
 *  GRAINGUARD_DEBUG. Malformed numbers yield config_invalid.
 */
auto load_config_from_env() -> std::expected<engine_config, core::error>;

/** \brief Clamp a caller-supplied limit: 0 means default, anything above the cap is capped. */
auto clamp_row_limit(const engine_config& cfg, std::size_t requested) -> std::size_t;

} // namespace grainguard
