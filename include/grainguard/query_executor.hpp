#pragma once

/** \file query_executor.hpp
 *  \brief Count previews, filtered exports and dataset browsing through the engine.
 *
 * Every call opens its own engine session, runs parameterized statements only
 * and releases the session before returning. Execution is bounded by
 * engine_config::execution_timeout and the caller's stop_token; both surface
 * as execution_failed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <ostream>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "grainguard/config.hpp"
#include "grainguard/dataset_store.hpp"
#include "grainguard/engine/query_engine.hpp"
#include "grainguard/error.hpp"
#include "grainguard/filter_expr.hpp"
#include "grainguard/value.hpp"

namespace grainguard {

struct preview_result {
  std::uint64_t matched_rows{0};
  std::chrono::milliseconds elapsed{0};
};

enum class export_format : std::uint8_t { csv, xlsx };

/** \brief "csv" | "xlsx" (case-insensitive); anything else is invalid_argument. */
auto parse_export_format(std::string_view token) -> std::expected<export_format, core::error>;
auto file_extension(export_format f) -> std::string_view;
auto media_type(export_format f) -> std::string_view;

/** \brief A written export file. */
struct export_artifact {
  std::filesystem::path path;      /**< <output_dir>/<dataset_id>_filtered.<ext> */
  std::string filename;            /**< suggested download name */
  std::string media_type;
  std::uint64_t rows{0};           /**< data rows, header excluded */
};

struct sample_result {
  std::vector<std::string> columns;
  std::vector<std::vector<cell_value>> rows;
  std::uint64_t total_rows{0};
};

class query_executor {
public:
  query_executor(engine::query_engine& engine, engine_config cfg);

  /** \brief Count rows matching \p predicate. Zero matches is a normal result. */
  auto run_preview(const dataset_handle& dataset, const compiled_predicate& predicate,
                   std::stop_token stop = {}) -> std::expected<preview_result, core::error>;

  /** \brief Describe, compile \p rules and count in one session. */
  auto preview_filtered(const dataset_handle& dataset, std::span<const filter_rule> rules,
                        combine_logic logic, std::stop_token stop = {})
      -> std::expected<preview_result, core::error>;

  /** \brief Encode all columns of the matching rows into \p out.
   *  \return number of data rows written
   */
  auto export_to(const dataset_handle& dataset, const compiled_predicate& predicate,
                 export_format format, std::ostream& out, std::stop_token stop = {})
      -> std::expected<std::uint64_t, core::error>;

  /** \brief Export to <output_dir>/<dataset_id>_filtered.<ext>; a failed export leaves no file. */
  auto run_export(const dataset_handle& dataset, const compiled_predicate& predicate,
                  export_format format, std::stop_token stop = {})
      -> std::expected<export_artifact, core::error>;

  /** \brief Describe, compile \p rules and export in one session. */
  auto export_filtered(const dataset_handle& dataset, std::span<const filter_rule> rules,
                       combine_logic logic, export_format format, std::stop_token stop = {})
      -> std::expected<export_artifact, core::error>;

  /** \brief First rows of the dataset plus its total row count. \p limit 0 means the default. */
  auto sample_rows(const dataset_handle& dataset, std::size_t limit, std::stop_token stop = {})
      -> std::expected<sample_result, core::error>;

  /** \brief Non-null distinct values of a schema column, ascending. */
  auto distinct_values(const dataset_handle& dataset, std::string_view column, std::size_t limit,
                       std::stop_token stop = {}) -> std::expected<std::vector<cell_value>, core::error>;

  const engine_config& config() const noexcept { return cfg_; }

private:
  auto options(std::stop_token stop) const -> engine::exec_options;
  auto count(engine::engine_session& session, const compiled_predicate& predicate,
             const engine::exec_options& opts) -> std::expected<std::uint64_t, core::error>;
  auto stream_export(engine::engine_session& session, const compiled_predicate& predicate,
                     export_format format, std::ostream& out, const engine::exec_options& opts)
      -> std::expected<std::uint64_t, core::error>;
  auto write_artifact(engine::engine_session& session, const dataset_handle& dataset,
                      const compiled_predicate& predicate, export_format format,
                      const engine::exec_options& opts) -> std::expected<export_artifact, core::error>;

  engine::query_engine& engine_;
  engine_config cfg_;
};

} // namespace grainguard
