#pragma once

/** \file analysis.hpp
 *  \brief Fixed catalog of safe aggregate analyses and the gated runner.
 *
 * Analyses are deliberately narrow: fixed columns, fixed SQL templates, a
 * bounded set of parameters. Before anything executes, the analysis metric is
 * checked against the dataset's blacklist findings at the entry's nominal grain
 * and, when the rows are line items, at item grain; a block finding there rejects
 * the request with analysis_blocked. Warnings from every detected grain are kept.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "grainguard/blacklist.hpp"
#include "grainguard/config.hpp"
#include "grainguard/dataset_store.hpp"
#include "grainguard/engine/query_engine.hpp"
#include "grainguard/error.hpp"
#include "grainguard/grain.hpp"
#include "grainguard/schema.hpp"
#include "grainguard/value.hpp"

namespace grainguard {

enum class analysis_kind : std::uint8_t { time_trend, top_products, top_members, aov, new_vs_returning };

/** \brief One catalog entry. */
struct analysis_spec {
  analysis_kind kind;
  std::string_view key;          /**< stable request key, e.g. "time_trend" */
  std::string_view label;
  std::string_view description;
  std::string_view chart;        /**< "line" | "bar" | "pie" */
  std::string_view metric;       /**< column checked through the metric gate */
  std::string_view dimension;
  grain nominal_grain;            /**< grain the metric is aggregated at */
  std::span<const std::string_view> required_columns;
};

/** \brief All analyses in catalog order. */
auto analysis_catalog() -> std::span<const analysis_spec>;

auto find_analysis(std::string_view key) -> const analysis_spec*;

/** \brief Catalog entries whose required columns all exist. */
auto available_analyses(std::span<const column_descriptor> columns) -> std::vector<analysis_spec>;

struct analysis_request {
  std::string key;
  std::string granularity{"day"};  /**< time analyses only: "day" | "month" */
  std::int64_t limit{10};          /**< ranking analyses only; <= 0 means 10 */
};

/** \brief One output row: bucket/category and its value. */
struct analysis_point {
  cell_value key;
  cell_value value;
};

struct analysis_result {
  std::string key;
  std::string metric;
  std::string dimension;
  std::optional<std::string> granularity;
  std::optional<std::int64_t> limit;
  std::vector<analysis_point> points;
  std::vector<blacklist_finding> warnings;  /**< applicable warning findings */
};

/** \brief Gate and run one analysis on an open session.
 *
 * \return invalid_argument for an unknown key or granularity,
 *         precondition_failed for missing or mistyped columns,
 *         analysis_blocked when a block finding applies (nothing executes),
 *         execution_failed from the engine.
 */
auto run_analysis(engine::engine_session& session, const analysis_request& request,
                  std::span<const column_descriptor> columns,
                  std::span<const blacklist_finding> findings,
                  const engine_config& cfg, std::stop_token stop = {})
    -> std::expected<analysis_result, core::error>;

/** \brief Everything an inspection reports about a dataset. */
struct dataset_profile {
  std::vector<column_descriptor> columns;
  grain_set grains;
  std::vector<blacklist_finding> findings;
  std::vector<analysis_spec> available;
};

class analysis_runner {
public:
  analysis_runner(engine::query_engine& engine, engine_config cfg);

  /** \brief Describe, detect grains, derive findings and list available analyses. */
  auto inspect(const dataset_handle& dataset) -> std::expected<dataset_profile, core::error>;

  /** \brief Inspect and run \p request in a single session. */
  auto run(const dataset_handle& dataset, const analysis_request& request, std::stop_token stop = {})
      -> std::expected<analysis_result, core::error>;

private:
  engine::query_engine& engine_;
  engine_config cfg_;
};

} // namespace grainguard
