#pragma once

/** \file query_engine.hpp
 *  \brief Seam to the tabular query engine: sessions, statements, result sinks.
 *
 * One engine_session serves one unit of work (one request) and is released
 * when it goes out of scope; there is no process-wide connection. Sessions
 * are not thread-safe; independent sessions may run concurrently.
 *
 * Statements carry SQL text built only from fixed templates and quoted
 * identifiers; every caller value travels in \c parameters.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "grainguard/dataset_store.hpp"
#include "grainguard/error.hpp"
#include "grainguard/value.hpp"

namespace grainguard::engine {

/** \brief Column as the engine describes it, before type normalization. */
struct raw_column {
  std::string name;
  std::string declared_type;
  bool nullable{true};
};

/** \brief SQL text plus positional parameters. */
struct statement {
  std::string sql;
  std::vector<scalar_value> parameters;
};

/** \brief Per-call execution bounds. */
struct exec_options {
  std::chrono::milliseconds timeout{0}; /**< 0 = no deadline */
  std::stop_token stop;                 /**< caller-side cancellation */
};

/** \brief Calendar bucket for time-series analyses. */
enum class time_granularity : std::uint8_t { day, month };

/** \brief Receives a result set row by row. */
class row_sink {
public:
  virtual ~row_sink() = default;
  virtual auto begin(std::span<const std::string> columns) -> std::expected<void, core::error> = 0;
  virtual auto row(std::span<const cell_value> cells) -> std::expected<void, core::error> = 0;
  virtual auto finish() -> std::expected<void, core::error> = 0;
};

/** \brief Keeps the full result in memory (small results: counts, samples, aggregates). */
class collecting_sink final : public row_sink {
public:
  auto begin(std::span<const std::string> columns) -> std::expected<void, core::error> override {
    columns_.assign(columns.begin(), columns.end());
    return {};
  }
  auto row(std::span<const cell_value> cells) -> std::expected<void, core::error> override {
    rows_.emplace_back(cells.begin(), cells.end());
    return {};
  }
  auto finish() -> std::expected<void, core::error> override { return {}; }

  const std::vector<std::string>& columns() const noexcept { return columns_; }
  const std::vector<std::vector<cell_value>>& rows() const noexcept { return rows_; }
  std::vector<std::vector<cell_value>>& rows() noexcept { return rows_; }

private:
  std::vector<std::string> columns_;
  std::vector<std::vector<cell_value>> rows_;
};

/** \brief One connection to one dataset, scoped to one unit of work. */
class engine_session {
public:
  virtual ~engine_session() = default;

  /** \brief Ordered columns of the dataset relation. */
  virtual auto describe() -> std::expected<std::vector<raw_column>, core::error> = 0;

  /** \brief Quoted name of the dataset relation for FROM clauses. */
  virtual auto relation() const -> std::string_view = 0;

  /** \brief Run a statement and stream its rows into \p sink.
   *
   * \return number of rows delivered; execution_failed with a sanitized
   *         message on engine errors, timeout or cancellation. The result
   *         cursor is released on every path.
   */
  virtual auto execute(const statement& stmt, row_sink& sink, const exec_options& opts)
      -> std::expected<std::uint64_t, core::error> = 0;

  /** \brief Engine expression truncating \p quoted_column to a calendar bucket. */
  virtual auto time_bucket(std::string_view quoted_column, time_granularity g) const -> std::string = 0;
};

/** \brief Opens sessions against resolved datasets. */
class query_engine {
public:
  virtual ~query_engine() = default;

  /** \brief dataset_not_found if the file is gone; schema_unavailable if it cannot be parsed. */
  virtual auto open_session(const dataset_handle& dataset)
      -> std::expected<std::unique_ptr<engine_session>, core::error> = 0;
};

} // namespace grainguard::engine
