#pragma once

/** \file sqlite_engine.hpp
 *  \brief query_engine backed by SQLite 3.
 *
 * Each session opens a private in-memory database, loads the dataset's
 * canonical CSV file into the relation "v" and closes the database when the
 * session is destroyed. Column types are inferred from the data:
 *
 * | values (non-null)                 | declared type |
 * |-----------------------------------|---------------|
 * | true/false (any case)             | BOOLEAN       |
 * | 64-bit integers                   | BIGINT        |
 * | finite decimals                   | DOUBLE        |
 * | ISO dates                         | DATE          |
 * | ISO date-times                    | TIMESTAMP     |
 * | anything else, or all NULL        | VARCHAR       |
 *
 * Columns without any NULL are declared NOT NULL. Empty header names become
 * column<N>; duplicates get a _<k> suffix.
 *
 * Timeouts and cancellation interrupt the VM through the progress handler.
 */

#include <expected>
#include <memory>

#include "grainguard/engine/query_engine.hpp"
#include "grainguard/io/csv_reader.hpp"

namespace grainguard::engine {

struct sqlite_engine_options {
  bool skip_malformed_rows{true};   /**< drop rows whose field count differs from the header */
  io::csv_limits csv{};             /**< reader limits */
  int progress_interval{1000};      /**< VM instructions between deadline checks */
};

class sqlite_engine final : public query_engine {
public:
  sqlite_engine();
  explicit sqlite_engine(sqlite_engine_options opts);

  auto open_session(const dataset_handle& dataset)
      -> std::expected<std::unique_ptr<engine_session>, core::error> override;

private:
  sqlite_engine_options opts_;
};

} // namespace grainguard::engine
