#pragma once

/** \file csv_writer.hpp
 *  \brief Streaming CSV encoder: comma delimited, header row, UTF-8, RFC 4180 quoting.
 *
 * Rows are written as they arrive; nothing is buffered beyond the stream.
 * NULL cells are empty fields, booleans are true/false.
 */

#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "grainguard/engine/query_engine.hpp"

namespace grainguard::exporting {

/** \brief Quote a field when it holds the delimiter, a quote, CR/LF or edge blanks. */
auto csv_escape(std::string_view field, char delimiter = ',') -> std::string;

class csv_writer final : public engine::row_sink {
public:
  explicit csv_writer(std::ostream& out, char delimiter = ',') : out_(out), delimiter_(delimiter) {}

  auto begin(std::span<const std::string> columns) -> std::expected<void, core::error> override;
  auto row(std::span<const cell_value> cells) -> std::expected<void, core::error> override;
  auto finish() -> std::expected<void, core::error> override;

private:
  auto check() const -> std::expected<void, core::error>;

  std::ostream& out_;
  char delimiter_;
  std::string line_;
};

} // namespace grainguard::exporting
