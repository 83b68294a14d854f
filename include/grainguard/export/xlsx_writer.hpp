#pragma once

/** \file xlsx_writer.hpp
 *  \brief Single-sheet Office Open XML workbook encoder.
 *
 * The sheet XML is accumulated in memory and the package is written on
 * finish(): an export's working set is proportional to its result size.
 * Strings are inline strings, numbers are numeric cells, booleans are
 * boolean cells and NULL cells are omitted. One header row ("Sheet1").
 */

#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "grainguard/engine/query_engine.hpp"

namespace grainguard::exporting {

/** \brief Maximum rows per sheet, header row included. */
inline constexpr std::uint64_t kXlsxMaxRows = 1048576;

/** \brief Spreadsheet column letters: 0 -> "A", 25 -> "Z", 26 -> "AA". */
auto column_letters(std::size_t index) -> std::string;

/** \brief Escape XML text; drops control characters XML 1.0 cannot carry. */
auto xml_escape(std::string_view text) -> std::string;

class xlsx_writer final : public engine::row_sink {
public:
  explicit xlsx_writer(std::ostream& out, std::string sheet_name = "Sheet1")
      : out_(out), sheet_name_(std::move(sheet_name)) {}

  auto begin(std::span<const std::string> columns) -> std::expected<void, core::error> override;
  auto row(std::span<const cell_value> cells) -> std::expected<void, core::error> override;
  auto finish() -> std::expected<void, core::error> override;

private:
  auto append_row(std::span<const cell_value> cells) -> std::expected<void, core::error>;

  std::ostream& out_;
  std::string sheet_name_;
  std::string sheet_data_;
  std::uint64_t rows_{0};
};

} // namespace grainguard::exporting
