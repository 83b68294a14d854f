#pragma once

/** \file csv_reader.hpp
 *  \brief Streaming RFC 4180 record reader for canonical dataset files.
 *
 * - Leading UTF-8 BOM is skipped.
 * - Quoted fields may contain delimiters, doubled quotes and line breaks.
 * - Records end at LF or CRLF; a final record without newline is accepted.
 * - Unquoted fields are trimmed of spaces/tabs; an unquoted empty field is NULL.
 *
 * Not thread-safe; one reader per stream.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "grainguard/error.hpp"

namespace grainguard::io {

struct csv_field {
  std::string text;
  bool quoted{false};

  /** \brief Unquoted and empty: no value at all. */
  auto is_null() const noexcept -> bool { return !quoted && text.empty(); }
};

struct csv_limits {
  std::size_t max_field_bytes{8u << 20};    /**< 8 MiB */
  std::size_t max_columns{20000};
};

class csv_reader {
public:
  /** \brief Read from an already-open stream (not owned). */
  explicit csv_reader(std::istream& in, char delimiter = ',', csv_limits limits = {});

  /** \brief Open a file; io_failed if it cannot be opened. */
  static auto open(const std::filesystem::path& path, char delimiter = ',', csv_limits limits = {})
      -> std::expected<csv_reader, core::error>;

  csv_reader(csv_reader&&) noexcept = default;
  csv_reader& operator=(csv_reader&&) noexcept = delete;
  csv_reader(const csv_reader&) = delete;
  csv_reader& operator=(const csv_reader&) = delete;

  /** \brief Read the next record into \p out.
   *
   * \return true if a record was read, false at end of input; malformed
   *         input (unterminated quote, limits) comes back as schema_unavailable.
   */
  auto next(std::vector<csv_field>& out) -> std::expected<bool, core::error>;

  /** \brief 1-based physical line where the last returned record started. */
  std::uint64_t record_line() const noexcept { return record_line_; }

private:
  csv_reader(std::unique_ptr<std::ifstream> owned, char delimiter, csv_limits limits);

  std::unique_ptr<std::ifstream> owned_;
  std::istream* in_;
  char delimiter_;
  csv_limits limits_;
  bool bom_checked_{false};
  std::uint64_t line_{1};
  std::uint64_t record_line_{0};
};

} // namespace grainguard::io
