#include "grainguard/export/csv_writer.hpp"

namespace grainguard::exporting {

auto csv_escape(std::string_view field, char delimiter) -> std::string {
  const bool needs_quotes =
      field.find_first_of(std::string{delimiter, '"', '\r', '\n'}) != std::string_view::npos ||
      (!field.empty() && (field.front() == ' ' || field.back() == ' ' ||
                          field.front() == '\t' || field.back() == '\t'));
  if (!needs_quotes) return std::string(field);
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

auto csv_writer::check() const -> std::expected<void, core::error> {
  if (!out_) {
    return core::make_unexpected(core::error_code::io_failed, "Failed to write CSV output", "export.csv");
  }
  return {};
}

auto csv_writer::begin(std::span<const std::string> columns) -> std::expected<void, core::error> {
  line_.clear();
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i) line_.push_back(delimiter_);
    line_ += csv_escape(columns[i], delimiter_);
  }
  line_.push_back('\n');
  out_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
  return check();
}

auto csv_writer::row(std::span<const cell_value> cells) -> std::expected<void, core::error> {
  line_.clear();
  for (std::size_t i = 0; i < cells.size(); ++i) {
    if (i) line_.push_back(delimiter_);
    if (!is_null(cells[i])) line_ += csv_escape(to_text(cells[i]), delimiter_);
  }
  line_.push_back('\n');
  out_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
  return check();
}

auto csv_writer::finish() -> std::expected<void, core::error> {
  out_.flush();
  return check();
}

} // namespace grainguard::exporting
