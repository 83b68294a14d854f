#include "grainguard/io/csv_reader.hpp"

#include <algorithm>
#include <utility>

namespace grainguard::io {

namespace {

constexpr const char* kComponent = "io.csv";

void trim_unquoted(csv_field& f) {
  if (f.quoted) return;
  const auto start = f.text.find_first_not_of(" \t");
  if (start == std::string::npos) { f.text.clear(); return; }
  const auto end = f.text.find_last_not_of(" \t");
  f.text = f.text.substr(start, end - start + 1);
}

auto only_blanks(const std::string& s) -> bool {
  return std::all_of(s.begin(), s.end(), [](char c) { return c == ' ' || c == '\t'; });
}

} // namespace

csv_reader::csv_reader(std::istream& in, char delimiter, csv_limits limits)
    : in_(&in), delimiter_(delimiter), limits_(limits) {}

csv_reader::csv_reader(std::unique_ptr<std::ifstream> owned, char delimiter, csv_limits limits)
    : owned_(std::move(owned)), in_(owned_.get()), delimiter_(delimiter), limits_(limits) {}

auto csv_reader::open(const std::filesystem::path& path, char delimiter, csv_limits limits)
    -> std::expected<csv_reader, core::error> {
  auto f = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*f) {
    return core::make_unexpected(core::error_code::io_failed, "Failed to open file for reading", kComponent);
  }
  return csv_reader(std::move(f), delimiter, limits);
}

auto csv_reader::next(std::vector<csv_field>& out) -> std::expected<bool, core::error> {
  if (!bom_checked_) {
    bom_checked_ = true;
    if (in_->peek() == 0xEF) {
      char bom[3]{};
      in_->read(bom, 3);
      if (!(static_cast<unsigned char>(bom[1]) == 0xBB && static_cast<unsigned char>(bom[2]) == 0xBF)) {
        return core::make_unexpected(core::error_code::schema_unavailable,
                                     "File starts with an invalid byte sequence", kComponent);
      }
    }
  }

  for (;;) {
    out.clear();
    if (in_->peek() == std::char_traits<char>::eof()) return false;
    record_line_ = line_;

    csv_field field{};
    bool in_quotes = false;
    bool record_done = false;
    char c{};
    while (!record_done && in_->get(c)) {
      if (in_quotes) {
        if (c == '"') {
          if (in_->peek() == '"') {
            in_->get(c);
            field.text.push_back('"');
          } else {
            in_quotes = false;
          }
        } else {
          if (c == '\n') ++line_;
          field.text.push_back(c);
        }
      } else if (c == delimiter_) {
        trim_unquoted(field);
        out.push_back(std::move(field));
        field = csv_field{};
      } else if (c == '\n' || c == '\r') {
        if (c == '\r' && in_->peek() == '\n') in_->get(c);
        ++line_;
        record_done = true;
      } else if (c == '"' && !field.quoted && only_blanks(field.text)) {
        field.text.clear();
        field.quoted = true;
        in_quotes = true;
      } else {
        field.text.push_back(c);
      }

      if (field.text.size() > limits_.max_field_bytes) {
        return core::make_unexpected(core::error_code::schema_unavailable,
                                     "Field exceeds size limit at line " + std::to_string(record_line_), kComponent);
      }
    }
    if (in_quotes) {
      return core::make_unexpected(core::error_code::schema_unavailable,
                                   "Unterminated quoted field starting at line " + std::to_string(record_line_),
                                   kComponent);
    }
    trim_unquoted(field);
    out.push_back(std::move(field));
    if (out.size() > limits_.max_columns) {
      return core::make_unexpected(core::error_code::schema_unavailable,
                                   "Too many columns at line " + std::to_string(record_line_), kComponent);
    }
    // blank line
    if (out.size() == 1 && out.front().is_null()) continue;
    return true;
  }
}

} // namespace grainguard::io
