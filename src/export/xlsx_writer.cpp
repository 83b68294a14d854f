#include "grainguard/export/xlsx_writer.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>
#include <vector>

#include "grainguard/export/zip_writer.hpp"

namespace grainguard::exporting {

namespace {

constexpr std::string_view kContentTypes =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)" "\n"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
    R"(<Default Extension="xml" ContentType="application/xml"/>)"
    R"(<Override PartName="/xl/workbook.xml" ContentType="application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml"/>)"
    R"(<Override PartName="/xl/worksheets/sheet1.xml" ContentType="application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml"/>)"
    R"(</Types>)";

constexpr std::string_view kRootRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)" "\n"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="xl/workbook.xml"/>)"
    R"(</Relationships>)";

constexpr std::string_view kWorkbookRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)" "\n"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/sheet1.xml"/>)"
    R"(</Relationships>)";

auto workbook_xml(std::string_view sheet_name) -> std::string {
  std::string x;
  x += R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)" "\n";
  x += R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" )"
       R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)";
  x += R"(<sheets><sheet name=")";
  x += xml_escape(sheet_name);
  x += R"(" sheetId="1" r:id="rId1"/></sheets></workbook>)";
  return x;
}

auto string_cell(std::string& out, std::string_view ref, std::string_view text) -> void {
  out += R"(<c r=")";
  out += ref;
  out += R"(" t="inlineStr"><is><t xml:space="preserve">)";
  out += xml_escape(text);
  out += "</t></is></c>";
}

} // namespace

auto column_letters(std::size_t index) -> std::string {
  std::string s;
  ++index;
  while (index > 0) {
    const std::size_t rem = (index - 1) % 26;
    s.push_back(static_cast<char>('A' + rem));
    index = (index - 1) / 26;
  }
  std::reverse(s.begin(), s.end());
  return s;
}

auto xml_escape(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    switch (ch) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default:
        if (c < 0x20 && ch != '\t' && ch != '\n' && ch != '\r') break;
        out.push_back(ch);
    }
  }
  return out;
}

auto xlsx_writer::begin(std::span<const std::string> columns) -> std::expected<void, core::error> {
  sheet_data_.clear();
  rows_ = 0;
  std::vector<cell_value> header(columns.begin(), columns.end());
  return append_row(header);
}

auto xlsx_writer::row(std::span<const cell_value> cells) -> std::expected<void, core::error> {
  return append_row(cells);
}

auto xlsx_writer::append_row(std::span<const cell_value> cells) -> std::expected<void, core::error> {
  if (rows_ >= kXlsxMaxRows) {
    return core::make_unexpected(core::error_code::precondition_failed,
                                 "result exceeds the XLSX sheet row limit", "export.xlsx");
  }
  ++rows_;
  const std::string row_no = std::to_string(rows_);
  sheet_data_ += R"(<row r=")";
  sheet_data_ += row_no;
  sheet_data_ += R"(">)";
  for (std::size_t i = 0; i < cells.size(); ++i) {
    const std::string ref = column_letters(i) + row_no;
    std::visit([&](const auto& v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::monostate>) {
        // omitted
      } else if constexpr (std::is_same_v<T, std::string>) {
        string_cell(sheet_data_, ref, v);
      } else if constexpr (std::is_same_v<T, bool>) {
        sheet_data_ += R"(<c r=")" + ref + R"(" t="b"><v>)" + (v ? "1" : "0") + "</v></c>";
      } else {
        sheet_data_ += R"(<c r=")" + ref + R"("><v>)" + to_text(cell_value{v}) + "</v></c>";
      }
    }, cells[i]);
  }
  sheet_data_ += "</row>";
  return {};
}

auto xlsx_writer::finish() -> std::expected<void, core::error> {
  std::string sheet;
  sheet.reserve(sheet_data_.size() + 256);
  sheet += R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)" "\n";
  sheet += R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData>)";
  sheet += sheet_data_;
  sheet += "</sheetData></worksheet>";
  sheet_data_.clear();
  sheet_data_.shrink_to_fit();

  zip_writer zip(out_);
  if (auto r = zip.add_entry("[Content_Types].xml", kContentTypes); !r) return r;
  if (auto r = zip.add_entry("_rels/.rels", kRootRels); !r) return r;
  if (auto r = zip.add_entry("xl/workbook.xml", workbook_xml(sheet_name_)); !r) return r;
  if (auto r = zip.add_entry("xl/_rels/workbook.xml.rels", kWorkbookRels); !r) return r;
  if (auto r = zip.add_entry("xl/worksheets/sheet1.xml", sheet); !r) return r;
  return zip.finish();
}

} // namespace grainguard::exporting
