#include <catch2/catch_all.hpp>
#include <grainguard/export/csv_writer.hpp>
#include <grainguard/export/xlsx_writer.hpp>
#include <grainguard/export/zip_writer.hpp>
#include <grainguard/io/csv_reader.hpp>

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "tests/support/zip_reader.hpp"

using namespace grainguard;
using namespace grainguard::exporting;

static std::uint32_t le32(const std::string& s, std::size_t off) {
  return static_cast<std::uint32_t>(static_cast<unsigned char>(s[off])) |
         (static_cast<std::uint32_t>(static_cast<unsigned char>(s[off + 1])) << 8) |
         (static_cast<std::uint32_t>(static_cast<unsigned char>(s[off + 2])) << 16) |
         (static_cast<std::uint32_t>(static_cast<unsigned char>(s[off + 3])) << 24);
}

static std::uint16_t le16(const std::string& s, std::size_t off) {
  return static_cast<std::uint16_t>(static_cast<unsigned char>(s[off]) |
                                    (static_cast<unsigned char>(s[off + 1]) << 8));
}

TEST_CASE("crc32 known vectors", "[zip]") {
  REQUIRE(crc32(std::string_view{}) == 0x00000000u);
  REQUIRE(crc32(std::string_view{"123456789"}) == 0xCBF43926u);
  REQUIRE(crc32(std::string_view{"The quick brown fox jumps over the lazy dog"}) == 0x414FA339u);
}

TEST_CASE("csv escape quoting rules", "[csv][export]") {
  REQUIRE(csv_escape("plain") == "plain");
  REQUIRE(csv_escape("a,b") == "\"a,b\"");
  REQUIRE(csv_escape("say \"x\"") == "\"say \"\"x\"\"\"");
  REQUIRE(csv_escape("two\nlines") == "\"two\nlines\"");
  REQUIRE(csv_escape(" pad") == "\" pad\"");
  REQUIRE(csv_escape("") == "");
}

TEST_CASE("csv writer output round-trips through the reader", "[csv][export]") {
  std::ostringstream out;
  csv_writer w(out);
  const std::vector<std::string> cols{"id", "note", "ok", "amount"};
  REQUIRE(w.begin(cols).has_value());
  std::vector<cell_value> r1{std::int64_t{1}, std::string("Smith, \"J\"\nline2"), true, 12.5};
  std::vector<cell_value> r2{std::int64_t{2}, std::monostate{}, false, 100.0};
  REQUIRE(w.row(r1).has_value());
  REQUIRE(w.row(r2).has_value());
  REQUIRE(w.finish().has_value());

  const auto text = out.str();
  REQUIRE(text.rfind("id,note,ok,amount\n", 0) == 0);
  REQUIRE(text.find("2,,false,100\n") != std::string::npos);

  std::istringstream in(text);
  io::csv_reader reader(in);
  std::vector<io::csv_field> rec;
  REQUIRE(reader.next(rec).value());
  REQUIRE(rec.size() == 4);
  REQUIRE(reader.next(rec).value());
  REQUIRE(rec[1].text == "Smith, \"J\"\nline2");
  REQUIRE(rec[2].text == "true");
  REQUIRE(rec[3].text == "12.5");
  REQUIRE(reader.next(rec).value());
  REQUIRE(rec[1].is_null());
  REQUIRE_FALSE(reader.next(rec).value());
}

TEST_CASE("csv writer reports stream failures", "[csv][export]") {
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  csv_writer w(out);
  const std::vector<std::string> cols{"a"};
  auto r = w.begin(cols);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::io_failed);
}

TEST_CASE("zip writer layout", "[zip]") {
  std::ostringstream out;
  zip_writer z(out);
  REQUIRE(z.add_entry("a.txt", "hello").has_value());
  REQUIRE(z.add_entry("dir/b.txt", "").has_value());
  REQUIRE(z.finish().has_value());
  REQUIRE_FALSE(z.add_entry("late.txt", "x").has_value());

  const auto s = out.str();
  REQUIRE(le32(s, 0) == 0x04034b50u);
  REQUIRE(le16(s, 8) == 8);               // deflate
  REQUIRE(le32(s, 14) == crc32(std::string_view{"hello"}));
  REQUIRE(le32(s, 22) == 5);              // uncompressed size
  REQUIRE(le16(s, 26) == 5);
  REQUIRE(s.substr(30, 5) == "a.txt");
  REQUIRE(s.find("hello") == std::string::npos);
  REQUIRE(test_support::read_zip_entry(s, "a.txt") == std::optional<std::string>{"hello"});
  REQUIRE(test_support::read_zip_entry(s, "dir/b.txt") == std::optional<std::string>{""});
  REQUIRE_FALSE(test_support::read_zip_entry(s, "c.txt").has_value());

  // end of central directory is the last 22 bytes (no comment)
  const auto eocd = s.size() - 22;
  REQUIRE(le32(s, eocd) == 0x06054b50u);
  REQUIRE(le16(s, eocd + 8) == 2);
  REQUIRE(le16(s, eocd + 10) == 2);
  const auto cd_size = le32(s, eocd + 12);
  const auto cd_offset = le32(s, eocd + 16);
  REQUIRE(cd_offset + cd_size == eocd);
  REQUIRE(le32(s, cd_offset) == 0x02014b50u);
  REQUIRE(le32(s, cd_offset + 42) == 0);  // first entry at offset 0
  REQUIRE(le16(s, cd_offset + 10) == 8);
  REQUIRE(le32(s, cd_offset + 20) == le32(s, 18));
}

TEST_CASE("zip entries are compressed", "[zip]") {
  std::string sheet;
  for (int i = 0; i < 2000; ++i) sheet += "<row r=\"" + std::to_string(i + 1) + "\"><c><v>42</v></c></row>";
  std::ostringstream out;
  zip_writer z(out);
  REQUIRE(z.add_entry("sheet.xml", sheet).has_value());
  REQUIRE(z.finish().has_value());
  const auto s = out.str();
  REQUIRE(le32(s, 18) < sheet.size() / 4);
  REQUIRE(le32(s, 22) == sheet.size());
  REQUIRE(s.size() < sheet.size() / 4);
  REQUIRE(test_support::read_zip_entry(s, "sheet.xml") == std::optional<std::string>{sheet});
}

TEST_CASE("xlsx helpers", "[xlsx]") {
  REQUIRE(column_letters(0) == "A");
  REQUIRE(column_letters(25) == "Z");
  REQUIRE(column_letters(26) == "AA");
  REQUIRE(column_letters(701) == "ZZ");
  REQUIRE(column_letters(702) == "AAA");
  REQUIRE(xml_escape("a<b & \"c\"") == "a&lt;b &amp; &quot;c&quot;");
  REQUIRE(xml_escape(std::string("x\x01y\tz")) == "xy\tz");
}

TEST_CASE("xlsx writer produces a single-sheet package", "[xlsx]") {
  std::ostringstream out;
  xlsx_writer w(out);
  const std::vector<std::string> cols{"id", "name", "ok"};
  REQUIRE(w.begin(cols).has_value());
  std::vector<cell_value> r1{std::int64_t{7}, std::string("R&D <team>"), true};
  std::vector<cell_value> r2{std::int64_t{8}, std::monostate{}, false};
  REQUIRE(w.row(r1).has_value());
  REQUIRE(w.row(r2).has_value());
  REQUIRE(w.finish().has_value());

  const auto s = out.str();
  REQUIRE(le32(s, 0) == 0x04034b50u);
  for (const char* part : {"[Content_Types].xml", "_rels/.rels", "xl/workbook.xml",
                           "xl/_rels/workbook.xml.rels", "xl/worksheets/sheet1.xml"}) {
    REQUIRE(test_support::read_zip_entry(s, part).has_value());
  }
  const auto workbook = test_support::read_zip_entry(s, "xl/workbook.xml").value();
  REQUIRE(workbook.find("<sheet name=\"Sheet1\"") != std::string::npos);
  const auto sheet = test_support::read_zip_entry(s, "xl/worksheets/sheet1.xml").value();
  REQUIRE(sheet.find("<c r=\"A1\" t=\"inlineStr\"><is><t xml:space=\"preserve\">id</t></is></c>") != std::string::npos);
  REQUIRE(sheet.find("<c r=\"A2\"><v>7</v></c>") != std::string::npos);
  REQUIRE(sheet.find("R&amp;D &lt;team&gt;") != std::string::npos);
  REQUIRE(sheet.find("<c r=\"C2\" t=\"b\"><v>1</v></c>") != std::string::npos);
  REQUIRE(sheet.find("<c r=\"C3\" t=\"b\"><v>0</v></c>") != std::string::npos);
  REQUIRE(sheet.find("r=\"B3\"") == std::string::npos);   // NULL cell omitted
}
