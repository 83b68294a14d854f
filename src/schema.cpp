#include "grainguard/schema.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace grainguard {

namespace {

auto normalize(std::string_view declared) -> std::string {
  std::string out;
  out.reserve(declared.size());
  for (char c : declared) {
    if (c == '(') break; // DECIMAL(18,3) -> DECIMAL
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) out.pop_back();
  std::size_t lead = 0;
  while (lead < out.size() && std::isspace(static_cast<unsigned char>(out[lead]))) ++lead;
  return out.substr(lead);
}

struct type_alias {
  std::string_view name;
  type_tag tag;
};

constexpr std::array<type_alias, 31> kTypeAliases{{
  {"TINYINT", type_tag::integer},   {"SMALLINT", type_tag::integer},
  {"INTEGER", type_tag::integer},   {"INT", type_tag::integer},
  {"BIGINT", type_tag::integer},    {"HUGEINT", type_tag::integer},
  {"UTINYINT", type_tag::integer},  {"USMALLINT", type_tag::integer},
  {"UINTEGER", type_tag::integer},  {"UBIGINT", type_tag::integer},
  {"INT8", type_tag::integer},
  {"DOUBLE", type_tag::floating},   {"FLOAT", type_tag::floating},
  {"REAL", type_tag::floating},     {"DECIMAL", type_tag::floating},
  {"NUMERIC", type_tag::floating},  {"DOUBLE PRECISION", type_tag::floating},
  {"BOOLEAN", type_tag::boolean},   {"BOOL", type_tag::boolean},
  {"VARCHAR", type_tag::string},    {"TEXT", type_tag::string},
  {"STRING", type_tag::string},     {"CHAR", type_tag::string},
  {"BPCHAR", type_tag::string},
  {"TIMESTAMP", type_tag::timestamp},
  {"TIMESTAMP WITH TIME ZONE", type_tag::timestamp},
  {"TIMESTAMPTZ", type_tag::timestamp},
  {"TIMESTAMP_NS", type_tag::timestamp},
  {"DATETIME", type_tag::timestamp},
  {"DATE", type_tag::timestamp},    {"TIME", type_tag::timestamp},
}};

} // namespace

auto to_string(type_tag t) -> std::string_view {
  switch (t) {
    case type_tag::integer: return "integer";
    case type_tag::floating: return "float";
    case type_tag::boolean: return "boolean";
    case type_tag::string: return "string";
    case type_tag::timestamp: return "timestamp";
    case type_tag::unknown: return "unknown";
  }
  return "unknown";
}

auto parse_type_tag(std::string_view declared) -> type_tag {
  const auto key = normalize(declared);
  auto it = std::find_if(kTypeAliases.begin(), kTypeAliases.end(),
                         [&](const type_alias& a) { return a.name == key; });
  return it == kTypeAliases.end() ? type_tag::unknown : it->tag;
}

auto find_column(std::span<const column_descriptor> columns, std::string_view name)
    -> const column_descriptor* {
  auto it = std::find_if(columns.begin(), columns.end(),
                         [&](const column_descriptor& c) { return c.name == name; });
  return it == columns.end() ? nullptr : &*it;
}

} // namespace grainguard
