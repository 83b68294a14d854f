#pragma once

/** \file schema.hpp
 *  \brief Column descriptors of a dynamically discovered dataset schema.
 *
 * Descriptors are immutable once fetched and live for one request.
 */

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace grainguard {

/** \brief Normalized column type, independent of the engine's spelling. */
enum class type_tag : std::uint8_t {
  integer,
  floating,
  boolean,
  string,
  timestamp,
  unknown,
};

/** \brief One column as reported by the engine's describe capability. */
struct column_descriptor {
  std::string name;                  /**< exact column name */
  type_tag type{type_tag::unknown};  /**< normalized type */
  std::string declared_type_name;    /**< engine spelling, e.g. "BIGINT" */
  bool nullable{true};               /**< engine-declared nullability */
};

/** \brief "integer" | "float" | "boolean" | "string" | "timestamp" | "unknown". */
auto to_string(type_tag t) -> std::string_view;

/** \brief Map an engine type string (DuckDB/SQLite spelling, any case) to a type_tag.
 *
 * Parameterized forms such as DECIMAL(18,3) or VARCHAR(32) use their base name.
 */
auto parse_type_tag(std::string_view declared) -> type_tag;

/** \brief Exact (case-sensitive) lookup; nullptr when absent. */
auto find_column(std::span<const column_descriptor> columns, std::string_view name)
    -> const column_descriptor*;

inline auto has_column(std::span<const column_descriptor> columns, std::string_view name) -> bool {
  return find_column(columns, name) != nullptr;
}

} // namespace grainguard
