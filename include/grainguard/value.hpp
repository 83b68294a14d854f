#pragma once

/** \file value.hpp
 *  \brief User-supplied scalar values and engine result cells.
 */

#include <cstdint>
#include <string>
#include <variant>

namespace grainguard {

/** \brief A user-supplied scalar (filter operand or bound parameter). */
using scalar_value = std::variant<std::string, double, std::int64_t, bool>;

/** \brief One result cell as produced by the engine; monostate is SQL NULL. */
using cell_value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

/** \brief Shortest round-trip text for a double ("100", "0.1", "1e+300"). */
auto format_double(double v) -> std::string;

/** \brief Text form used in CSV output and LIKE operands; booleans are "true"/"false". */
auto to_text(const scalar_value& v) -> std::string;
auto to_text(const cell_value& v) -> std::string;

inline auto is_null(const cell_value& v) noexcept -> bool {
  return std::holds_alternative<std::monostate>(v);
}

} // namespace grainguard
