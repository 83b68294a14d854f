#pragma once

/** \file filter_compiler.hpp
 *  \brief Compile structured filter rules into a parameterized predicate.
 *
 * The compiler is the only gate between caller input and the engine:
 * - columns are checked against the discovered schema before anything is built;
 * - operators are checked against a closed grammar;
 * - operand shape is checked per operator (between = 2 values, in >= 1 value);
 * - identifiers are quoted with the engine rule, values become '?' parameters;
 * - timestamp columns compare through julianday() on both sides, so ISO text with a
 *   'T' or space separator or a UTC offset orders by instant, not by spelling.
 *
 * Thread-safety: all functions are stateless and thread-safe.
 * Errors: returned via std::expected with grainguard::core::error.
 */

#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "grainguard/error.hpp"
#include "grainguard/filter_expr.hpp"
#include "grainguard/schema.hpp"

namespace grainguard {

/** \brief Parse an operator token: eq/=/==, ne/!=/<>, gt/>, ge/>=, lt/<, le/<=,
 *  contains, between, in (case-insensitive). Anything else is unsupported_operator.
 */
auto parse_operator(std::string_view token) -> std::expected<operator_tag, core::error>;

/** \brief Canonical token of an operator ("eq", "between", ...). */
auto to_string(operator_tag op) -> std::string_view;

/** \brief Parse "AND" / "OR" (case-insensitive). Anything else is invalid_argument. */
auto parse_logic(std::string_view token) -> std::expected<combine_logic, core::error>;

/** \brief Double-quoted identifier with embedded quotes doubled. */
auto quote_identifier(std::string_view name) -> std::string;

/** \brief Escape LIKE metacharacters (%, _ and the '\' escape itself). */
auto escape_like(std::string_view text) -> std::string;

/** \brief Compile rules into one predicate.
 *
 * \param rules caller rules, compiled in the given order
 * \param logic join used when there is more than one rule
 * \param known_columns discovered schema of the target dataset
 * \return predicate on success; unknown_column, unsupported_operator or
 *         malformed_operand for the first offending rule
 *
 * An empty rule list yields the always-true predicate with no parameters.
 */
auto compile_filters(std::span<const filter_rule> rules, combine_logic logic,
                     std::span<const column_descriptor> known_columns)
    -> std::expected<compiled_predicate, core::error>;

} // namespace grainguard
