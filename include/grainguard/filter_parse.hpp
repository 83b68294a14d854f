#pragma once

/** \file filter_parse.hpp
 *  \brief Text form of filter rules for command-line callers.
 *
 * A rule is written column:op:value. The first two ':' split the parts, so
 * values may contain ':' (timestamps). For between and in the value is a
 * comma separated list; an item wrapped in '...' or "..." may hold commas.
 * Tokens are typed in order: quoted (string, quotes stripped), true/false,
 * 64-bit integer, finite decimal, otherwise string. A number with a leading
 * zero such as 007 stays a string.
 */

#include <expected>
#include <string_view>

#include "grainguard/error.hpp"
#include "grainguard/filter_expr.hpp"
#include "grainguard/value.hpp"

namespace grainguard {

auto parse_scalar_token(std::string_view token) -> scalar_value;

/** \brief Parse "column:op:value". invalid_argument when a part is missing.
 *
 * The operator is not validated here; compile_filters does that against the
 * grammar and the dataset schema.
 */
auto parse_filter_arg(std::string_view text) -> std::expected<filter_rule, core::error>;

} // namespace grainguard
