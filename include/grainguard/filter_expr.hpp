#pragma once

/** \file filter_expr.hpp
 *  \brief Structured filter rules and the parameterized predicate they compile to.
 *
 * Use cases: user-built row filters for count previews and filtered exports.
 * Ownership: rules and predicates are value-semantic and self-contained; both
 * are built per request and never persisted.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "grainguard/value.hpp"

namespace grainguard {

/** \brief Comparison operators accepted from callers. */
enum class operator_tag : std::uint8_t { eq, ne, gt, ge, lt, le, contains, between, in };

/** \brief How multiple rule clauses are joined. */
enum class combine_logic : std::uint8_t { all_of, any_of }; // AND, OR

/** \brief Rule operand: a scalar, or an ordered list (between: 2 items, in: >= 1 item). */
using operand = std::variant<scalar_value, std::vector<scalar_value>>;

/** \brief One user-supplied predicate column <op> value.
 *
 * \c op is the raw caller token ("eq", ">=", "between", ...); it is parsed and
 * validated by compile_filters together with the column and operand shape.
 */
struct filter_rule {
  std::string column; /**< attribute name, must exist in the discovered schema */
  std::string op;     /**< operator token */
  operand value;      /**< operand */
};

/** \brief Parameterized predicate handed to the execution boundary.
 *
 * Invariant: \c clause never contains a user-supplied value. Every value is a
 * positional '?' placeholder bound from \c parameters in order.
 */
struct compiled_predicate {
  std::string clause;                    /**< boolean expression; empty => always true */
  std::vector<scalar_value> parameters;  /**< positional parameters */
  std::size_t clause_count{0};           /**< number of rule clauses joined */

  auto always_true() const noexcept -> bool { return clause.empty(); }

  /** \brief " WHERE <clause>" or "" for the always-true predicate. */
  auto where_sql() const -> std::string {
    return clause.empty() ? std::string{} : " WHERE " + clause;
  }
};

} // namespace grainguard
