#pragma once

/** \file blacklist.hpp
 *  \brief Metric/grain combinations that are wrong or risky for a dataset.
 *
 * The rule table is fixed and ordered; derive_blacklist appends findings in
 * rule order, so output is stable for identical input. Findings are data: a
 * block finding means the caller must reject the combination, the deriver
 * itself never fails.
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "grainguard/grain.hpp"
#include "grainguard/schema.hpp"

namespace grainguard {

enum class severity : std::uint8_t { block, warning };

auto to_string(severity s) -> std::string_view;

/** \brief One flagged combination. */
struct blacklist_finding {
  std::string rule;                /**< stable rule id, e.g. "order_amount_at_item_grain" */
  std::optional<grain> scope;      /**< grain the finding applies to; nullopt = all grains */
  std::vector<std::string> metrics;/**< affected metric columns, in rule order */
  std::string reason;              /**< human-readable explanation */
  severity level{severity::warning};

  friend bool operator==(const blacklist_finding&, const blacklist_finding&) = default;
};

/** \brief Read-only view of what the rules may inspect. */
struct schema_view {
  const grain_set& grains;
  std::span<const column_descriptor> columns;

  auto has(grain g) const -> bool { return grains.count(g) != 0; }
  auto has(std::string_view column) const -> bool { return has_column(columns, column); }
};

/** \brief Condition -> finding template pair. */
struct blacklist_rule {
  std::string_view id;
  bool (*applies)(const schema_view&);
  blacklist_finding (*make)(const schema_view&);
};

/** Marker columns consulted by the built-in rules. */
inline constexpr std::string_view kOrderAmountColumn = "order_total_amount";
inline constexpr std::string_view kItemSubtotalColumn = "item_subtotal";
inline constexpr std::string_view kPaidAtColumn = "paid_at";

/** \brief Built-in rules in declaration order. */
auto builtin_blacklist_rules() -> std::span<const blacklist_rule>;

auto derive_blacklist(const grain_set& grains, std::span<const column_descriptor> columns)
    -> std::vector<blacklist_finding>;

/** \brief Evaluate a custom rule table (same ordering guarantees). */
auto derive_blacklist(const grain_set& grains, std::span<const column_descriptor> columns,
                      std::span<const blacklist_rule> rules) -> std::vector<blacklist_finding>;

/** \brief Outcome of checking one metric against the findings. */
struct gate_decision {
  bool allowed{true};
  std::vector<blacklist_finding> blocking;
  std::vector<blacklist_finding> warnings;
};

/** \brief Check a metric requested at one grain.
 *
 * A finding applies when its scope is \p at (or all grains) and it lists
 * \p metric. Any applicable block finding clears \c allowed.
 */
auto evaluate_metric(std::span<const blacklist_finding> findings, grain at, std::string_view metric)
    -> gate_decision;

/** \brief Check a metric against every grain the dataset was detected at. */
auto evaluate_metric(std::span<const blacklist_finding> findings, const grain_set& grains,
                     std::string_view metric) -> gate_decision;

} // namespace grainguard
