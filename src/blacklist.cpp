#include "grainguard/blacklist.hpp"

#include <algorithm>
#include <array>

namespace grainguard {

namespace {

constexpr std::array<std::string_view, 2> kRawAmountColumns{kOrderAmountColumn, kItemSubtotalColumn};

// Rule 1: an order-level total repeats on every line item of the order.
auto order_amount_at_item_applies(const schema_view& s) -> bool {
  return s.has(grain::item) && s.has(kOrderAmountColumn);
}
auto order_amount_at_item_make(const schema_view&) -> blacklist_finding {
  return {"order_amount_at_item_grain", grain::item, {std::string(kOrderAmountColumn)},
          "order-level amount is repeated per line item; summing it at item grain double counts",
          severity::block};
}

// Rule 2
auto item_subtotal_at_order_applies(const schema_view& s) -> bool {
  return s.has(grain::order) && s.has(kItemSubtotalColumn);
}
auto item_subtotal_at_order_make(const schema_view&) -> blacklist_finding {
  return {"item_subtotal_at_order_grain", grain::order, {std::string(kItemSubtotalColumn)},
          "item-level subtotal loses its meaning at order grain",
          severity::block};
}

// Rule 3: metrics lists only the raw amount columns actually present.
auto raw_amount_at_member_applies(const schema_view& s) -> bool {
  return s.has(grain::member) &&
         std::any_of(kRawAmountColumns.begin(), kRawAmountColumns.end(),
                     [&](std::string_view c) { return s.has(c); });
}
auto raw_amount_at_member_make(const schema_view& s) -> blacklist_finding {
  blacklist_finding f{"raw_amount_at_member_grain", grain::member, {},
                      "member-level analysis needs the amount aggregated first; raw amounts mislead",
                      severity::warning};
  for (auto c : kRawAmountColumns) {
    if (s.has(c)) f.metrics.emplace_back(c);
  }
  return f;
}

// Rule 4: nullability is the engine's declaration, so a paid_at column with no
// empty cell in the loaded data does not warn.
auto nullable_paid_at_applies(const schema_view& s) -> bool {
  const auto* col = find_column(s.columns, kPaidAtColumn);
  return col != nullptr && col->nullable;
}
auto nullable_paid_at_make(const schema_view&) -> blacklist_finding {
  return {"nullable_payment_time", std::nullopt, {std::string(kPaidAtColumn)},
          "payment time is nullable in this dataset (some rows are unpaid); pair it with an order status filter",
          severity::warning};
}

constexpr std::array<blacklist_rule, 4> kBuiltinRules{{
  {"order_amount_at_item_grain", &order_amount_at_item_applies, &order_amount_at_item_make},
  {"item_subtotal_at_order_grain", &item_subtotal_at_order_applies, &item_subtotal_at_order_make},
  {"raw_amount_at_member_grain", &raw_amount_at_member_applies, &raw_amount_at_member_make},
  {"nullable_payment_time", &nullable_paid_at_applies, &nullable_paid_at_make},
}};

auto lists_metric(const blacklist_finding& f, std::string_view metric) -> bool {
  return std::find(f.metrics.begin(), f.metrics.end(), metric) != f.metrics.end();
}

void record(gate_decision& d, const blacklist_finding& f) {
  if (f.level == severity::block) {
    d.allowed = false;
    d.blocking.push_back(f);
  } else {
    d.warnings.push_back(f);
  }
}

} // namespace

auto to_string(severity s) -> std::string_view {
  return s == severity::block ? "block" : "warning";
}

auto builtin_blacklist_rules() -> std::span<const blacklist_rule> {
  return kBuiltinRules;
}

auto derive_blacklist(const grain_set& grains, std::span<const column_descriptor> columns)
    -> std::vector<blacklist_finding> {
  return derive_blacklist(grains, columns, builtin_blacklist_rules());
}

auto derive_blacklist(const grain_set& grains, std::span<const column_descriptor> columns,
                      std::span<const blacklist_rule> rules) -> std::vector<blacklist_finding> {
  const schema_view view{grains, columns};
  std::vector<blacklist_finding> out;
  for (const auto& r : rules) {
    if (r.applies(view)) out.push_back(r.make(view));
  }
  return out;
}

auto evaluate_metric(std::span<const blacklist_finding> findings, grain at, std::string_view metric)
    -> gate_decision {
  gate_decision d{};
  for (const auto& f : findings) {
    if ((!f.scope || *f.scope == at) && lists_metric(f, metric)) record(d, f);
  }
  return d;
}

auto evaluate_metric(std::span<const blacklist_finding> findings, const grain_set& grains,
                     std::string_view metric) -> gate_decision {
  gate_decision d{};
  for (const auto& f : findings) {
    if ((!f.scope || grains.count(*f.scope) != 0) && lists_metric(f, metric)) record(d, f);
  }
  return d;
}

} // namespace grainguard
