#include "grainguard/analysis.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <utility>

#include "grainguard/core/platform_utils.hpp"
#include "grainguard/filter_compiler.hpp"
#include "grainguard/schema_descriptor.hpp"

namespace grainguard {

namespace {

constexpr const char* kComponent = "analysis.run";

constexpr std::string_view kPurchaseTime = "purchase_time";
constexpr std::string_view kProductName = "product_name";
constexpr std::string_view kMemberId = "member_id";
constexpr std::string_view kOrderId = "order_id";
constexpr std::string_view kFirstPurchaseFlag = "first_purchase_flag";

constexpr std::array<std::string_view, 2> kTimeTrendColumns{kPurchaseTime, kOrderAmountColumn};
constexpr std::array<std::string_view, 2> kTopProductsColumns{kProductName, kItemSubtotalColumn};
constexpr std::array<std::string_view, 2> kTopMembersColumns{kMemberId, kOrderAmountColumn};
constexpr std::array<std::string_view, 3> kAovColumns{kPurchaseTime, kOrderAmountColumn, kOrderId};
constexpr std::array<std::string_view, 2> kNewVsReturningColumns{kFirstPurchaseFlag, kOrderId};

const std::array<analysis_spec, 5> kCatalog{{
  {analysis_kind::time_trend, "time_trend", "Sales trend over time",
   "Order amount summed per day or month of purchase.", "line",
   kOrderAmountColumn, kPurchaseTime, grain::order, kTimeTrendColumns},
  {analysis_kind::top_products, "top_products", "Top products",
   "Products ranked by summed line item subtotal.", "bar",
   kItemSubtotalColumn, kProductName, grain::item, kTopProductsColumns},
  {analysis_kind::top_members, "top_members", "Top members",
   "Members ranked by summed order amount.", "bar",
   kOrderAmountColumn, kMemberId, grain::member, kTopMembersColumns},
  {analysis_kind::aov, "aov", "Average order value",
   "Order amount divided by distinct orders, per day or month.", "line",
   kOrderAmountColumn, kPurchaseTime, grain::order, kAovColumns},
  {analysis_kind::new_vs_returning, "new_vs_returning", "New vs returning customers",
   "Distinct orders split by first purchase flag.", "pie",
   kOrderId, "customer_type", grain::order, kNewVsReturningColumns},
}};

auto failed(core::error_code code, std::string msg) -> std::unexpected<core::error> {
  return core::make_unexpected(code, std::move(msg), kComponent);
}

auto is_numeric(type_tag t) -> bool { return t == type_tag::integer || t == type_tag::floating; }

auto check_types(const analysis_spec& spec, std::span<const column_descriptor> columns)
    -> std::expected<void, core::error> {
  for (auto name : spec.required_columns) {
    const auto* c = find_column(columns, name);
    if (c == nullptr) {
      return failed(core::error_code::precondition_failed,
                    "Missing required column for " + std::string(spec.key) + ": " + std::string(name));
    }
    bool ok = true;
    if (name == kPurchaseTime) {
      ok = c->type == type_tag::timestamp;
    } else if (name == kFirstPurchaseFlag) {
      ok = c->type == type_tag::boolean || c->type == type_tag::integer;
    } else if (name == spec.metric && name != kOrderId) {
      ok = is_numeric(c->type);
    }
    if (!ok) {
      return failed(core::error_code::precondition_failed,
                    "Column " + std::string(name) + " has unsupported type " +
                        std::string(to_string(c->type)) + " for " + std::string(spec.key));
    }
  }
  return {};
}

auto parse_granularity(std::string_view g) -> std::expected<engine::time_granularity, core::error> {
  if (g == "day") return engine::time_granularity::day;
  if (g == "month") return engine::time_granularity::month;
  return failed(core::error_code::invalid_argument, "granularity must be 'day' or 'month'");
}

auto q(std::string_view name) -> std::string { return quote_identifier(name); }

} // namespace

auto analysis_catalog() -> std::span<const analysis_spec> { return kCatalog; }

auto find_analysis(std::string_view key) -> const analysis_spec* {
  for (const auto& a : kCatalog) {
    if (a.key == key) return &a;
  }
  return nullptr;
}

auto available_analyses(std::span<const column_descriptor> columns) -> std::vector<analysis_spec> {
  std::vector<analysis_spec> out;
  for (const auto& a : kCatalog) {
    const bool present = std::all_of(a.required_columns.begin(), a.required_columns.end(),
                                     [&](std::string_view c) { return has_column(columns, c); });
    if (present) out.push_back(a);
  }
  return out;
}

auto run_analysis(engine::engine_session& session, const analysis_request& request,
                  std::span<const column_descriptor> columns,
                  std::span<const blacklist_finding> findings,
                  const engine_config& cfg, std::stop_token stop)
    -> std::expected<analysis_result, core::error> {
  const auto* spec = find_analysis(request.key);
  if (spec == nullptr) {
    return failed(core::error_code::invalid_argument, "Unknown analysis: " + request.key);
  }

  analysis_result result;
  result.key = std::string(spec->key);
  result.metric = spec->kind == analysis_kind::aov ? "aov" : std::string(spec->metric);
  result.dimension = std::string(spec->dimension);

  const bool timed = spec->kind == analysis_kind::time_trend || spec->kind == analysis_kind::aov;
  const bool ranked = spec->kind == analysis_kind::top_products || spec->kind == analysis_kind::top_members;
  auto granularity = engine::time_granularity::day;
  if (timed) {
    auto g = parse_granularity(request.granularity);
    if (!g) return std::unexpected(g.error());
    granularity = *g;
    result.granularity = request.granularity;
  }
  std::int64_t limit = request.limit <= 0 ? 10 : request.limit;
  limit = std::min<std::int64_t>(limit, static_cast<std::int64_t>(cfg.max_row_limit));
  if (ranked) result.limit = limit;

  if (auto ok = check_types(*spec, columns); !ok) return std::unexpected(ok.error());

  // Blocks count at the analysis grain and at item grain, where every row is a line
  // item and an order-level value repeats. Warnings at any detected grain ride along.
  const auto grains = detect_grains(columns);
  grain_set checked{spec->nominal_grain};
  if (grains.count(grain::item) != 0) checked.insert(grain::item);
  auto gate = evaluate_metric(findings, checked, spec->metric);
  gate.warnings = evaluate_metric(findings, grains, spec->metric).warnings;
  if (!gate.allowed) {
    const auto& b = gate.blocking.front();
    if (core::debug_enabled()) {
      std::cerr << "[ANALYSIS][gate] " << spec->key << " blocked by " << b.rule << std::endl;
    }
    return failed(core::error_code::analysis_blocked,
                  "Analysis " + std::string(spec->key) + " blocked: " + b.reason);
  }
  result.warnings = std::move(gate.warnings);

  const std::string rel(session.relation());
  engine::statement st;
  switch (spec->kind) {
    case analysis_kind::time_trend: {
      const auto t = q(kPurchaseTime);
      st.sql = "SELECT " + session.time_bucket(t, granularity) + " AS \"time\", SUM(" + q(kOrderAmountColumn) +
               ") AS \"value\" FROM " + rel + " WHERE " + t + " IS NOT NULL GROUP BY 1 ORDER BY 1";
      break;
    }
    case analysis_kind::aov: {
      const auto t = q(kPurchaseTime);
      st.sql = "SELECT " + session.time_bucket(t, granularity) + " AS \"time\", SUM(" + q(kOrderAmountColumn) +
               ") * 1.0 / COUNT(DISTINCT " + q(kOrderId) + ") AS \"value\" FROM " + rel + " WHERE " + t +
               " IS NOT NULL GROUP BY 1 ORDER BY 1";
      break;
    }
    case analysis_kind::top_products:
    case analysis_kind::top_members: {
      const auto dim = q(spec->dimension);
      st.sql = "SELECT " + dim + " AS \"key\", SUM(" + q(spec->metric) + ") AS \"value\" FROM " + rel +
               " GROUP BY 1 ORDER BY 2 DESC, 1 LIMIT ?";
      st.parameters.emplace_back(limit);
      break;
    }
    case analysis_kind::new_vs_returning:
      st.sql = "SELECT CASE WHEN " + q(kFirstPurchaseFlag) + " THEN 'new' ELSE 'returning' END AS \"key\", "
               "COUNT(DISTINCT " + q(kOrderId) + ") AS \"value\" FROM " + rel + " GROUP BY 1";
      break;
  }

  engine::collecting_sink sink;
  auto rows = session.execute(st, sink, engine::exec_options{cfg.execution_timeout, std::move(stop)});
  if (!rows) return std::unexpected(rows.error());

  if (spec->kind == analysis_kind::new_vs_returning) {
    std::int64_t counts[2] = {0, 0};
    for (const auto& r : sink.rows()) {
      if (r.size() != 2) continue;
      const auto* k = std::get_if<std::string>(&r[0]);
      const auto* v = std::get_if<std::int64_t>(&r[1]);
      if (k == nullptr || v == nullptr) continue;
      counts[*k == "new" ? 0 : 1] += *v;
    }
    result.points.push_back({std::string("new"), counts[0]});
    result.points.push_back({std::string("returning"), counts[1]});
  } else {
    result.points.reserve(sink.rows().size());
    for (auto& r : sink.rows()) {
      if (r.size() != 2) continue;
      result.points.push_back({std::move(r[0]), std::move(r[1])});
    }
  }

  if (core::debug_enabled()) {
    std::cerr << "[ANALYSIS][run] " << spec->key << " points=" << result.points.size()
              << " warnings=" << result.warnings.size() << std::endl;
  }
  return result;
}

analysis_runner::analysis_runner(engine::query_engine& engine, engine_config cfg)
    : engine_(engine), cfg_(std::move(cfg)) {}

auto analysis_runner::inspect(const dataset_handle& dataset) -> std::expected<dataset_profile, core::error> {
  auto columns = describe(engine_, dataset);
  if (!columns) return std::unexpected(columns.error());
  dataset_profile p;
  p.columns = std::move(*columns);
  p.grains = detect_grains(p.columns);
  p.findings = derive_blacklist(p.grains, p.columns);
  p.available = available_analyses(p.columns);
  return p;
}

auto analysis_runner::run(const dataset_handle& dataset, const analysis_request& request, std::stop_token stop)
    -> std::expected<analysis_result, core::error> {
  auto session = engine_.open_session(dataset);
  if (!session) return std::unexpected(session.error());
  auto columns = describe(**session);
  if (!columns) return std::unexpected(columns.error());
  const auto grains = detect_grains(*columns);
  const auto findings = derive_blacklist(grains, *columns);
  return run_analysis(**session, request, *columns, findings, cfg_, std::move(stop));
}

} // namespace grainguard
