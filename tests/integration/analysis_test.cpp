#include <catch2/catch_all.hpp>
#include <grainguard/analysis.hpp>
#include <grainguard/engine/sqlite_engine.hpp>

#include <algorithm>
#include <string>
#include <vector>

#include "tests/support/dataset_fixture.hpp"

using namespace grainguard;
using core::error_code;

namespace {

struct analysis_fixture {
  test_support::temp_dir dir;
  engine::sqlite_engine eng;
  engine_config cfg;

  auto dataset(std::string_view id, std::string_view csv) -> dataset_handle {
    return dataset_handle{std::string(id), test_support::write_dataset(dir.path(), id, csv)};
  }

  auto run(const dataset_handle& d, std::string key, std::string granularity = "day", std::int64_t limit = 10)
      -> std::expected<analysis_result, core::error> {
    analysis_runner runner(eng, cfg);
    analysis_request req;
    req.key = std::move(key);
    req.granularity = std::move(granularity);
    req.limit = limit;
    return runner.run(d, req);
  }
};

auto text_key(const analysis_point& p) -> std::string { return std::get<std::string>(p.key); }

auto number(const analysis_point& p) -> double {
  if (const auto* i = std::get_if<std::int64_t>(&p.value)) return static_cast<double>(*i);
  return std::get<double>(p.value);
}

// Order and item grain in the same table: rows are line items, so the order
// total repeats per row while the item subtotal stays summable.
constexpr const char* kMixedCsv =
    "order_id,product_id,product_name,item_subtotal,order_total_amount,purchase_time\n"
    "1,P1,Widget,10,30,2024-01-01 10:00:00\n"
    "1,P2,Gadget,20,30,2024-01-01 10:00:00\n"
    "2,P1,Widget,10,10,2024-01-02 11:00:00\n";

} // namespace

TEST_CASE("catalog is fixed and keyed", "[analysis]") {
  const auto catalog = analysis_catalog();
  REQUIRE(catalog.size() == 5);
  REQUIRE(catalog[0].key == "time_trend");
  REQUIRE(find_analysis("aov") != nullptr);
  REQUIRE(find_analysis("aov")->metric == "order_total_amount");
  REQUIRE(find_analysis("new_vs_returning")->dimension == "customer_type");
  REQUIRE(find_analysis("drop_table") == nullptr);
}

TEST_CASE("available analyses follow column presence", "[analysis]") {
  auto cols = test_support::columns({"order_id", "member_id", "order_total_amount"});
  auto avail = available_analyses(cols);
  REQUIRE(avail.size() == 1);
  REQUIRE(avail[0].key == "top_members");
  REQUIRE(available_analyses({}).empty());
}

TEST_CASE("inspect reports grains, findings and analyses", "[integration][analysis]") {
  analysis_fixture f;
  const auto d = f.dataset("orders", test_support::kOrdersCsv);
  analysis_runner runner(f.eng, f.cfg);
  auto p = runner.inspect(d);
  REQUIRE(p.has_value());
  REQUIRE(p->columns.size() == 6);
  REQUIRE(p->grains == grain_set{grain::order, grain::member});
  REQUIRE(p->findings.size() == 1);
  REQUIRE(p->findings[0].rule == "raw_amount_at_member_grain");
  std::vector<std::string_view> keys;
  for (const auto& a : p->available) keys.push_back(a.key);
  REQUIRE(keys == std::vector<std::string_view>{"time_trend", "top_members", "aov", "new_vs_returning"});
}

TEST_CASE("payment time warns only when the loaded column is nullable", "[integration][analysis]") {
  analysis_fixture f;
  analysis_runner runner(f.eng, f.cfg);

  const auto gaps = f.dataset("gaps", "order_id,status,paid_at\n1,paid,2024-01-01 10:00:00\n2,pending,\n");
  auto with_gaps = runner.inspect(gaps);
  REQUIRE(with_gaps.has_value());
  REQUIRE(with_gaps->findings.size() == 1);
  REQUIRE(with_gaps->findings[0].rule == "nullable_payment_time");
  REQUIRE_FALSE(with_gaps->findings[0].scope.has_value());
  REQUIRE(with_gaps->findings[0].level == severity::warning);

  const auto full = f.dataset("full", "order_id,status,paid_at\n1,paid,2024-01-01 10:00:00\n2,paid,2024-01-02 09:00:00\n");
  auto populated = runner.inspect(full);
  REQUIRE(populated.has_value());
  REQUIRE(populated->findings.empty());
}

TEST_CASE("time trend by day and month", "[integration][analysis]") {
  analysis_fixture f;
  const auto d = f.dataset("orders", test_support::kOrdersCsv);

  auto day = f.run(d, "time_trend", "day");
  REQUIRE(day.has_value());
  REQUIRE(day->metric == "order_total_amount");
  REQUIRE(day->granularity == std::optional<std::string>{"day"});
  REQUIRE_FALSE(day->limit.has_value());
  REQUIRE(day->points.size() == 4);
  REQUIRE(text_key(day->points[0]) == "2024-01-05");
  REQUIRE(number(day->points[0]) == Catch::Approx(200.5));
  REQUIRE(number(day->points[1]) == Catch::Approx(250.0));
  REQUIRE(number(day->points[2]) == Catch::Approx(150.0));
  REQUIRE(text_key(day->points[3]) == "2024-02-03");
  REQUIRE(number(day->points[3]) == Catch::Approx(99.5));
  // the member-grain warning rides along without blocking
  REQUIRE(day->warnings.size() == 1);
  REQUIRE(day->warnings[0].rule == "raw_amount_at_member_grain");

  auto month = f.run(d, "time_trend", "month");
  REQUIRE(month.has_value());
  REQUIRE(month->points.size() == 2);
  REQUIRE(text_key(month->points[0]) == "2024-01");
  REQUIRE(number(month->points[0]) == Catch::Approx(450.5));
  REQUIRE(number(month->points[1]) == Catch::Approx(249.5));
}

TEST_CASE("average order value per month", "[integration][analysis]") {
  analysis_fixture f;
  const auto d = f.dataset("orders", test_support::kOrdersCsv);
  auto r = f.run(d, "aov", "month");
  REQUIRE(r.has_value());
  REQUIRE(r->metric == "aov");
  REQUIRE(r->points.size() == 2);
  REQUIRE(number(r->points[0]) == Catch::Approx(112.625));
  REQUIRE(number(r->points[1]) == Catch::Approx(124.75));
}

TEST_CASE("ranked analyses order by value and honor the limit", "[integration][analysis]") {
  analysis_fixture f;
  const auto orders = f.dataset("orders", test_support::kOrdersCsv);
  auto members = f.run(orders, "top_members");
  REQUIRE(members.has_value());
  REQUIRE(members->limit == std::optional<std::int64_t>{10});
  REQUIRE(members->points.size() == 3);
  REQUIRE(text_key(members->points[0]) == "M1");
  REQUIRE(number(members->points[0]) == Catch::Approx(420.0));
  REQUIRE(text_key(members->points[1]) == "M2");
  REQUIRE(number(members->points[1]) == Catch::Approx(230.0));
  REQUIRE(text_key(members->points[2]) == "M3");

  const auto items = f.dataset("items", test_support::kItemsCsv);
  auto products = f.run(items, "top_products", "day", 2);
  REQUIRE(products.has_value());
  REQUIRE(products->warnings.empty());
  REQUIRE(products->points.size() == 2);
  REQUIRE(text_key(products->points[0]) == "Gadget");
  REQUIRE(number(products->points[0]) == Catch::Approx(51.0));
  REQUIRE(text_key(products->points[1]) == "Widget");
  REQUIRE(number(products->points[1]) == Catch::Approx(30.0));

  auto defaulted = f.run(items, "top_products", "day", 0);
  REQUIRE(defaulted.has_value());
  REQUIRE(defaulted->limit == std::optional<std::int64_t>{10});
  REQUIRE(defaulted->points.size() == 3);
}

TEST_CASE("new versus returning always reports both groups", "[integration][analysis]") {
  analysis_fixture f;
  const auto d = f.dataset("orders", test_support::kOrdersCsv);
  auto r = f.run(d, "new_vs_returning");
  REQUIRE(r.has_value());
  REQUIRE(r->points.size() == 2);
  REQUIRE(text_key(r->points[0]) == "new");
  REQUIRE(std::get<std::int64_t>(r->points[0].value) == 3);
  REQUIRE(text_key(r->points[1]) == "returning");
  REQUIRE(std::get<std::int64_t>(r->points[1].value) == 3);

  const auto all_new = f.dataset("first", "order_id,first_purchase_flag\n1,true\n2,true\n");
  auto n = f.run(all_new, "new_vs_returning");
  REQUIRE(n.has_value());
  REQUIRE(std::get<std::int64_t>(n->points[1].value) == 0);
}

TEST_CASE("blocked metrics never execute", "[integration][analysis][gate]") {
  analysis_fixture f;
  const auto d = f.dataset("mixed", kMixedCsv);

  auto trend = f.run(d, "time_trend");
  REQUIRE_FALSE(trend.has_value());
  REQUIRE(trend.error().code == error_code::analysis_blocked);
  REQUIRE(trend.error().message.find("time_trend") != std::string::npos);

  auto aov = f.run(d, "aov");
  REQUIRE_FALSE(aov.has_value());
  REQUIRE(aov.error().code == error_code::analysis_blocked);
}

TEST_CASE("item analyses run on line items that carry an order id", "[integration][analysis][gate]") {
  analysis_fixture f;
  const auto d = f.dataset("mixed", kMixedCsv);
  analysis_runner runner(f.eng, f.cfg);
  auto profile = runner.inspect(d);
  REQUIRE(profile.has_value());
  REQUIRE(profile->grains == grain_set{grain::order, grain::item});
  REQUIRE(profile->findings.size() == 2);

  auto products = f.run(d, "top_products");
  REQUIRE(products.has_value());
  REQUIRE(products->metric == "item_subtotal");
  REQUIRE(products->warnings.empty());
  REQUIRE(products->points.size() == 2);
  REQUIRE(text_key(products->points[0]) == "Gadget");
  REQUIRE(number(products->points[0]) == Catch::Approx(20.0));
  REQUIRE(text_key(products->points[1]) == "Widget");
  REQUIRE(number(products->points[1]) == Catch::Approx(20.0));
}

TEST_CASE("analysis request validation", "[integration][analysis]") {
  analysis_fixture f;
  const auto d = f.dataset("orders", test_support::kOrdersCsv);

  auto unknown = f.run(d, "churn");
  REQUIRE_FALSE(unknown.has_value());
  REQUIRE(unknown.error().code == error_code::invalid_argument);

  auto bad_granularity = f.run(d, "time_trend", "week");
  REQUIRE_FALSE(bad_granularity.has_value());
  REQUIRE(bad_granularity.error().code == error_code::invalid_argument);

  auto missing = f.run(d, "top_products");
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == error_code::precondition_failed);

  const auto text_time = f.dataset("texty", "order_id,purchase_time,order_total_amount\n1,yesterday,5\n");
  auto mistyped = f.run(text_time, "time_trend");
  REQUIRE_FALSE(mistyped.has_value());
  REQUIRE(mistyped.error().code == error_code::precondition_failed);
}
