#include <catch2/catch_all.hpp>
#include <grainguard/blacklist.hpp>
#include <grainguard/filter_compiler.hpp>
#include <grainguard/grain.hpp>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "tests/support/dataset_fixture.hpp"

using namespace grainguard;

// Property-style tests: grain detection is monotone in the column set, findings
// only name present columns, and compiled predicates never carry caller values.

static const std::vector<std::string> kPool{
  "order_id", "product_id", "member_id", "order_total_amount", "item_subtotal",
  "paid_at", "status", "qty", "purchase_time", "ORDER_ID"};

static std::vector<column_descriptor> subset(const std::vector<bool>& mask) {
  std::vector<column_descriptor> out;
  for (std::size_t i = 0; i < kPool.size(); ++i) {
    if (!mask[i]) continue;
    column_descriptor d;
    d.name = kPool[i];
    d.type = type_tag::string;
    out.push_back(std::move(d));
  }
  return out;
}

TEST_CASE("grain detection is monotone and findings name present columns", "[property]") {
  std::seed_seq seed{17, 23, 43}; std::mt19937 rng(seed);
  std::bernoulli_distribution coin(0.5);
  for (int t = 0; t < 200; ++t) {
    std::vector<bool> small(kPool.size()), large(kPool.size());
    for (std::size_t i = 0; i < kPool.size(); ++i) {
      small[i] = coin(rng);
      large[i] = small[i] || coin(rng);
    }
    const auto a = subset(small);
    const auto b = subset(large);
    const auto ga = detect_grains(a);
    const auto gb = detect_grains(b);
    REQUIRE(std::includes(gb.begin(), gb.end(), ga.begin(), ga.end()));

    const auto findings = derive_blacklist(gb, b);
    REQUIRE(findings == derive_blacklist(gb, b));
    for (const auto& f : findings) {
      REQUIRE_FALSE(f.metrics.empty());
      for (const auto& m : f.metrics) REQUIRE(has_column(b, m));
      if (f.scope) REQUIRE(gb.count(*f.scope) == 1);
    }
  }
}

TEST_CASE("compiled predicates keep values out of the clause", "[property][security]") {
  const auto cols = test_support::columns({
    {"amount", type_tag::floating}, {"status", type_tag::string},
    {"order_id", type_tag::integer}, {"paid", type_tag::boolean}});
  const std::vector<std::string> ops{"eq", "ne", "gt", ">=", "<", "le", "contains", "between", "in"};
  const std::string alphabet = "abcXYZ019'\";-%_\\() =*/";

  std::seed_seq seed{5, 7, 11}; std::mt19937 rng(seed);
  std::uniform_int_distribution<std::size_t> pick_col(0, cols.size() - 1);
  std::uniform_int_distribution<std::size_t> pick_op(0, ops.size() - 1);
  std::uniform_int_distribution<std::size_t> pick_char(0, alphabet.size() - 1);
  std::uniform_int_distribution<int> n_rules(1, 6), n_items(1, 4), len(1, 12);

  auto value = [&]() -> scalar_value {
    std::string s = "zq";
    for (int i = len(rng); i > 0; --i) s.push_back(alphabet[pick_char(rng)]);
    return s;
  };

  for (int t = 0; t < 300; ++t) {
    std::vector<filter_rule> rules;
    std::vector<std::string> texts;
    std::size_t expected_params = 0;
    for (int r = n_rules(rng); r > 0; --r) {
      filter_rule fr;
      fr.column = cols[pick_col(rng)].name;
      fr.op = ops[pick_op(rng)];
      if (fr.op == "between" || fr.op == "in") {
        std::vector<scalar_value> items;
        const int n = fr.op == "between" ? 2 : n_items(rng);
        for (int i = 0; i < n; ++i) items.push_back(value());
        expected_params += items.size();
        for (const auto& v : items) texts.push_back(std::get<std::string>(v));
        fr.value = std::move(items);
      } else {
        auto v = value();
        texts.push_back(std::get<std::string>(v));
        fr.value = std::move(v);
        ++expected_params;
      }
      rules.push_back(std::move(fr));
    }

    const auto logic = (t % 2) ? combine_logic::any_of : combine_logic::all_of;
    auto p = compile_filters(rules, logic, cols);
    REQUIRE(p.has_value());
    REQUIRE(p->clause_count == rules.size());
    REQUIRE(p->parameters.size() == expected_params);
    REQUIRE(static_cast<std::size_t>(std::count(p->clause.begin(), p->clause.end(), '?')) == expected_params);
    REQUIRE(p->clause.find("zq") == std::string::npos);
    for (const auto& text : texts) REQUIRE(p->clause.find(text) == std::string::npos);
  }
}
