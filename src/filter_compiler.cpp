#include "grainguard/filter_compiler.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <vector>

namespace grainguard {

namespace {

constexpr const char* kComponent = "filter.compile";

auto lower(std::string_view s) -> std::string {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

struct operator_spelling {
  std::string_view token;
  operator_tag tag;
};

constexpr std::array<operator_spelling, 17> kOperatorSpellings{{
  {"eq", operator_tag::eq},       {"=", operator_tag::eq},   {"==", operator_tag::eq},
  {"ne", operator_tag::ne},       {"!=", operator_tag::ne},  {"<>", operator_tag::ne},
  {"gt", operator_tag::gt},       {">", operator_tag::gt},
  {"ge", operator_tag::ge},       {">=", operator_tag::ge},
  {"lt", operator_tag::lt},       {"<", operator_tag::lt},
  {"le", operator_tag::le},       {"<=", operator_tag::le},
  {"contains", operator_tag::contains},
  {"between", operator_tag::between},
  {"in", operator_tag::in},
}};

auto sql_comparison(operator_tag op) -> std::string_view {
  switch (op) {
    case operator_tag::eq: return "=";
    case operator_tag::ne: return "<>";
    case operator_tag::gt: return ">";
    case operator_tag::ge: return ">=";
    case operator_tag::lt: return "<";
    case operator_tag::le: return "<=";
    default: return {};
  }
}

auto rule_context(std::size_t index, const filter_rule& r) -> std::string {
  return "rule " + std::to_string(index) + " (column '" + r.column + "')";
}

auto malformed(std::size_t index, const filter_rule& r, std::string_view what)
    -> std::unexpected<core::error> {
  return core::make_unexpected(core::error_code::malformed_operand,
                               rule_context(index, r) + ": " + std::string(what), kComponent);
}

auto is_finite(const scalar_value& v) -> bool {
  const auto* d = std::get_if<double>(&v);
  return d == nullptr || std::isfinite(*d);
}

// Timestamp columns compare as instants: "T" or space separators and UTC offsets
// on either side resolve to the same julian day number.
auto comparable(std::string expr, type_tag type) -> std::string {
  if (type == type_tag::timestamp) return "julianday(" + expr + ")";
  return expr;
}

// One rule -> one clause; parameters are appended to \p params in placeholder order.
auto compile_rule(std::size_t index, const filter_rule& r, operator_tag op, type_tag type,
                  std::vector<scalar_value>& params) -> std::expected<std::string, core::error> {
  const auto ident = quote_identifier(r.column);
  const auto lhs = comparable(ident, type);
  const auto slot = comparable("?", type);
  const auto* scalar = std::get_if<scalar_value>(&r.value);
  const auto* list = std::get_if<std::vector<scalar_value>>(&r.value);

  switch (op) {
    case operator_tag::eq:
    case operator_tag::ne:
    case operator_tag::gt:
    case operator_tag::ge:
    case operator_tag::lt:
    case operator_tag::le: {
      if (!scalar) return malformed(index, r, "operator '" + std::string(to_string(op)) + "' requires a single value");
      if (!is_finite(*scalar)) return malformed(index, r, "numeric value must be finite");
      params.push_back(*scalar);
      return lhs + " " + std::string(sql_comparison(op)) + " " + slot;
    }
    case operator_tag::contains: {
      if (!scalar) return malformed(index, r, "operator 'contains' requires a single value");
      if (!is_finite(*scalar)) return malformed(index, r, "numeric value must be finite");
      params.emplace_back("%" + escape_like(to_text(*scalar)) + "%");
      return ident + " LIKE ? ESCAPE '\\'";
    }
    case operator_tag::between: {
      if (!list || list->size() != 2) return malformed(index, r, "operator 'between' requires exactly 2 values");
      if (!is_finite((*list)[0]) || !is_finite((*list)[1])) return malformed(index, r, "numeric value must be finite");
      params.push_back((*list)[0]);
      params.push_back((*list)[1]);
      return lhs + " BETWEEN " + slot + " AND " + slot;
    }
    case operator_tag::in: {
      if (!list || list->empty()) return malformed(index, r, "operator 'in' requires a non-empty list");
      std::string placeholders;
      for (const auto& v : *list) {
        if (!is_finite(v)) return malformed(index, r, "numeric value must be finite");
        if (!placeholders.empty()) placeholders += ", ";
        placeholders += slot;
        params.push_back(v);
      }
      return lhs + " IN (" + placeholders + ")";
    }
  }
  return core::make_unexpected(core::error_code::internal, "unhandled operator", kComponent);
}

} // namespace

auto parse_operator(std::string_view token) -> std::expected<operator_tag, core::error> {
  const auto key = lower(token);
  auto it = std::find_if(kOperatorSpellings.begin(), kOperatorSpellings.end(),
                         [&](const operator_spelling& s) { return s.token == key; });
  if (it == kOperatorSpellings.end()) {
    return core::make_unexpected(core::error_code::unsupported_operator,
                                 "unsupported operator '" + std::string(token) + "'", kComponent);
  }
  return it->tag;
}

auto to_string(operator_tag op) -> std::string_view {
  switch (op) {
    case operator_tag::eq: return "eq";
    case operator_tag::ne: return "ne";
    case operator_tag::gt: return "gt";
    case operator_tag::ge: return "ge";
    case operator_tag::lt: return "lt";
    case operator_tag::le: return "le";
    case operator_tag::contains: return "contains";
    case operator_tag::between: return "between";
    case operator_tag::in: return "in";
  }
  return "?";
}

auto parse_logic(std::string_view token) -> std::expected<combine_logic, core::error> {
  const auto key = lower(token);
  if (key == "and") return combine_logic::all_of;
  if (key == "or") return combine_logic::any_of;
  return core::make_unexpected(core::error_code::invalid_argument,
                               "logic must be AND or OR", kComponent);
}

auto quote_identifier(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('"');
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

auto escape_like(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '%' || c == '_' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

auto compile_filters(std::span<const filter_rule> rules, combine_logic logic,
                     std::span<const column_descriptor> known_columns)
    -> std::expected<compiled_predicate, core::error> {
  compiled_predicate out{};
  if (rules.empty()) return out; // no WHERE filtering

  std::vector<std::string> clauses;
  clauses.reserve(rules.size());
  for (std::size_t i = 0; i < rules.size(); ++i) {
    const auto& r = rules[i];
    const auto* column = find_column(known_columns, r.column);
    if (column == nullptr) {
      return core::make_unexpected(core::error_code::unknown_column,
                                   rule_context(i, r) + ": column not in dataset schema", kComponent);
    }
    auto op = parse_operator(r.op);
    if (!op) {
      return core::make_unexpected(core::error_code::unsupported_operator,
                                   rule_context(i, r) + ": " + op.error().message, kComponent);
    }
    auto clause = compile_rule(i, r, *op, column->type, out.parameters);
    if (!clause) return std::unexpected(clause.error());
    clauses.push_back(std::move(*clause));
  }

  if (clauses.size() == 1) {
    out.clause = std::move(clauses.front());
  } else {
    const std::string_view joiner = logic == combine_logic::any_of ? " OR " : " AND ";
    for (std::size_t i = 0; i < clauses.size(); ++i) {
      if (i) out.clause += joiner;
      out.clause += "(" + clauses[i] + ")";
    }
  }
  out.clause_count = clauses.size();
  return out;
}

} // namespace grainguard
