#include "grainguard/filter_parse.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "grainguard/filter_compiler.hpp"

namespace grainguard {

namespace {

auto is_quote(char c) -> bool { return c == '"' || c == '\''; }

auto quoted(std::string_view token) -> bool {
  return token.size() >= 2 && is_quote(token.front()) && token.back() == token.front();
}

// "007", "-01": codes, not numbers.
auto leading_zero(std::string_view token) -> bool {
  std::size_t k = !token.empty() && (token[0] == '-' || token[0] == '+') ? 1 : 0;
  return k + 1 < token.size() && token[k] == '0' &&
         std::isdigit(static_cast<unsigned char>(token[k + 1])) != 0;
}

// Split on ',' outside an item-leading quote pair; empty items are dropped.
auto split_items(std::string_view value) -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  char quote = 0;
  for (std::size_t i = 0; i <= value.size(); ++i) {
    if (i < value.size()) {
      const char c = value[i];
      if (quote != 0) {
        if (c == quote) quote = 0;
        continue;
      }
      if (i == start && is_quote(c)) { quote = c; continue; }
      if (c != ',') continue;
    }
    if (i > start) out.push_back(value.substr(start, i - start));
    start = i + 1;
  }
  return out;
}

} // namespace

auto parse_scalar_token(std::string_view token) -> scalar_value {
  if (quoted(token)) return std::string(token.substr(1, token.size() - 2));
  if (token == "true") return true;
  if (token == "false") return false;
  const char* first = token.data();
  const char* last = token.data() + token.size();
  if (!token.empty() && !leading_zero(token)) {
    std::int64_t i{};
    if (auto [p, ec] = std::from_chars(first, last, i); ec == std::errc{} && p == last) return i;
    double d{};
    if (auto [p, ec] = std::from_chars(first, last, d); ec == std::errc{} && p == last && std::isfinite(d)) {
      return d;
    }
  }
  return std::string(token);
}

auto parse_filter_arg(std::string_view text) -> std::expected<filter_rule, core::error> {
  const auto c1 = text.find(':');
  const auto c2 = c1 == std::string_view::npos ? std::string_view::npos : text.find(':', c1 + 1);
  if (c2 == std::string_view::npos || c1 == 0 || c2 == c1 + 1) {
    return core::make_unexpected(core::error_code::invalid_argument,
                                 "filter must be column:op:value, got '" + std::string(text) + "'",
                                 "cli.filter");
  }
  filter_rule rule;
  rule.column = std::string(text.substr(0, c1));
  rule.op = std::string(text.substr(c1 + 1, c2 - c1 - 1));
  const auto value = text.substr(c2 + 1);

  auto op = parse_operator(rule.op);
  if (op && (*op == operator_tag::between || *op == operator_tag::in)) {
    std::vector<scalar_value> items;
    for (auto item : split_items(value)) items.push_back(parse_scalar_token(item));
    rule.value = std::move(items);
  } else {
    rule.value = parse_scalar_token(value);
  }
  return rule;
}

} // namespace grainguard
