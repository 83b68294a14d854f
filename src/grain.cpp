#include "grainguard/grain.hpp"

namespace grainguard {

auto to_string(grain g) -> std::string_view {
  switch (g) {
    case grain::order: return "order";
    case grain::item: return "item";
    case grain::member: return "member";
  }
  return "unknown";
}

auto parse_grain(std::string_view name) -> std::optional<grain> {
  if (name == "order") return grain::order;
  if (name == "item") return grain::item;
  if (name == "member") return grain::member;
  return std::nullopt;
}

auto detect_grains(std::span<const column_descriptor> columns) -> grain_set {
  grain_set out;
  for (const auto& m : kGrainMarkers) {
    if (has_column(columns, m.column)) out.insert(m.kind);
  }
  return out;
}

} // namespace grainguard
