#pragma once

/** \file grain.hpp
 *  \brief Heuristic grain detection from column presence.
 *
 * Detection is not guaranteed correct: a marker column only suggests that one
 * row may represent an order, an order line item or a member. Markers match
 * exact column names (order_number is not order_id).
 */

#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string_view>

#include "grainguard/schema.hpp"

namespace grainguard {

enum class grain : std::uint8_t { order, item, member };

/** \brief Detected grains; iteration order is the enum order. */
using grain_set = std::set<grain>;

/** \brief Column whose presence implies a grain. */
struct grain_marker {
  grain kind;
  std::string_view column;
};

inline constexpr std::array<grain_marker, 3> kGrainMarkers{{
  {grain::order, "order_id"},
  {grain::item, "product_id"},
  {grain::member, "member_id"},
}};

auto to_string(grain g) -> std::string_view;
auto parse_grain(std::string_view name) -> std::optional<grain>;

/** \brief Grains consistent with the schema; empty when no marker is present.
 *
 * Monotonic: adding columns never removes a detected grain.
 */
auto detect_grains(std::span<const column_descriptor> columns) -> grain_set;

} // namespace grainguard
