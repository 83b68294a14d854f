#include "grainguard/schema_descriptor.hpp"

#include <utility>

namespace grainguard {

auto describe(engine::engine_session& session)
    -> std::expected<std::vector<column_descriptor>, core::error> {
  auto raw = session.describe();
  if (!raw) return std::unexpected(raw.error());
  std::vector<column_descriptor> out;
  out.reserve(raw->size());
  for (auto& c : *raw) {
    column_descriptor d{};
    d.type = parse_type_tag(c.declared_type);
    d.name = std::move(c.name);
    d.declared_type_name = std::move(c.declared_type);
    d.nullable = c.nullable;
    out.push_back(std::move(d));
  }
  return out;
}

auto describe(engine::query_engine& engine, const dataset_handle& dataset)
    -> std::expected<std::vector<column_descriptor>, core::error> {
  auto session = engine.open_session(dataset);
  if (!session) return std::unexpected(session.error());
  return describe(**session);
}

} // namespace grainguard
