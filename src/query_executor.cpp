#include "grainguard/query_executor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

#include "grainguard/core/platform_utils.hpp"
#include "grainguard/export/csv_writer.hpp"
#include "grainguard/export/xlsx_writer.hpp"
#include "grainguard/filter_compiler.hpp"
#include "grainguard/schema_descriptor.hpp"

namespace grainguard {

namespace {

auto lower(std::string_view s) -> std::string {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto single_count(const engine::collecting_sink& sink) -> std::expected<std::uint64_t, core::error> {
  if (sink.rows().size() != 1 || sink.rows().front().size() != 1) {
    return core::make_unexpected(core::error_code::internal, "count query returned no scalar", "executor.count");
  }
  const auto& cell = sink.rows().front().front();
  if (const auto* n = std::get_if<std::int64_t>(&cell); n && *n >= 0) {
    return static_cast<std::uint64_t>(*n);
  }
  return core::make_unexpected(core::error_code::internal, "count query returned a non-integer", "executor.count");
}

} // namespace

auto parse_export_format(std::string_view token) -> std::expected<export_format, core::error> {
  const auto t = lower(token);
  if (t == "csv") return export_format::csv;
  if (t == "xlsx") return export_format::xlsx;
  return core::make_unexpected(core::error_code::invalid_argument,
                               "Unsupported export format: " + std::string(token), "executor.export");
}

auto file_extension(export_format f) -> std::string_view {
  switch (f) {
    case export_format::csv: return "csv";
    case export_format::xlsx: return "xlsx";
  }
  return "bin";
}

auto media_type(export_format f) -> std::string_view {
  switch (f) {
    case export_format::csv: return "text/csv";
    case export_format::xlsx: return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
  }
  return "application/octet-stream";
}

query_executor::query_executor(engine::query_engine& engine, engine_config cfg)
    : engine_(engine), cfg_(std::move(cfg)) {}

auto query_executor::options(std::stop_token stop) const -> engine::exec_options {
  return engine::exec_options{cfg_.execution_timeout, std::move(stop)};
}

auto query_executor::count(engine::engine_session& session, const compiled_predicate& predicate,
                           const engine::exec_options& opts) -> std::expected<std::uint64_t, core::error> {
  engine::statement st{"SELECT COUNT(*) FROM " + std::string(session.relation()) + predicate.where_sql(),
                       predicate.parameters};
  engine::collecting_sink sink;
  if (auto r = session.execute(st, sink, opts); !r) return std::unexpected(r.error());
  return single_count(sink);
}

auto query_executor::run_preview(const dataset_handle& dataset, const compiled_predicate& predicate,
                                 std::stop_token stop) -> std::expected<preview_result, core::error> {
  auto session = engine_.open_session(dataset);
  if (!session) return std::unexpected(session.error());

  const auto t0 = std::chrono::steady_clock::now();
  auto n = count(**session, predicate, options(std::move(stop)));
  if (!n) return std::unexpected(n.error());
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);

  if (core::debug_enabled()) {
    std::cerr << "[EXEC][preview] " << dataset.id << " clauses=" << predicate.clause_count
              << " matched=" << *n << " elapsed_ms=" << elapsed.count() << std::endl;
  }
  return preview_result{*n, elapsed};
}

auto query_executor::preview_filtered(const dataset_handle& dataset, std::span<const filter_rule> rules,
                                      combine_logic logic, std::stop_token stop)
    -> std::expected<preview_result, core::error> {
  auto session = engine_.open_session(dataset);
  if (!session) return std::unexpected(session.error());
  auto columns = describe(**session);
  if (!columns) return std::unexpected(columns.error());
  auto predicate = compile_filters(rules, logic, *columns);
  if (!predicate) return std::unexpected(predicate.error());

  const auto t0 = std::chrono::steady_clock::now();
  auto n = count(**session, *predicate, options(std::move(stop)));
  if (!n) return std::unexpected(n.error());
  return preview_result{
      *n, std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0)};
}

auto query_executor::stream_export(engine::engine_session& session, const compiled_predicate& predicate,
                                   export_format format, std::ostream& out, const engine::exec_options& opts)
    -> std::expected<std::uint64_t, core::error> {
  engine::statement st{"SELECT * FROM " + std::string(session.relation()) + predicate.where_sql(),
                       predicate.parameters};
  if (format == export_format::csv) {
    exporting::csv_writer sink(out);
    return session.execute(st, sink, opts);
  }
  exporting::xlsx_writer sink(out);
  return session.execute(st, sink, opts);
}

auto query_executor::export_to(const dataset_handle& dataset, const compiled_predicate& predicate,
                               export_format format, std::ostream& out, std::stop_token stop)
    -> std::expected<std::uint64_t, core::error> {
  auto session = engine_.open_session(dataset);
  if (!session) return std::unexpected(session.error());
  return stream_export(**session, predicate, format, out, options(std::move(stop)));
}

auto query_executor::write_artifact(engine::engine_session& session, const dataset_handle& dataset,
                                    const compiled_predicate& predicate, export_format format,
                                    const engine::exec_options& opts)
    -> std::expected<export_artifact, core::error> {
  std::error_code ec;
  std::filesystem::create_directories(cfg_.output_dir, ec);
  if (ec) {
    return core::make_unexpected(core::error_code::io_failed,
                                 "Cannot create output directory", "executor.export");
  }
  const std::string filename = dataset.id + "_filtered." + std::string(file_extension(format));
  const auto path = cfg_.output_dir / filename;
  auto partial = path;
  partial += ".part";

  std::uint64_t rows = 0;
  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
      return core::make_unexpected(core::error_code::io_failed, "Cannot open export file", "executor.export");
    }
    auto n = stream_export(session, predicate, format, out, opts);
    if (!n) {
      out.close();
      std::filesystem::remove(partial, ec);
      return std::unexpected(n.error());
    }
    rows = *n;
  }
  std::filesystem::rename(partial, path, ec);
  if (ec) {
    std::filesystem::remove(partial, ec);
    return core::make_unexpected(core::error_code::io_failed, "Cannot finalize export file", "executor.export");
  }
  if (core::debug_enabled()) {
    std::cerr << "[EXEC][export] " << dataset.id << " -> " << path.string() << " rows=" << rows << std::endl;
  }
  return export_artifact{path, filename, std::string(media_type(format)), rows};
}

auto query_executor::run_export(const dataset_handle& dataset, const compiled_predicate& predicate,
                                export_format format, std::stop_token stop)
    -> std::expected<export_artifact, core::error> {
  auto session = engine_.open_session(dataset);
  if (!session) return std::unexpected(session.error());
  return write_artifact(**session, dataset, predicate, format, options(std::move(stop)));
}

auto query_executor::export_filtered(const dataset_handle& dataset, std::span<const filter_rule> rules,
                                     combine_logic logic, export_format format, std::stop_token stop)
    -> std::expected<export_artifact, core::error> {
  auto session = engine_.open_session(dataset);
  if (!session) return std::unexpected(session.error());
  auto columns = describe(**session);
  if (!columns) return std::unexpected(columns.error());
  auto predicate = compile_filters(rules, logic, *columns);
  if (!predicate) return std::unexpected(predicate.error());
  return write_artifact(**session, dataset, *predicate, format, options(std::move(stop)));
}

auto query_executor::sample_rows(const dataset_handle& dataset, std::size_t limit, std::stop_token stop)
    -> std::expected<sample_result, core::error> {
  auto session = engine_.open_session(dataset);
  if (!session) return std::unexpected(session.error());
  const auto opts = options(std::move(stop));

  auto total = count(**session, compiled_predicate{}, opts);
  if (!total) return std::unexpected(total.error());

  const auto n = clamp_row_limit(cfg_, limit);
  engine::statement st{"SELECT * FROM " + std::string((*session)->relation()) + " LIMIT ?",
                       {static_cast<std::int64_t>(n)}};
  engine::collecting_sink sink;
  if (auto r = (*session)->execute(st, sink, opts); !r) return std::unexpected(r.error());

  sample_result out;
  out.columns = sink.columns();
  out.rows = std::move(sink.rows());
  out.total_rows = *total;
  return out;
}

auto query_executor::distinct_values(const dataset_handle& dataset, std::string_view column,
                                     std::size_t limit, std::stop_token stop)
    -> std::expected<std::vector<cell_value>, core::error> {
  auto session = engine_.open_session(dataset);
  if (!session) return std::unexpected(session.error());
  auto columns = describe(**session);
  if (!columns) return std::unexpected(columns.error());
  if (!has_column(*columns, column)) {
    return core::make_unexpected(core::error_code::unknown_column,
                                 "column '" + std::string(column) + "' not in dataset schema",
                                 "executor.distinct");
  }

  const auto col = quote_identifier(column);
  engine::statement st{"SELECT DISTINCT " + col + " FROM " + std::string((*session)->relation()) +
                           " WHERE " + col + " IS NOT NULL ORDER BY 1 LIMIT ?",
                       {static_cast<std::int64_t>(clamp_row_limit(cfg_, limit))}};
  engine::collecting_sink sink;
  if (auto r = (*session)->execute(st, sink, options(std::move(stop))); !r) return std::unexpected(r.error());

  std::vector<cell_value> values;
  values.reserve(sink.rows().size());
  for (auto& row : sink.rows()) {
    if (!row.empty()) values.push_back(std::move(row.front()));
  }
  return values;
}

} // namespace grainguard
