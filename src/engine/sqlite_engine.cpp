/** \file sqlite_engine.cpp
 *  \brief SQLite-backed sessions: CSV load with type inference, bound execution, deadlines.
 */

#include "grainguard/engine/sqlite_engine.hpp"

#include <sqlite3.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <stop_token>
#include <system_error>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "grainguard/core/platform_utils.hpp"
#include "grainguard/filter_compiler.hpp"

namespace grainguard::engine {

namespace {

constexpr const char* kLoadComponent = "engine.sqlite.load";
constexpr const char* kExecComponent = "engine.sqlite.execute";
constexpr std::string_view kRelation = "\"v\"";
constexpr const char* kTimeFormat = "%Y-%m-%d %H:%M:%S";
constexpr const char* kTimeFormatFractional = "%Y-%m-%d %H:%M:%f";

struct db_closer {
  void operator()(sqlite3* db) const noexcept { sqlite3_close_v2(db); }
};
struct stmt_finalizer {
  void operator()(sqlite3_stmt* s) const noexcept { sqlite3_finalize(s); }
};
using db_ptr = std::unique_ptr<sqlite3, db_closer>;
using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_finalizer>;

// ---- value recognition -------------------------------------------------------

auto parse_bool(std::string_view s) -> std::optional<bool> {
  if (s.size() != 4 && s.size() != 5) return std::nullopt;
  std::string l(s);
  for (auto& c : l) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (l == "true") return true;
  if (l == "false") return false;
  return std::nullopt;
}

auto parse_int(std::string_view s) -> std::optional<std::int64_t> {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  std::int64_t v{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

auto parse_double(std::string_view s) -> std::optional<double> {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  double v{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

auto digits(std::string_view s, std::size_t pos, std::size_t n, int& out) -> bool {
  if (pos + n > s.size()) return false;
  out = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    out = out * 10 + (s[i] - '0');
  }
  return true;
}

// YYYY-MM-DD[( |T)HH:MM[:SS[.f+]]][Z|(+|-)HH:MM]
auto parse_iso_time(std::string_view s, bool& date_only) -> bool {
  int y{}, mo{}, d{};
  if (!digits(s, 0, 4, y) || s.size() < 10 || s[4] != '-' || !digits(s, 5, 2, mo) || s[7] != '-' ||
      !digits(s, 8, 2, d)) {
    return false;
  }
  if (mo < 1 || mo > 12 || d < 1 || d > 31) return false;
  if (s.size() == 10) { date_only = true; return true; }
  date_only = false;
  if (s[10] != ' ' && s[10] != 'T') return false;
  int h{}, mi{}, sec{};
  if (!digits(s, 11, 2, h) || s.size() < 16 || s[13] != ':' || !digits(s, 14, 2, mi)) return false;
  if (h > 23 || mi > 59) return false;
  std::size_t pos = 16;
  if (pos < s.size() && s[pos] == ':') {
    if (!digits(s, pos + 1, 2, sec) || sec > 59) return false;
    pos += 3;
    if (pos < s.size() && s[pos] == '.') {
      ++pos;
      const auto start = pos;
      while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
      if (pos == start) return false;
    }
  }
  if (pos == s.size()) return true;
  if (s[pos] == 'Z' && pos + 1 == s.size()) return true;
  int oh{}, om{};
  if ((s[pos] == '+' || s[pos] == '-') && pos + 6 == s.size() && digits(s, pos + 1, 2, oh) &&
      s[pos + 3] == ':' && digits(s, pos + 4, 2, om)) {
    return oh <= 23 && om <= 59;
  }
  return false;
}

// ---- type inference ------------------------------------------------------------

enum class column_kind { boolean, bigint, real, date, timestamp, text };

struct column_profile {
  bool maybe_bool{true};
  bool maybe_int{true};
  bool maybe_double{true};
  bool maybe_time{true};
  bool all_date_only{true};
  bool saw_value{false};
  bool saw_null{false};

  void observe(const io::csv_field& f) {
    if (f.is_null()) { saw_null = true; return; }
    saw_value = true;
    if (maybe_bool && !parse_bool(f.text)) maybe_bool = false;
    if (maybe_int && !parse_int(f.text)) maybe_int = false;
    if (maybe_double && !parse_double(f.text)) maybe_double = false;
    if (maybe_time) {
      bool date_only = false;
      if (!parse_iso_time(f.text, date_only)) maybe_time = false;
      else if (!date_only) all_date_only = false;
    }
  }

  auto kind() const -> column_kind {
    if (!saw_value) return column_kind::text;
    if (maybe_bool) return column_kind::boolean;
    if (maybe_int) return column_kind::bigint;
    if (maybe_double) return column_kind::real;
    if (maybe_time) return all_date_only ? column_kind::date : column_kind::timestamp;
    return column_kind::text;
  }
};

auto declared_name(column_kind k) -> std::string_view {
  switch (k) {
    case column_kind::boolean: return "BOOLEAN";
    case column_kind::bigint: return "BIGINT";
    case column_kind::real: return "DOUBLE";
    case column_kind::date: return "DATE";
    case column_kind::timestamp: return "TIMESTAMP";
    case column_kind::text: return "VARCHAR";
  }
  return "VARCHAR";
}

auto normalize_header(const std::vector<io::csv_field>& header) -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(header.size());
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < header.size(); ++i) {
    std::string base = header[i].text.empty() ? "column" + std::to_string(i) : header[i].text;
    std::string name = base;
    for (int k = 1; seen.count(name) != 0; ++k) name = base + "_" + std::to_string(k);
    seen.insert(name);
    names.push_back(std::move(name));
  }
  return names;
}

// ---- execution deadline ----------------------------------------------------------

struct progress_state {
  std::chrono::steady_clock::time_point deadline{};
  bool has_deadline{false};
  std::stop_token stop;
  bool timed_out{false};
  bool cancelled{false};
};

int on_progress(void* p) {
  auto* st = static_cast<progress_state*>(p);
  if (st->stop.stop_requested()) { st->cancelled = true; return 1; }
  if (st->has_deadline && std::chrono::steady_clock::now() >= st->deadline) { st->timed_out = true; return 1; }
  return 0;
}

class progress_guard {
public:
  progress_guard(sqlite3* db, progress_state& st, int interval) : db_(db) {
    sqlite3_progress_handler(db_, interval, &on_progress, &st);
  }
  ~progress_guard() { sqlite3_progress_handler(db_, 0, nullptr, nullptr); }
  progress_guard(const progress_guard&) = delete;
  progress_guard& operator=(const progress_guard&) = delete;

private:
  sqlite3* db_;
};

// ---- session ---------------------------------------------------------------------

class sqlite_session final : public engine_session {
public:
  sqlite_session(db_ptr db, int progress_interval)
      : db_(std::move(db)), progress_interval_(progress_interval) {}

  auto load(const dataset_handle& dataset, const sqlite_engine_options& opts)
      -> std::expected<void, core::error>;

  auto describe() -> std::expected<std::vector<raw_column>, core::error> override;
  auto relation() const -> std::string_view override { return kRelation; }
  auto execute(const statement& stmt, row_sink& sink, const exec_options& opts)
      -> std::expected<std::uint64_t, core::error> override;
  auto time_bucket(std::string_view quoted_column, time_granularity g) const -> std::string override {
    const std::string_view fmt = g == time_granularity::month ? "'%Y-%m'" : "'%Y-%m-%d'";
    return "strftime(" + std::string(fmt) + ", " + std::string(quoted_column) + ")";
  }

private:
  auto exec_simple(const std::string& sql, const char* component) -> std::expected<void, core::error>;
  auto engine_failure(int rc, const char* component, const std::string& what) const -> core::error;

  db_ptr db_;
  int progress_interval_;
  std::vector<column_kind> kinds_;
};

auto sqlite_session::engine_failure(int rc, const char* component, const std::string& what) const
    -> core::error {
  if (core::debug_enabled()) {
    std::cerr << "[SQLITE][" << what << "] rc=" << rc << " " << sqlite3_errmsg(db_.get()) << std::endl;
  }
  // Callers only ever see the generic category, never the engine detail.
  return core::error{core::error_code::execution_failed,
                     "query execution failed: " + std::string(sqlite3_errstr(rc)), component};
}

auto sqlite_session::exec_simple(const std::string& sql, const char* component)
    -> std::expected<void, core::error> {
  char* err = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err);
  if (err) sqlite3_free(err);
  if (rc != SQLITE_OK) return std::unexpected(engine_failure(rc, component, "exec"));
  return {};
}

auto sqlite_session::load(const dataset_handle& dataset, const sqlite_engine_options& opts)
    -> std::expected<void, core::error> {
  const bool dbg = core::debug_enabled();
  std::error_code fec;
  if (!std::filesystem::is_regular_file(dataset.path, fec)) {
    return core::make_unexpected(core::error_code::dataset_not_found, "Dataset not found", kLoadComponent);
  }

  auto unavailable = [](std::string msg) {
    return core::make_unexpected(core::error_code::schema_unavailable, std::move(msg), kLoadComponent);
  };

  // Pass 1: header + type inference.
  auto reader = io::csv_reader::open(dataset.path, ',', opts.csv);
  if (!reader) return unavailable("Dataset file cannot be read");
  std::vector<io::csv_field> rec;
  auto got = reader->next(rec);
  if (!got) return unavailable(got.error().message);
  if (!*got) return unavailable("Dataset file has no header row");
  const auto names = normalize_header(rec);
  std::vector<column_profile> profiles(names.size());
  std::uint64_t rows = 0, skipped = 0;
  for (;;) {
    got = reader->next(rec);
    if (!got) return unavailable(got.error().message);
    if (!*got) break;
    if (rec.size() != names.size()) {
      if (!opts.skip_malformed_rows) {
        return unavailable("Row at line " + std::to_string(reader->record_line()) +
                           " has " + std::to_string(rec.size()) + " fields, expected " +
                           std::to_string(names.size()));
      }
      ++skipped;
      continue;
    }
    for (std::size_t i = 0; i < rec.size(); ++i) profiles[i].observe(rec[i]);
    ++rows;
  }

  kinds_.clear();
  std::string ddl = "CREATE TABLE " + std::string(kRelation) + " (";
  for (std::size_t i = 0; i < names.size(); ++i) {
    const auto k = profiles[i].kind();
    kinds_.push_back(k);
    if (i) ddl += ", ";
    ddl += quote_identifier(names[i]) + " " + std::string(declared_name(k));
    if (!profiles[i].saw_null && profiles[i].saw_value) ddl += " NOT NULL";
  }
  ddl += ")";
  if (auto ok = exec_simple(ddl, kLoadComponent); !ok) return unavailable("Dataset structure is not supported");

  // Pass 2: insert the rows accepted by pass 1. Time columns are stored as canonical
  // UTC text ("YYYY-MM-DD HH:MM:SS[.SSS]"); a timestamp slot takes (format, value).
  std::string insert = "INSERT INTO " + std::string(kRelation) + " VALUES (";
  std::vector<int> slots;
  slots.reserve(names.size());
  int next_slot = 1;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i) insert += ", ";
    slots.push_back(next_slot);
    switch (kinds_[i]) {
      case column_kind::timestamp: insert += "strftime(?, ?)"; next_slot += 2; break;
      case column_kind::date: insert += "date(?)"; ++next_slot; break;
      default: insert += "?"; ++next_slot; break;
    }
  }
  insert += ")";
  sqlite3_stmt* raw = nullptr;
  int rc = sqlite3_prepare_v2(db_.get(), insert.c_str(), static_cast<int>(insert.size()), &raw, nullptr);
  stmt_ptr ins(raw);
  if (rc != SQLITE_OK) return std::unexpected(engine_failure(rc, kLoadComponent, "load"));

  if (auto ok = exec_simple("BEGIN", kLoadComponent); !ok) return std::unexpected(ok.error());
  auto second = io::csv_reader::open(dataset.path, ',', opts.csv);
  if (!second) return unavailable("Dataset file cannot be read");
  got = second->next(rec); // header
  if (!got) return unavailable(got.error().message);
  for (;;) {
    got = second->next(rec);
    if (!got) return unavailable(got.error().message);
    if (!*got) break;
    if (rec.size() != names.size()) continue;
    for (std::size_t i = 0; i < rec.size(); ++i) {
      int idx = slots[i];
      const auto& f = rec[i];
      if (kinds_[i] == column_kind::timestamp) {
        const bool fractional = f.text.find('.') != std::string::npos;
        sqlite3_bind_text(ins.get(), idx++, fractional ? kTimeFormatFractional : kTimeFormat, -1, SQLITE_STATIC);
      }
      if (f.is_null()) { sqlite3_bind_null(ins.get(), idx); continue; }
      switch (kinds_[i]) {
        case column_kind::boolean: sqlite3_bind_int(ins.get(), idx, parse_bool(f.text).value_or(false) ? 1 : 0); break;
        case column_kind::bigint: sqlite3_bind_int64(ins.get(), idx, parse_int(f.text).value_or(0)); break;
        case column_kind::real: sqlite3_bind_double(ins.get(), idx, parse_double(f.text).value_or(0.0)); break;
        default:
          sqlite3_bind_text(ins.get(), idx, f.text.data(), static_cast<int>(f.text.size()), SQLITE_TRANSIENT);
          break;
      }
    }
    rc = sqlite3_step(ins.get());
    if (rc != SQLITE_DONE) return std::unexpected(engine_failure(rc, kLoadComponent, "load"));
    sqlite3_reset(ins.get());
    sqlite3_clear_bindings(ins.get());
  }
  if (auto ok = exec_simple("COMMIT", kLoadComponent); !ok) return std::unexpected(ok.error());

  if (dbg) {
    std::cerr << "[SQLITE][load] " << dataset.id << " columns=" << names.size() << " rows=" << rows
              << " skipped=" << skipped << std::endl;
  }
  return {};
}

auto sqlite_session::describe() -> std::expected<std::vector<raw_column>, core::error> {
  const std::string sql = "PRAGMA table_info(" + std::string(kRelation) + ")";
  sqlite3_stmt* raw = nullptr;
  const int prc = sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr);
  stmt_ptr st(raw);
  if (prc != SQLITE_OK) {
    auto e = engine_failure(prc, "engine.sqlite.describe", "describe");
    e.code = core::error_code::schema_unavailable;
    return std::unexpected(std::move(e));
  }
  std::vector<raw_column> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    raw_column c{};
    c.name = reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 1));
    if (const auto* t = sqlite3_column_text(st.get(), 2)) c.declared_type = reinterpret_cast<const char*>(t);
    c.nullable = sqlite3_column_int(st.get(), 3) == 0;
    out.push_back(std::move(c));
  }
  if (rc != SQLITE_DONE) {
    auto e = engine_failure(rc, "engine.sqlite.describe", "describe");
    e.code = core::error_code::schema_unavailable;
    return std::unexpected(std::move(e));
  }
  return out;
}

auto sqlite_session::execute(const statement& stmt, row_sink& sink, const exec_options& opts)
    -> std::expected<std::uint64_t, core::error> {
  if (opts.stop.stop_requested()) {
    return core::make_unexpected(core::error_code::execution_failed, "execution cancelled", kExecComponent);
  }
  sqlite3_stmt* raw = nullptr;
  int rc = sqlite3_prepare_v2(db_.get(), stmt.sql.c_str(), static_cast<int>(stmt.sql.size()), &raw, nullptr);
  stmt_ptr st(raw); // finalized on every return path
  if (rc != SQLITE_OK) return std::unexpected(engine_failure(rc, kExecComponent, "prepare"));
  if (sqlite3_bind_parameter_count(st.get()) != static_cast<int>(stmt.parameters.size())) {
    return core::make_unexpected(core::error_code::execution_failed,
                                 "query execution failed: parameter count mismatch", kExecComponent);
  }

  for (std::size_t i = 0; i < stmt.parameters.size(); ++i) {
    const int idx = static_cast<int>(i) + 1;
    rc = std::visit([&](const auto& v) -> int {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::string>) {
        return sqlite3_bind_text(st.get(), idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
      } else if constexpr (std::is_same_v<T, double>) {
        return sqlite3_bind_double(st.get(), idx, v);
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return sqlite3_bind_int64(st.get(), idx, v);
      } else {
        return sqlite3_bind_int(st.get(), idx, v ? 1 : 0);
      }
    }, stmt.parameters[i]);
    if (rc != SQLITE_OK) return std::unexpected(engine_failure(rc, kExecComponent, "bind"));
  }

  progress_state ps{};
  ps.stop = opts.stop;
  if (opts.timeout.count() > 0) {
    ps.has_deadline = true;
    ps.deadline = std::chrono::steady_clock::now() + opts.timeout;
  }
  progress_guard guard(db_.get(), ps, progress_interval_);

  const int ncol = sqlite3_column_count(st.get());
  std::vector<std::string> names;
  std::vector<bool> boolean_cols;
  names.reserve(static_cast<std::size_t>(ncol));
  for (int c = 0; c < ncol; ++c) {
    names.emplace_back(sqlite3_column_name(st.get(), c));
    const char* decl = sqlite3_column_decltype(st.get(), c);
    boolean_cols.push_back(decl != nullptr && std::string_view(decl) == "BOOLEAN");
  }
  if (auto ok = sink.begin(names); !ok) return std::unexpected(ok.error());

  std::uint64_t delivered = 0;
  std::vector<cell_value> cells(static_cast<std::size_t>(ncol));
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    for (int c = 0; c < ncol; ++c) {
      auto& cell = cells[static_cast<std::size_t>(c)];
      switch (sqlite3_column_type(st.get(), c)) {
        case SQLITE_NULL: cell = std::monostate{}; break;
        case SQLITE_INTEGER: {
          const auto v = static_cast<std::int64_t>(sqlite3_column_int64(st.get(), c));
          if (boolean_cols[static_cast<std::size_t>(c)]) cell = (v != 0);
          else cell = v;
          break;
        }
        case SQLITE_FLOAT: cell = sqlite3_column_double(st.get(), c); break;
        default: {
          const auto* p = static_cast<const char*>(sqlite3_column_blob(st.get(), c));
          const int n = sqlite3_column_bytes(st.get(), c);
          cell = std::string(p ? p : "", static_cast<std::size_t>(n));
          break;
        }
      }
    }
    if (auto ok = sink.row(cells); !ok) return std::unexpected(ok.error());
    ++delivered;
  }
  if (rc != SQLITE_DONE) {
    if (rc == SQLITE_INTERRUPT && (ps.timed_out || ps.cancelled)) {
      if (core::debug_enabled()) {
        std::cerr << "[SQLITE][execute] interrupted after " << delivered << " rows ("
                  << (ps.timed_out ? "timeout" : "cancel") << ")" << std::endl;
      }
      return core::make_unexpected(core::error_code::execution_failed,
                                   ps.timed_out ? "execution timed out" : "execution cancelled",
                                   kExecComponent);
    }
    return std::unexpected(engine_failure(rc, kExecComponent, "step"));
  }
  if (auto ok = sink.finish(); !ok) return std::unexpected(ok.error());
  return delivered;
}

} // namespace

sqlite_engine::sqlite_engine() : opts_{} {}
sqlite_engine::sqlite_engine(sqlite_engine_options opts) : opts_(std::move(opts)) {}

auto sqlite_engine::open_session(const dataset_handle& dataset)
    -> std::expected<std::unique_ptr<engine_session>, core::error> {
  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(":memory:", &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  db_ptr db(raw); // sqlite3_open_v2 may hand back a handle even on failure
  if (rc != SQLITE_OK) {
    return core::make_unexpected(core::error_code::execution_failed,
                                 "engine unavailable: " + std::string(sqlite3_errstr(rc)), "engine.sqlite.open");
  }
  // Unresolved "identifiers" must fail instead of degrading to string literals.
  sqlite3_db_config(db.get(), SQLITE_DBCONFIG_DQS_DML, 0, nullptr);
  sqlite3_db_config(db.get(), SQLITE_DBCONFIG_DQS_DDL, 0, nullptr);
  auto session = std::make_unique<sqlite_session>(std::move(db), opts_.progress_interval);
  if (auto ok = session->load(dataset, opts_); !ok) return std::unexpected(ok.error());
  return std::unique_ptr<engine_session>(std::move(session));
}

} // namespace grainguard::engine
