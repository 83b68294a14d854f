#include <catch2/catch_all.hpp>
#include <grainguard/engine/sqlite_engine.hpp>
#include <grainguard/schema_descriptor.hpp>

#include <chrono>
#include <stop_token>

#include "tests/support/dataset_fixture.hpp"

using namespace grainguard;
using core::error_code;
using engine::collecting_sink;
using engine::exec_options;
using engine::sqlite_engine;
using engine::statement;

TEST_CASE("sqlite engine infers column types", "[integration][engine]") {
  test_support::temp_dir dir;
  const auto path = test_support::write_dataset(dir.path(), "orders", test_support::kOrdersCsv);
  sqlite_engine eng;

  auto cols = describe(eng, dataset_handle{"orders", path});
  REQUIRE(cols.has_value());
  REQUIRE(cols->size() == 6);
  const auto& c = *cols;
  REQUIRE(c[0].name == "order_id");
  REQUIRE(c[0].type == type_tag::integer);
  REQUIRE(c[0].declared_type_name == "BIGINT");
  REQUIRE(c[1].type == type_tag::string);
  REQUIRE(c[2].type == type_tag::timestamp);
  REQUIRE(c[3].type == type_tag::floating);
  REQUIRE(c[4].type == type_tag::boolean);
  REQUIRE(c[5].name == "status");
  REQUIRE_FALSE(c[0].nullable);
}

TEST_CASE("sqlite engine header normalization and nullability", "[integration][engine]") {
  test_support::temp_dir dir;
  const auto path = test_support::write_dataset(dir.path(), "odd",
      "id,,id,paid_at,when\n"
      "1,a,x,2024-01-01 10:00:00,2024-01-01\n"
      "2,b,y,,2024-01-02\n"
      "3,c,z,2024-01-03 11:00:00,2024-01-03\n");
  sqlite_engine eng;
  auto cols = describe(eng, dataset_handle{"odd", path});
  REQUIRE(cols.has_value());
  REQUIRE((*cols)[1].name == "column1");
  REQUIRE((*cols)[2].name == "id_1");
  REQUIRE((*cols)[3].type == type_tag::timestamp);
  REQUIRE((*cols)[3].nullable);
  REQUIRE((*cols)[4].declared_type_name == "DATE");
  REQUIRE_FALSE((*cols)[4].nullable);
}

TEST_CASE("sqlite engine missing and malformed datasets", "[integration][engine]") {
  test_support::temp_dir dir;
  sqlite_engine eng;

  auto gone = eng.open_session(dataset_handle{"gone", dir.path() / "gone.csv"});
  REQUIRE_FALSE(gone.has_value());
  REQUIRE(gone.error().code == error_code::dataset_not_found);

  const auto empty = test_support::write_dataset(dir.path(), "empty", "");
  auto e = eng.open_session(dataset_handle{"empty", empty});
  REQUIRE_FALSE(e.has_value());
  REQUIRE(e.error().code == error_code::schema_unavailable);

  const auto broken = test_support::write_dataset(dir.path(), "broken", "a,b\n\"unterminated,1\n");
  auto b = eng.open_session(dataset_handle{"broken", broken});
  REQUIRE_FALSE(b.has_value());
  REQUIRE(b.error().code == error_code::schema_unavailable);
}

TEST_CASE("sqlite engine ragged rows", "[integration][engine]") {
  test_support::temp_dir dir;
  const auto path = test_support::write_dataset(dir.path(), "ragged", "a,b\n1,2\n3\n4,5\n");

  sqlite_engine lenient;
  auto s = lenient.open_session(dataset_handle{"ragged", path});
  REQUIRE(s.has_value());
  collecting_sink sink;
  auto n = (*s)->execute(statement{"SELECT COUNT(*) FROM \"v\"", {}}, sink, exec_options{});
  REQUIRE(n.has_value());
  REQUIRE(std::get<std::int64_t>(sink.rows()[0][0]) == 2);

  engine::sqlite_engine_options strict_opts;
  strict_opts.skip_malformed_rows = false;
  sqlite_engine strict(strict_opts);
  auto f = strict.open_session(dataset_handle{"ragged", path});
  REQUIRE_FALSE(f.has_value());
  REQUIRE(f.error().code == error_code::schema_unavailable);
}

TEST_CASE("sqlite engine binds parameters and converts cells", "[integration][engine]") {
  test_support::temp_dir dir;
  const auto path = test_support::write_dataset(dir.path(), "orders", test_support::kOrdersCsv);
  sqlite_engine eng;
  auto s = eng.open_session(dataset_handle{"orders", path});
  REQUIRE(s.has_value());

  collecting_sink sink;
  statement st{"SELECT \"order_id\", \"first_purchase_flag\", \"order_total_amount\", \"status\" FROM \"v\" "
               "WHERE \"member_id\" = ? AND \"first_purchase_flag\" = ? ORDER BY 1",
               {std::string("M1"), false}};
  auto n = (*s)->execute(st, sink, exec_options{});
  REQUIRE(n.has_value());
  REQUIRE(*n == 2);
  REQUIRE(sink.columns().size() == 4);
  REQUIRE(std::get<std::int64_t>(sink.rows()[0][0]) == 1003);
  REQUIRE(std::get<bool>(sink.rows()[0][1]) == false);
  REQUIRE(std::get<double>(sink.rows()[0][2]) == Catch::Approx(200.0));
  REQUIRE(std::get<std::string>(sink.rows()[1][3]) == "refunded");
}

TEST_CASE("sqlite engine sanitizes engine errors", "[integration][engine]") {
  test_support::temp_dir dir;
  const auto path = test_support::write_dataset(dir.path(), "orders", test_support::kOrdersCsv);
  sqlite_engine eng;
  auto s = eng.open_session(dataset_handle{"orders", path});
  REQUIRE(s.has_value());

  collecting_sink sink;
  auto bad = (*s)->execute(statement{"SELECT \"no_such_column\" FROM \"v\"", {}}, sink, exec_options{});
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == error_code::execution_failed);
  REQUIRE(bad.error().message.find("no_such_column") == std::string::npos);

  auto mismatch = (*s)->execute(statement{"SELECT * FROM \"v\" WHERE \"order_id\" = ?", {}}, sink, exec_options{});
  REQUIRE_FALSE(mismatch.has_value());
  REQUIRE(mismatch.error().code == error_code::execution_failed);
}

TEST_CASE("sqlite engine timeout and cancellation", "[integration][engine]") {
  test_support::temp_dir dir;
  const auto path = test_support::write_dataset(dir.path(), "orders", test_support::kOrdersCsv);
  sqlite_engine eng;
  auto s = eng.open_session(dataset_handle{"orders", path});
  REQUIRE(s.has_value());

  const statement endless{
      "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT COUNT(*) FROM c", {}};
  collecting_sink sink;
  exec_options bounded{};
  bounded.timeout = std::chrono::milliseconds(50);
  auto t = (*s)->execute(endless, sink, bounded);
  REQUIRE_FALSE(t.has_value());
  REQUIRE(t.error().code == error_code::execution_failed);
  REQUIRE(t.error().message == "execution timed out");

  std::stop_source src;
  src.request_stop();
  exec_options cancelled{};
  cancelled.stop = src.get_token();
  auto c = (*s)->execute(statement{"SELECT 1", {}}, sink, cancelled);
  REQUIRE_FALSE(c.has_value());
  REQUIRE(c.error().message == "execution cancelled");

  // session stays usable after an interrupt
  collecting_sink again;
  auto ok = (*s)->execute(statement{"SELECT COUNT(*) FROM \"v\"", {}}, again, exec_options{});
  REQUIRE(ok.has_value());
  REQUIRE(std::get<std::int64_t>(again.rows()[0][0]) == 6);
}

TEST_CASE("sqlite engine time buckets", "[integration][engine]") {
  test_support::temp_dir dir;
  const auto path = test_support::write_dataset(dir.path(), "orders", test_support::kOrdersCsv);
  sqlite_engine eng;
  auto s = eng.open_session(dataset_handle{"orders", path});
  REQUIRE(s.has_value());

  collecting_sink sink;
  const auto sql = "SELECT DISTINCT " + (*s)->time_bucket("\"purchase_time\"", engine::time_granularity::month) +
                   " FROM \"v\" ORDER BY 1";
  REQUIRE((*s)->execute(statement{sql, {}}, sink, exec_options{}).has_value());
  REQUIRE(sink.rows().size() == 2);
  REQUIRE(std::get<std::string>(sink.rows()[0][0]) == "2024-01");
  REQUIRE(std::get<std::string>(sink.rows()[1][0]) == "2024-02");
}

TEST_CASE("sqlite engine stores time columns as canonical UTC text", "[integration][engine][time]") {
  test_support::temp_dir dir;
  const auto path = test_support::write_dataset(dir.path(), "stamps",
      "at,day\n"
      "2024-03-01T23:30:00-02:00,2024-03-01\n"
      "2024-03-02 08:15:30.25,2024-03-02\n"
      "2024-03-02T09:00Z,2024-03-03\n");
  sqlite_engine eng;
  auto s = eng.open_session(dataset_handle{"stamps", path});
  REQUIRE(s.has_value());

  collecting_sink sink;
  REQUIRE((*s)->execute(statement{"SELECT \"at\", \"day\" FROM \"v\" ORDER BY 1", {}}, sink, exec_options{}).has_value());
  REQUIRE(sink.rows().size() == 3);
  REQUIRE(std::get<std::string>(sink.rows()[0][0]) == "2024-03-02 01:30:00");
  REQUIRE(std::get<std::string>(sink.rows()[1][0]) == "2024-03-02 08:15:30.250");
  REQUIRE(std::get<std::string>(sink.rows()[2][0]) == "2024-03-02 09:00:00");
  REQUIRE(std::get<std::string>(sink.rows()[0][1]) == "2024-03-01");
}
