#include "posmr/storage/sqlite/sqlite_audit_log.h"
#include "posmr/storage/sqlite/sqlite_db.h"

#include <catch2/catch.hpp>

using namespace posmr;

namespace {

std::shared_ptr<storage::sqlite::SqliteDb> open_memory_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  return db;
}

}  // namespace

TEST_CASE("Schema v1 is applied once", "[sqlite][schema]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();

  CHECK(db->get_schema_version() == 0);
  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqliteAuditLog append and query", "[sqlite][audit]") {
  storage::sqlite::SqliteAuditLog audit_log(open_memory_db());

  const std::string trace_id = "trace-001";
  audit_log.append({"evt-001", trace_id, "RunStarted", R"({"displays":1})", "2026-02-01T00:00:00Z", {}});
  audit_log.append({"evt-002", trace_id, "AnomalyCapped", R"({"raw_completed":3,"required":2})",
                    "2026-02-01T00:00:01Z", {"S1", "M1"}});
  audit_log.append({"evt-003", trace_id, "RunCompleted", "{}", "2026-02-01T00:00:02Z", {}});

  const auto events = audit_log.query(trace_id);
  REQUIRE(events.size() == 3);
  CHECK(events[0].event_id == "evt-001");
  CHECK(events[1].event_id == "evt-002");
  CHECK(events[2].event_id == "evt-003");

  CHECK(events[0].refs.empty());
  CHECK(events[1].refs == std::vector<std::string>{"S1", "M1"});
  CHECK(events[1].payload == R"({"raw_completed":3,"required":2})");
  CHECK(events[1].created_at == "2026-02-01T00:00:01Z");
  CHECK(audit_log.failed_writes() == 0);
}

TEST_CASE("SqliteAuditLog keeps traces apart", "[sqlite][audit]") {
  storage::sqlite::SqliteAuditLog audit_log(open_memory_db());

  audit_log.append({"evt-1b", "trace-B", "RunStarted", "{}", "2026-02-01T00:00:00Z", {}});
  audit_log.append({"evt-1a", "trace-A", "RunStarted", "{}", "2026-02-01T00:00:00Z", {}});
  audit_log.append({"evt-2a", "trace-A", "RunCompleted", "{}", "2026-02-01T00:00:01Z", {}});

  const auto trace_a = audit_log.query("trace-A");
  REQUIRE(trace_a.size() == 2);
  CHECK(trace_a[0].event_id == "evt-1a");
  CHECK(trace_a[1].event_id == "evt-2a");
  CHECK(audit_log.query("trace-B").size() == 1);
  CHECK(audit_log.query("trace-C").empty());

  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"trace-A", "trace-B"});

  const auto all = audit_log.query("");
  REQUIRE(all.size() == 3);
  CHECK(all[0].trace_id == "trace-A");
  CHECK(all[2].trace_id == "trace-B");
}

TEST_CASE("SqliteAuditLog counts failed writes instead of throwing", "[sqlite][audit]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  storage::sqlite::SqliteAuditLog audit_log(db_result.value());  // no schema

  audit_log.append({"evt-1", "trace-X", "RunStarted", "{}", "2026-02-01T00:00:00Z", {}});
  CHECK(audit_log.failed_writes() == 1);
}
