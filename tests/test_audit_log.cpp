#include "posmr/storage/audit_log.h"

#include <catch2/catch.hpp>

using posmr::storage::InMemoryAuditLog;

TEST_CASE("InMemoryAuditLog returns events in append order per trace", "[audit_log]") {
  InMemoryAuditLog log;
  log.append({"e1", "trace-2", "RunStarted", "{}", "2026-02-01T00:00:00Z", {}});
  log.append({"e2", "trace-1", "RunStarted", "{}", "2026-02-01T00:00:00Z", {}});
  log.append({"e3", "trace-2", "RunCompleted", "{}", "2026-02-01T00:00:01Z", {"S1"}});

  const auto events = log.query("trace-2");
  REQUIRE(events.size() == 2);
  CHECK(events[0].event_id == "e1");
  CHECK(events[1].event_id == "e3");
  CHECK(events[1].refs == std::vector<std::string>{"S1"});

  CHECK(log.query("").size() == 3);
  CHECK(log.query("missing").empty());
  CHECK(log.list_trace_ids() == std::vector<std::string>{"trace-1", "trace-2"});
}
