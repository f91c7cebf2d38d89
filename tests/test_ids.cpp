#include "posmr/core/clock.h"
#include "posmr/core/id_generator.h"
#include "posmr/core/ids.h"

#include <catch2/catch.hpp>

TEST_CASE("ID generators produce prefixed values", "[ids]") {
  SECTION("SystemIdGenerator ids are prefixed and distinct") {
    posmr::core::SystemIdGenerator gen;
    const auto first = posmr::core::new_trace_id(gen);
    const auto second = posmr::core::new_trace_id(gen);

    CHECK(first.value.rfind("trace-", 0) == 0);
    CHECK(first != second);
  }

  SECTION("DeterministicIdGenerator repeats its sequence") {
    posmr::core::DeterministicIdGenerator a;
    posmr::core::DeterministicIdGenerator b;

    CHECK(posmr::core::new_trace_id(a).value == "trace-0");
    CHECK(a.next("evt") == "evt-1");
    CHECK(posmr::core::new_trace_id(b).value == "trace-0");
  }
}

TEST_CASE("date_prefix extracts the calendar day", "[clock]") {
  CHECK(posmr::core::date_prefix("2026-02-01T08:00:00Z") == "2026-02-01");
  CHECK(posmr::core::date_prefix("2026-02-01") == "2026-02-01");
  CHECK(posmr::core::date_prefix("02/01/2026") == "");
  CHECK(posmr::core::date_prefix("").empty());
}

TEST_CASE("FixedClock is stable", "[clock]") {
  posmr::core::FixedClock clock("2026-02-01T00:00:00Z");
  CHECK(clock.now_iso8601() == clock.now_iso8601());
}
