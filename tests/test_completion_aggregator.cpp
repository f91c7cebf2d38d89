#include "posmr/completion/completion_aggregator.h"

#include "posmr/completion/completion_json.h"
#include "fixtures.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <thread>

using namespace posmr;

TEST_CASE("Scenario: single submission gives partial completion", "[completion][scenario]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {fixtures::submission("sub-a", "", "S1 Official", "2026-02-01T08:00:00Z",
                                              {fixtures::response("M1", {"P1"})})};

  const auto result = completion::compute_completion(dataset);
  REQUIRE(result.records.size() == 1);
  const auto& record = result.records[0];
  CHECK(record.store_id == "S1");
  CHECK(record.completed_count == 1);
  CHECK(record.required_count == 2);
  CHECK(record.completion_rate == 50.0);
  CHECK(record.status == domain::CompletionStatus::kPartial);
  CHECK(record.contributing_submission_count == 1);
  CHECK(record.confirmed_codes == std::vector<std::string>{"P1"});
  CHECK_FALSE(record.capped);

  REQUIRE(record.evidence.size() == 1);
  CHECK(record.evidence[0].submission_id == "sub-a");
  CHECK(record.evidence[0].identity_method == "exact_store_name");
  CHECK(record.evidence[0].identity_confidence == 1.0);
  CHECK(record.evidence[0].quality_score == 90);
  CHECK(record.last_submission_at == "2026-02-01T08:00:00Z");
}

TEST_CASE("Scenario: two visits complete the store", "[completion][scenario]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {
      fixtures::submission("sub-a", "", "S1 Official", "2026-02-01T08:00:00Z",
                           {fixtures::response("M1", {"P1"})}),
      fixtures::submission("sub-b", "", "S1 Official", "2026-02-03T08:00:00Z",
                           {fixtures::response("M1", {"P2"})}),
  };

  const auto result = completion::compute_completion(dataset);
  REQUIRE(result.records.size() == 1);
  const auto& record = result.records[0];
  CHECK(record.completed_count == 2);
  CHECK(record.completion_rate == 100.0);
  CHECK(record.status == domain::CompletionStatus::kComplete);
  CHECK(record.contributing_submission_count == 2);
  CHECK(record.last_submission_at == "2026-02-03T08:00:00Z");
}

TEST_CASE("Scenario: codes outside the requirement catalog are capped", "[completion][scenario]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {fixtures::submission("sub-a", "", "S1 Official", "2026-02-01T08:00:00Z",
                                              {fixtures::response("M1", {"P1", "P2", "P3"})})};

  const auto result = completion::compute_completion(dataset);
  REQUIRE(result.records.size() == 1);
  const auto& record = result.records[0];
  CHECK(record.raw_completed_count == 3);
  CHECK(record.completed_count == 2);
  CHECK(record.capped);
  CHECK(record.completion_rate == 100.0);
  CHECK(record.status == domain::CompletionStatus::kComplete);

  REQUIRE(result.diagnostics.anomaly_caps.size() == 1);
  CHECK(result.diagnostics.anomaly_caps[0].store_id == "S1");
  CHECK(result.diagnostics.anomaly_caps[0].raw_completed == 3);
  CHECK(result.diagnostics.anomaly_caps[0].required == 2);
}

TEST_CASE("Evidence is a cumulative union across submissions", "[completion][union]") {
  domain::Dataset dataset;
  dataset.stores = {fixtures::store("S1", "S1 Official")};
  dataset.displays = {fixtures::display("S1", "M1")};
  dataset.posm_requirements = fixtures::requirements("M1", {"A", "B", "C", "D"});
  dataset.submissions = {
      fixtures::submission("x", "", "S1 Official", "2026-02-01", {fixtures::response("M1", {"A", "B"})}),
      fixtures::submission("y", "", "S1 Official", "2026-02-02", {fixtures::response("M1", {"B", "C"})}),
  };

  const auto result = completion::compute_completion(dataset);
  REQUIRE(result.records.size() == 1);
  CHECK(result.records[0].completed_count == 3);
  CHECK(result.records[0].completion_rate == 75.0);
  CHECK(result.records[0].confirmed_codes == std::vector<std::string>{"A", "B", "C"});
}

TEST_CASE("Every matching response of a submission contributes", "[completion][union]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {fixtures::submission(
      "sub-a", "", "S1 Official", "2026-02-01",
      {fixtures::response("M1", {"P1"}), fixtures::response("m-1", {"P2"}),
       fixtures::response("M7", {"P3"})})};

  const auto result = completion::compute_completion(dataset);
  const auto& record = result.records.at(0);
  CHECK(record.completed_count == 2);
  CHECK_FALSE(record.capped);
  REQUIRE(record.evidence.size() == 1);
  CHECK(record.evidence[0].matched_models == std::vector<std::string>{"M1", "m-1"});
}

TEST_CASE("Invalid and unmatched submissions", "[completion][diagnostics]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {
      fixtures::submission("empty", "", "S1 Official", "2026-02-01", {}),
      fixtures::submission("nolabel", "", "", "2026-02-01", {fixtures::response("M1", {"P1"})}),
      fixtures::submission("elsewhere", "", "Nowhere Mart", "2026-02-01",
                           {fixtures::response("M1", {"P1"})}),
      fixtures::submission("", "", "S1 Official", "2026-02-02", {fixtures::response("M1", {"P2"})}),
  };

  const auto result = completion::compute_completion(dataset);
  const auto& diagnostics = result.diagnostics;
  CHECK(diagnostics.total_submissions == 4);
  CHECK(diagnostics.validated_submissions == 2);
  CHECK(diagnostics.rejected_submissions == 2);
  REQUIRE(diagnostics.rejections.size() == 2);
  CHECK(diagnostics.rejections[0].submission_id == "empty");
  CHECK(diagnostics.rejections[1].reason == "no identifying label");

  REQUIRE(diagnostics.orphaned_submissions.size() == 1);
  CHECK(diagnostics.orphaned_submissions[0].submission_id == "elsewhere");

  const auto& record = result.records.at(0);
  CHECK(record.completed_count == 1);
  CHECK(record.confirmed_codes == std::vector<std::string>{"P2"});
  REQUIRE(record.evidence.size() == 1);
  CHECK(record.evidence[0].submission_id == "sub-3");
}

TEST_CASE("Hidden displays and models without requirements", "[completion][catalog]") {
  domain::Dataset dataset;
  dataset.stores = {fixtures::store("S1", "S1 Official")};
  dataset.displays = {fixtures::display("S1", "M1"), fixtures::display("S1", "M2", false),
                      fixtures::display("S1", "M9")};
  dataset.posm_requirements = fixtures::requirements("M1", {"P1"});
  dataset.submissions = {fixtures::submission(
      "a", "", "S1 Official", "2026-02-01",
      {fixtures::response("M1", {"P1"}), fixtures::response("M9", {"X1"})})};

  SECTION("hidden assignments produce no record by default") {
    const auto result = completion::compute_completion(dataset);
    CHECK(result.records.size() == 2);
    CHECK(result.diagnostics.hidden_displays == 1);
  }

  SECTION("include_hidden_displays keeps them") {
    config::EngineConfig config;
    config.aggregation.include_hidden_displays = true;
    const auto result = completion::compute_completion(dataset, config);
    CHECK(result.records.size() == 3);
    CHECK(result.diagnostics.hidden_displays == 0);
  }

  SECTION("a model with no requirements is no_displays and capped to zero") {
    const auto result = completion::compute_completion(dataset);
    const auto& record = result.records.at(1);
    CHECK(record.model == "M9");
    CHECK(record.required_count == 0);
    CHECK(record.completed_count == 0);
    CHECK(record.completion_rate == 0.0);
    CHECK(record.status == domain::CompletionStatus::kNoDisplays);
    CHECK(record.capped);
    CHECK(result.diagnostics.anomaly_caps.size() == 1);
  }
}

TEST_CASE("Record invariants hold on mixed data", "[completion][invariants]") {
  domain::Dataset dataset;
  dataset.stores = {fixtures::store("S1", "S1 Official"), fixtures::store("S2", "S2 Store")};
  dataset.displays = {fixtures::display("S1", "M1"), fixtures::display("S1", "M2"),
                      fixtures::display("S2", "M1"), fixtures::display("S2", "M3")};
  auto m1 = fixtures::requirements("M1", {"P1", "P2", "P3"});
  auto m2 = fixtures::requirements("M2", {"P1"});
  dataset.posm_requirements = m1;
  dataset.posm_requirements.insert(dataset.posm_requirements.end(), m2.begin(), m2.end());
  dataset.submissions = {
      fixtures::submission("a", "", "S1 Official", "2026-02-01",
                           {fixtures::response("M1", {"P1", "P9"}), fixtures::response("M2", {"P1", "P2"})}),
      fixtures::submission("b", "S2", "", "2026-02-02", {fixtures::response("M3", {"Z"})}),
      fixtures::submission("c", "", "S2 Store", "2026-02-02", {fixtures::response("M1", {})}),
  };

  const auto result = completion::compute_completion(dataset);
  REQUIRE(result.records.size() == 4);
  for (const auto& record : result.records) {
    CHECK(record.completed_count <= record.required_count);
    CHECK(record.completion_rate >= 0.0);
    CHECK(record.completion_rate <= 100.0);
    CHECK((record.status == domain::CompletionStatus::kComplete) ==
          (record.completed_count == record.required_count && record.required_count > 0));
    CHECK((record.status == domain::CompletionStatus::kNoDisplays) == (record.required_count == 0));
  }
  CHECK_THAT(result.records[0].completion_rate, Catch::Matchers::WithinAbs(66.7, 1e-9));
}

TEST_CASE("Output is independent of worker count and repeatable", "[completion][determinism]") {
  domain::Dataset dataset;
  for (int s = 0; s < 12; ++s) {
    const std::string id = "ST" + std::to_string(100 + s);
    dataset.stores.push_back(fixtures::store(id, "Branch Store " + id, s % 2 == 0 ? "South" : "North"));
    dataset.displays.push_back(fixtures::display(id, "M1"));
    dataset.displays.push_back(fixtures::display(id, "M2"));
    dataset.submissions.push_back(fixtures::submission(
        "v" + std::to_string(s), id, "", "2026-03-0" + std::to_string(1 + s % 9),
        {fixtures::response("M1", {"P1"}), fixtures::response("M2", s % 3 == 0 ? std::vector<std::string>{"Q1", "Q2"} : std::vector<std::string>{"Q1"})}));
  }
  dataset.posm_requirements = fixtures::requirements("M1", {"P1", "P2"});
  const auto m2 = fixtures::requirements("M2", {"Q1", "Q2"});
  dataset.posm_requirements.insert(dataset.posm_requirements.end(), m2.begin(), m2.end());

  config::EngineConfig serial;
  serial.aggregation.max_workers = 1;
  config::EngineConfig parallel;
  parallel.aggregation.max_workers = 8;

  const auto serial_json = completion::completion_result_to_json(completion::compute_completion(dataset, serial)).dump();
  const auto parallel_json = completion::completion_result_to_json(completion::compute_completion(dataset, parallel)).dump();
  const auto again_json = completion::completion_result_to_json(completion::compute_completion(dataset, parallel)).dump();

  CHECK(serial_json == parallel_json);
  CHECK(parallel_json == again_json);
}

TEST_CASE("Worker count is bounded by tasks and cores", "[completion][determinism]") {
  const std::size_t cores = std::max<std::size_t>(std::thread::hardware_concurrency(), 1);

  CHECK(completion::effective_worker_count(0, 0) == 1);
  CHECK(completion::effective_worker_count(1, 50) == 1);
  CHECK(completion::effective_worker_count(100000, 10) <= 10);
  CHECK(completion::effective_worker_count(100000, 1000000) ==
        completion::kMaxWorkersPerCore * cores);
  CHECK(completion::effective_worker_count(0, 1000000) == cores);

  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {fixtures::submission("a", "", "S1 Official", "2026-02-01T08:00:00Z",
                                              {fixtures::response("M1", {"P1"})})};
  config::EngineConfig oversized;
  oversized.aggregation.max_workers = 100000;
  const auto result = completion::compute_completion(dataset, oversized);
  REQUIRE(result.records.size() == 1);
  CHECK(result.records[0].completed_count == 1);
}
