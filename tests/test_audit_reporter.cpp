#include "posmr/audit/audit_reporter.h"

#include "posmr/completion/completion_aggregator.h"
#include "fixtures.h"

#include <catch2/catch.hpp>

using namespace posmr;

namespace {

audit::AuditReport audit_dataset(const domain::Dataset& dataset) {
  const auto result = completion::compute_completion(dataset);
  return audit::audit_completion(result, dataset.displays, dataset.submissions);
}

domain::CompletionRecord bare_record(std::string store_id, std::size_t required,
                                     std::size_t completed) {
  domain::CompletionRecord record;
  record.store_id = std::move(store_id);
  record.model = "M1";
  record.required_count = required;
  record.completed_count = completed;
  record.raw_completed_count = completed;
  record.completion_rate = domain::completion_rate(completed, required);
  record.status = domain::completion_status(completed, required);
  return record;
}

completion::StoreCompletion store_of(domain::CompletionRecord record,
                                     std::size_t contributing) {
  completion::StoreCompletion store;
  store.store_id = record.store_id;
  store.required_count = record.required_count;
  store.completed_count = record.completed_count;
  store.completion_rate = record.completion_rate;
  store.contributing_submission_count = contributing;
  store.records.push_back(std::move(record));
  return store;
}

}  // namespace

TEST_CASE("Two corroborating visits raise no finding", "[audit]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {
      fixtures::submission("a", "", "S1 Official", "2026-02-01", {fixtures::response("M1", {"P1"})}),
      fixtures::submission("b", "", "S1 Official", "2026-02-02", {fixtures::response("M1", {"P2"})}),
  };

  const auto report = audit_dataset(dataset);
  CHECK(report.store_findings.empty());
  CHECK(report.summary.stores_at_full_completion == 1);
  CHECK(report.summary.total_submissions == 2);
  CHECK(report.summary.total_displays == 1);
}

TEST_CASE("AUD-001 flags full completion from a single response", "[audit][aud001]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {fixtures::submission("a", "", "S1 Official", "2026-02-01",
                                              {fixtures::response("M1", {"P1", "P2"})})};

  const auto report = audit_dataset(dataset);
  REQUIRE(report.store_findings.size() == 1);
  const auto& finding = report.store_findings[0];
  CHECK(finding.store_id == "S1");
  CHECK(finding.confidence == domain::FindingConfidence::kMedium);
  CHECK(finding.check_ids == std::vector<std::string>{"AUD-001"});
}

TEST_CASE("AUD-001 stays quiet when the submission covers several models", "[audit][aud001]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {fixtures::submission(
      "a", "", "S1 Official", "2026-02-01",
      {fixtures::response("M1", {"P1", "P2"}), fixtures::response("M5", {"X"})})};

  const auto report = audit_dataset(dataset);
  CHECK(report.store_findings.empty());
}

TEST_CASE("Capped records raise AUD-003 and requirement drift", "[audit][aud003]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {fixtures::submission("a", "", "S1 Official", "2026-02-01",
                                              {fixtures::response("M1", {"P1", "P2", "P3"})})};

  const auto report = audit_dataset(dataset);
  REQUIRE(report.store_findings.size() == 1);
  CHECK(report.store_findings[0].check_ids == std::vector<std::string>{"AUD-001", "AUD-003"});
  CHECK(report.store_findings[0].issues.size() == 2);
  CHECK(report.summary.anomaly_caps == 1);

  REQUIRE(report.recommendations.size() == 3);
  CHECK(report.recommendations[0].code == "over_matching");
  CHECK(report.recommendations[1].code == "requirement_drift");
  CHECK(report.recommendations[2].code == "systemic_review");
}

TEST_CASE("Findings sort low confidence first, then by store id", "[audit][aud002]") {
  auto capped = bare_record("Z", 2, 2);
  capped.raw_completed_count = 3;
  capped.capped = true;
  domain::EvidenceRef evidence;
  evidence.submission_index = 0;
  capped.evidence.push_back(evidence);

  completion::CompletionResult result;
  result.stores = {store_of(capped, 1), store_of(bare_record("M", 2, 1), 0),
                   store_of(bare_record("C", 2, 1), 0)};

  const std::vector<domain::DisplayAssignment> displays;
  const std::vector<domain::SurveySubmission> submissions;
  const auto report = audit::audit_completion(result, displays, submissions);

  REQUIRE(report.store_findings.size() == 3);
  CHECK(report.store_findings[0].store_id == "C");
  CHECK(report.store_findings[0].confidence == domain::FindingConfidence::kLow);
  CHECK(report.store_findings[0].check_ids == std::vector<std::string>{"AUD-002"});
  CHECK(report.store_findings[1].store_id == "M");
  CHECK(report.store_findings[2].store_id == "Z");
  CHECK(report.store_findings[2].check_ids == std::vector<std::string>{"AUD-003"});
  CHECK(report.summary.confidence_counts.at("low") == 2);
  CHECK(report.summary.confidence_counts.at("medium") == 1);
}

TEST_CASE("Rate distribution buckets", "[audit][buckets]") {
  completion::CompletionResult result;
  result.stores = {store_of(bare_record("A", 2, 2), 2), store_of(bare_record("B", 2, 1), 2),
                   store_of(bare_record("C", 2, 0), 0)};
  const std::vector<domain::DisplayAssignment> displays;
  const std::vector<domain::SurveySubmission> submissions;

  SECTION("default width is ten points and 100 lands in the last bucket") {
    const auto report = audit::audit_completion(result, displays, submissions);
    const auto& buckets = report.summary.rate_distribution;
    REQUIRE(buckets.size() == 10);
    CHECK(buckets[0].store_count == 1);
    CHECK(buckets[5].store_count == 1);
    CHECK(buckets[9].store_count == 1);
    CHECK(buckets[9].upper == 100);
  }

  SECTION("uneven width closes the last bucket at 100") {
    config::AuditThresholds thresholds;
    thresholds.bucket_width = 30;
    const auto report = audit::audit_completion(result, displays, submissions, thresholds);
    const auto& buckets = report.summary.rate_distribution;
    REQUIRE(buckets.size() == 4);
    CHECK(buckets[3].lower == 90);
    CHECK(buckets[3].upper == 100);
    CHECK(buckets[1].store_count == 1);
    CHECK(buckets[3].store_count == 1);
  }

  SECTION("non-positive width is clamped") {
    config::AuditThresholds thresholds;
    thresholds.bucket_width = 0;
    const auto report = audit::audit_completion(result, displays, submissions, thresholds);
    CHECK(report.summary.rate_distribution.size() == 100);
  }
}

TEST_CASE("Audit report JSON shape", "[audit][json]") {
  auto dataset = fixtures::single_store_dataset();
  dataset.submissions = {fixtures::submission("a", "", "S1 Official", "2026-02-01",
                                              {fixtures::response("M1", {"P1"})})};
  const auto j = audit::audit_report_to_json(audit_dataset(dataset));

  CHECK(j.at("summary").at("total_stores") == 1);
  CHECK(j.at("summary").at("rate_distribution").at(5).at("range") == "50-60");
  CHECK(j.at("summary").at("status_histogram").at("partial") == 1);
  CHECK(j.at("store_findings").empty());
  CHECK(j.at("recommendations").empty());
}
