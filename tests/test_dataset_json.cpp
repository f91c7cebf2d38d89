#include "posmr/domain/dataset_json.h"

#include <catch2/catch.hpp>

using namespace posmr::domain;

TEST_CASE("parse_dataset_json reads all four collections", "[dataset][json]") {
  const std::string text = R"({
    "stores": [{"store_id": "S1", "store_name": "S1 Official", "region": "South",
                "province": "HCM", "channel": "retail"}],
    "displays": [{"store_id": "S1", "model": "M1", "is_displayed": true},
                 {"storeId": 2001, "model": "M2", "isDisplayed": 0}],
    "posm_requirements": [{"model": "M1", "posm": "P1", "posm_name": "Poster"}],
    "submissions": [{"id": "a", "leader": "S1", "shop_name": "S1 Official",
                     "submitted_at": "2026-02-01T08:00:00Z",
                     "responses": [{"model": "M1",
                                    "posm_selections": [{"posm_code": "P1", "selected": true},
                                                        {"posm_code": "P2", "selected": false}]}]}]
  })";

  const auto loaded = parse_dataset_json(text);
  REQUIRE(loaded.has_value());
  const auto& dataset = loaded.value().dataset;
  CHECK(loaded.value().report.total_skipped() == 0);

  REQUIRE(dataset.stores.size() == 1);
  CHECK(dataset.stores[0].region == "South");

  REQUIRE(dataset.displays.size() == 2);
  CHECK(dataset.displays[1].store_id == "2001");
  CHECK_FALSE(dataset.displays[1].is_displayed);

  REQUIRE(dataset.posm_requirements.size() == 1);
  CHECK(dataset.posm_requirements[0].posm_code == "P1");
  CHECK(dataset.posm_requirements[0].posm_name == "Poster");

  REQUIRE(dataset.submissions.size() == 1);
  const auto& submission = dataset.submissions[0];
  CHECK(submission.submission_id == "a");
  CHECK(submission.leader_label == "S1");
  REQUIRE(submission.model_responses.size() == 1);
  REQUIRE(submission.model_responses[0].posm_selections.size() == 2);
  CHECK(submission.model_responses[0].posm_selections[0].selected);
  CHECK_FALSE(submission.model_responses[0].posm_selections[1].selected);
}

TEST_CASE("Bad records are skipped and reported", "[dataset][json]") {
  const std::string text = R"({
    "stores": [{"store_name": "No Id"}, "junk", {"store_id": "S2"}],
    "displays": [{"store_id": "S2"}],
    "posm_requirements": [{"model": "M1"}],
    "submissions": [{"id": "x", "responses": "oops"}, {"id": "y", "createdAt": "2026-01-02"}]
  })";

  const auto loaded = parse_dataset_json(text);
  REQUIRE(loaded.has_value());
  const auto& report = loaded.value().report;
  CHECK(report.skipped_stores == 2);
  CHECK(report.skipped_displays == 1);
  CHECK(report.skipped_requirements == 1);
  CHECK(report.skipped_submissions == 1);
  CHECK(report.issues.size() == 5);

  const auto& dataset = loaded.value().dataset;
  REQUIRE(dataset.submissions.size() == 1);
  CHECK(dataset.submissions[0].submitted_at == "2026-01-02");
  CHECK(dataset.submissions[0].model_responses.empty());
}

TEST_CASE("Missing collections are empty and non-array ones are ignored", "[dataset][json]") {
  const auto loaded = parse_dataset_json(R"({"stores": {"S1": {}}})");
  REQUIRE(loaded.has_value());
  CHECK(loaded.value().dataset.stores.empty());
  CHECK(loaded.value().dataset.submissions.empty());
  CHECK(loaded.value().report.issues.size() == 1);
}

TEST_CASE("Malformed documents are errors", "[dataset][json]") {
  CHECK_FALSE(parse_dataset_json("{not json").has_value());
  CHECK_FALSE(parse_dataset_json("[1, 2, 3]").has_value());
  CHECK_FALSE(load_dataset_file("/nonexistent/posmr/dataset.json").has_value());
}
