#include "posmr/reporting/deployment_matrix.h"

#include "posmr/completion/completion_aggregator.h"
#include "fixtures.h"

#include <catch2/catch.hpp>

using namespace posmr;

namespace {

completion::CompletionResult matrix_result() {
  domain::Dataset dataset;
  dataset.stores = {fixtures::store("S1", "S1 Official", "South", "HCM"),
                    fixtures::store("S2", "S2 Store", "North", "HN"),
                    fixtures::store("S3", "Third Shop", "North", "HN")};
  dataset.displays = {fixtures::display("S1", "M1"), fixtures::display("S1", "M2"),
                      fixtures::display("S2", "M1"), fixtures::display("S3", "M2")};
  dataset.posm_requirements = fixtures::requirements("M1", {"P1", "P2"});
  const auto m2 = fixtures::requirements("M2", {"Q1"});
  dataset.posm_requirements.insert(dataset.posm_requirements.end(), m2.begin(), m2.end());
  dataset.submissions = {
      fixtures::submission("a", "", "S1 Official", "2026-02-01",
                           {fixtures::response("M1", {"P1"}), fixtures::response("M2", {"Q1"})}),
      fixtures::submission("b", "", "S2 Store", "2026-02-01", {fixtures::response("M1", {"P1", "P2"})}),
  };
  return completion::compute_completion(dataset);
}

}  // namespace

TEST_CASE("Matrix rows carry one cell per model column", "[matrix]") {
  const auto page = reporting::build_deployment_matrix(matrix_result(), {});

  CHECK(page.models == std::vector<std::string>{"M1", "M2"});
  REQUIRE(page.rows.size() == 3);
  CHECK(page.rows[0].store_id == "S2");
  CHECK(page.rows[1].store_id == "S1");
  CHECK(page.rows[2].store_id == "S3");

  const auto& s2 = page.rows[0];
  CHECK(s2.cells[0].status == reporting::CellStatus::kComplete);
  CHECK(s2.cells[0].percentage == 100);
  CHECK(s2.cells[1].status == reporting::CellStatus::kNotApplicable);

  const auto& s1 = page.rows[1];
  CHECK(s1.cells[0].status == reporting::CellStatus::kPartial);
  CHECK(s1.cells[0].completed == 1);
  CHECK(s1.cells[0].required == 2);
  CHECK(s1.cells[0].percentage == 50);

  const auto& s3 = page.rows[2];
  CHECK(s3.cells[0].status == reporting::CellStatus::kNotApplicable);
  CHECK(s3.cells[1].status == reporting::CellStatus::kNone);
}

TEST_CASE("Matrix summary covers every filtered row", "[matrix]") {
  reporting::MatrixQuery query;
  query.limit = 1;
  const auto page = reporting::build_deployment_matrix(matrix_result(), query);

  CHECK(page.rows.size() == 1);
  CHECK(page.total_rows == 3);
  CHECK(page.total_pages == 3);
  CHECK(page.summary.total_stores == 3);
  CHECK_THAT(page.summary.average_completion, Catch::Matchers::WithinAbs(55.6, 1e-9));
  CHECK(page.summary.complete_stores == 1);
  CHECK(page.summary.partial_stores == 1);
  CHECK(page.summary.not_started_stores == 1);
}

TEST_CASE("Matrix search and sorting", "[matrix]") {
  const auto result = matrix_result();

  SECTION("search is case-insensitive across metadata") {
    reporting::MatrixQuery query;
    query.search = "north";
    const auto page = reporting::build_deployment_matrix(result, query);
    REQUIRE(page.rows.size() == 2);
    CHECK(page.rows[0].store_id == "S2");
    CHECK(page.rows[1].store_id == "S3");

    query.search = "HCM";
    CHECK(reporting::build_deployment_matrix(result, query).rows.size() == 1);
  }

  SECTION("ascending by store id") {
    reporting::MatrixQuery query;
    query.sort_by = reporting::MatrixSortColumn::kStoreId;
    query.descending = false;
    const auto page = reporting::build_deployment_matrix(result, query);
    REQUIRE(page.rows.size() == 3);
    CHECK(page.rows[0].store_id == "S1");
    CHECK(page.rows[2].store_id == "S3");
  }

  SECTION("sort column names") {
    CHECK(reporting::parse_sort_column("region") == reporting::MatrixSortColumn::kRegion);
    CHECK_FALSE(reporting::parse_sort_column("bogus").has_value());
  }
}

TEST_CASE("Matrix paging bounds", "[matrix]") {
  const auto result = matrix_result();
  reporting::MatrixQuery query;

  query.limit = 2;
  query.page = 2;
  auto page = reporting::build_deployment_matrix(result, query);
  REQUIRE(page.rows.size() == 1);
  CHECK(page.rows[0].store_id == "S3");
  CHECK(page.total_pages == 2);

  query.page = 5;
  CHECK(reporting::build_deployment_matrix(result, query).rows.empty());

  query.page = 0;
  query.limit = 0;
  page = reporting::build_deployment_matrix(result, query);
  CHECK(page.page == 1);
  CHECK(page.limit == reporting::kMinPageLimit);

  query.limit = 500;
  CHECK(reporting::build_deployment_matrix(result, query).limit == reporting::kMaxPageLimit);
}

TEST_CASE("Matrix JSON keys cells by model", "[matrix][json]") {
  const auto j = reporting::matrix_page_to_json(reporting::build_deployment_matrix(matrix_result(), {}));
  CHECK(j.at("rows").at(0).at("cells").at("M2").at("status") == "not_applicable");
  CHECK(j.at("pagination").at("total_rows") == 3);
}
