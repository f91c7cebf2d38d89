#pragma once

#include "posmr/completion/completion_result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace posmr::reporting {

// Limits applied to MatrixQuery::limit.
inline constexpr std::size_t kMinPageLimit = 1;
inline constexpr std::size_t kMaxPageLimit = 100;

enum class CellStatus {
  kComplete,
  kPartial,
  kNone,
  kNotApplicable,  // store has no assignment for the model, or the model requires nothing
};

[[nodiscard]] std::string_view to_string(CellStatus status) noexcept;

struct MatrixCell {
  std::string model;
  std::size_t completed{0};
  std::size_t required{0};
  CellStatus status{CellStatus::kNotApplicable};
  int percentage{0};
};

struct MatrixRow {
  std::string store_id;
  std::string store_name;
  std::string region;
  std::string province;
  double completion_rate{0.0};
  std::vector<MatrixCell> cells;  // one per MatrixPage::models entry
};

enum class MatrixSortColumn {
  kStoreName,
  kStoreId,
  kRegion,
  kCompletionRate,
};

[[nodiscard]] std::optional<MatrixSortColumn> parse_sort_column(std::string_view name);

struct MatrixQuery {
  std::size_t page{1};
  std::size_t limit{20};
  std::string search;  // matched against store id, name, region, province
  MatrixSortColumn sort_by{MatrixSortColumn::kCompletionRate};
  bool descending{true};
};

// Summary over every row that passed the search filter, not just the page.
struct MatrixSummary {
  std::size_t total_stores{0};
  double average_completion{0.0};
  std::size_t complete_stores{0};
  std::size_t partial_stores{0};
  std::size_t not_started_stores{0};
};

struct MatrixPage {
  std::vector<std::string> models;  // column order, ascending
  std::vector<MatrixRow> rows;
  std::size_t page{1};
  std::size_t limit{20};
  std::size_t total_rows{0};
  std::size_t total_pages{0};
  MatrixSummary summary;
};

// build_deployment_matrix shapes a completion result into a store x model grid
// for tabular display. Page numbers start at 1; limit is clamped to
// [kMinPageLimit, kMaxPageLimit]. A page past the end yields no rows.
[[nodiscard]] MatrixPage build_deployment_matrix(const completion::CompletionResult& result,
                                                 const MatrixQuery& query);

[[nodiscard]] nlohmann::json matrix_page_to_json(const MatrixPage& page);

}  // namespace posmr::reporting
