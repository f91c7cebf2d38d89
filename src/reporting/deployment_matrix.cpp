#include "posmr/reporting/deployment_matrix.h"

#include "posmr/core/normalization.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace posmr::reporting {

namespace {

MatrixCell make_cell(const std::string& model, const domain::CompletionRecord* record) {
  MatrixCell cell;
  cell.model = model;
  if (record == nullptr || record->required_count == 0) {
    return cell;
  }
  cell.completed = record->completed_count;
  cell.required = record->required_count;
  cell.percentage = static_cast<int>(std::lround(record->completion_rate));
  if (cell.completed == cell.required) {
    cell.status = CellStatus::kComplete;
  } else if (cell.completed > 0) {
    cell.status = CellStatus::kPartial;
  } else {
    cell.status = CellStatus::kNone;
  }
  return cell;
}

bool matches_search(const completion::StoreCompletion& store, const std::string& needle) {
  if (needle.empty()) {
    return true;
  }
  for (const std::string* field : {&store.store_id, &store.store_name, &store.region,
                                   &store.province}) {
    if (core::normalize_label(*field).find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

MatrixSummary summarize(const std::vector<const completion::StoreCompletion*>& stores) {
  MatrixSummary summary;
  summary.total_stores = stores.size();
  double rate_sum = 0.0;
  for (const auto* store : stores) {
    rate_sum += store->completion_rate;
    if (store->completed_count == 0) {
      ++summary.not_started_stores;
    } else if (store->completed_count == store->required_count) {
      ++summary.complete_stores;
    } else {
      ++summary.partial_stores;
    }
  }
  if (!stores.empty()) {
    const double average = rate_sum / static_cast<double>(stores.size());
    summary.average_completion = std::round(average * 10.0) / 10.0;
  }
  return summary;
}

}  // namespace

std::string_view to_string(const CellStatus status) noexcept {
  switch (status) {
    case CellStatus::kComplete:
      return "complete";
    case CellStatus::kPartial:
      return "partial";
    case CellStatus::kNone:
      return "none";
    case CellStatus::kNotApplicable:
      return "not_applicable";
  }
  return "unknown";
}

std::optional<MatrixSortColumn> parse_sort_column(const std::string_view name) {
  if (name == "store_name") {
    return MatrixSortColumn::kStoreName;
  }
  if (name == "store_id") {
    return MatrixSortColumn::kStoreId;
  }
  if (name == "region") {
    return MatrixSortColumn::kRegion;
  }
  if (name == "completion_rate") {
    return MatrixSortColumn::kCompletionRate;
  }
  return std::nullopt;
}

MatrixPage build_deployment_matrix(const completion::CompletionResult& result,
                                   const MatrixQuery& query) {
  MatrixPage page;
  page.limit = std::clamp(query.limit, kMinPageLimit, kMaxPageLimit);
  page.page = std::max<std::size_t>(query.page, 1);

  std::set<std::string> columns;
  for (const auto& store : result.stores) {
    columns.insert(store.models.begin(), store.models.end());
  }
  page.models.assign(columns.begin(), columns.end());

  const std::string needle = core::normalize_label(query.search);
  std::vector<const completion::StoreCompletion*> filtered;
  for (const auto& store : result.stores) {
    if (matches_search(store, needle)) {
      filtered.push_back(&store);
    }
  }

  const auto less = [&query](const completion::StoreCompletion* a,
                             const completion::StoreCompletion* b) {
    switch (query.sort_by) {
      case MatrixSortColumn::kStoreName:
        return a->store_name < b->store_name;
      case MatrixSortColumn::kStoreId:
        return a->store_id < b->store_id;
      case MatrixSortColumn::kRegion:
        return a->region < b->region;
      case MatrixSortColumn::kCompletionRate:
        return a->completion_rate < b->completion_rate;
    }
    return false;
  };
  std::stable_sort(filtered.begin(), filtered.end(),
                   [&](const completion::StoreCompletion* a, const completion::StoreCompletion* b) {
                     return query.descending ? less(b, a) : less(a, b);
                   });

  page.summary = summarize(filtered);
  page.total_rows = filtered.size();
  page.total_pages = (page.total_rows + page.limit - 1) / page.limit;

  const std::size_t begin = (page.page - 1) * page.limit;
  const std::size_t end = std::min(begin + page.limit, filtered.size());
  for (std::size_t i = begin; i < end; ++i) {
    const auto& store = *filtered[i];

    std::map<std::string, const domain::CompletionRecord*> by_model;
    for (const auto& record : store.records) {
      by_model.emplace(record.model, &record);
    }

    MatrixRow row;
    row.store_id = store.store_id;
    row.store_name = store.store_name;
    row.region = store.region;
    row.province = store.province;
    row.completion_rate = store.completion_rate;
    row.cells.reserve(page.models.size());
    for (const auto& model : page.models) {
      const auto it = by_model.find(model);
      row.cells.push_back(make_cell(model, it == by_model.end() ? nullptr : it->second));
    }
    page.rows.push_back(std::move(row));
  }
  return page;
}

nlohmann::json matrix_page_to_json(const MatrixPage& page) {
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& row : page.rows) {
    nlohmann::json cells = nlohmann::json::object();
    for (const auto& cell : row.cells) {
      cells[cell.model] = {
          {"completed", cell.completed},
          {"required", cell.required},
          {"status", std::string(to_string(cell.status))},
          {"percentage", cell.percentage},
      };
    }
    rows.push_back({
        {"store_id", row.store_id},
        {"store_name", row.store_name},
        {"region", row.region},
        {"province", row.province},
        {"completion_rate", row.completion_rate},
        {"cells", cells},
    });
  }

  return {
      {"models", page.models},
      {"rows", rows},
      {"pagination",
       {{"page", page.page},
        {"limit", page.limit},
        {"total_rows", page.total_rows},
        {"total_pages", page.total_pages}}},
      {"summary",
       {{"total_stores", page.summary.total_stores},
        {"average_completion", page.summary.average_completion},
        {"complete_stores", page.summary.complete_stores},
        {"partial_stores", page.summary.partial_stores},
        {"not_started_stores", page.summary.not_started_stores}}},
  };
}

}  // namespace posmr::reporting
