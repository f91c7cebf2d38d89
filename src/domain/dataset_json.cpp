#include "posmr/domain/dataset_json.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <sstream>

namespace posmr::domain {

namespace {

using json = nlohmann::json;

// Spreadsheet exports often carry numeric ids, so numbers are accepted as text.
std::optional<std::string> read_text(const json& obj, const char* key, const char* alias = nullptr) {
  auto it = obj.find(key);
  if (it == obj.end() && alias != nullptr) {
    it = obj.find(alias);
  }
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<long long>());
  }
  if (it->is_number()) {
    return it->dump();
  }
  return std::nullopt;
}

bool read_flag(const json& obj, const char* key, const char* alias, const bool fallback) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    it = obj.find(alias);
  }
  if (it == obj.end()) {
    return fallback;
  }
  if (it->is_boolean()) {
    return it->get<bool>();
  }
  if (it->is_number_integer()) {
    return it->get<long long>() != 0;
  }
  return fallback;
}

const json* find_array(const json& root, const char* key, LoadReport& report) {
  const auto it = root.find(key);
  if (it == root.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_array()) {
    report.issues.push_back(std::string("collection '") + key + "' is not an array; ignored");
    return nullptr;
  }
  return &*it;
}

void load_stores(const json& root, Dataset& dataset, LoadReport& report) {
  const json* items = find_array(root, "stores", report);
  if (items == nullptr) {
    return;
  }
  std::size_t index = 0;
  for (const auto& item : *items) {
    const std::size_t pos = index++;
    if (!item.is_object()) {
      ++report.skipped_stores;
      report.issues.push_back("stores[" + std::to_string(pos) + "]: not an object");
      continue;
    }
    StoreCatalogEntry entry;
    entry.store_id = read_text(item, "store_id", "storeId").value_or("");
    entry.store_name = read_text(item, "store_name", "storeName").value_or("");
    entry.region = read_text(item, "region").value_or("");
    entry.province = read_text(item, "province").value_or("");
    entry.channel = read_text(item, "channel").value_or("");

    const auto valid = entry.validate();
    if (!valid.has_value()) {
      ++report.skipped_stores;
      report.issues.push_back("stores[" + std::to_string(pos) + "]: " + valid.error());
      continue;
    }
    dataset.stores.push_back(std::move(entry));
  }
}

void load_displays(const json& root, Dataset& dataset, LoadReport& report) {
  const json* items = find_array(root, "displays", report);
  if (items == nullptr) {
    return;
  }
  std::size_t index = 0;
  for (const auto& item : *items) {
    const std::size_t pos = index++;
    if (!item.is_object()) {
      ++report.skipped_displays;
      report.issues.push_back("displays[" + std::to_string(pos) + "]: not an object");
      continue;
    }
    DisplayAssignment display;
    display.store_id = read_text(item, "store_id", "storeId").value_or("");
    display.model = read_text(item, "model").value_or("");
    display.is_displayed = read_flag(item, "is_displayed", "isDisplayed", true);
    display.updated_at = read_text(item, "updated_at", "updatedAt").value_or("");

    const auto valid = display.validate();
    if (!valid.has_value()) {
      ++report.skipped_displays;
      report.issues.push_back("displays[" + std::to_string(pos) + "]: " + valid.error());
      continue;
    }
    dataset.displays.push_back(std::move(display));
  }
}

void load_requirements(const json& root, Dataset& dataset, LoadReport& report) {
  const json* items = find_array(root, "posm_requirements", report);
  if (items == nullptr) {
    return;
  }
  std::size_t index = 0;
  for (const auto& item : *items) {
    const std::size_t pos = index++;
    if (!item.is_object()) {
      ++report.skipped_requirements;
      report.issues.push_back("posm_requirements[" + std::to_string(pos) + "]: not an object");
      continue;
    }
    PosmRequirement requirement;
    requirement.model = read_text(item, "model").value_or("");
    requirement.posm_code = read_text(item, "posm", "posm_code").value_or("");
    requirement.posm_name = read_text(item, "posm_name", "posmName").value_or("");

    const auto valid = requirement.validate();
    if (!valid.has_value()) {
      ++report.skipped_requirements;
      report.issues.push_back("posm_requirements[" + std::to_string(pos) + "]: " + valid.error());
      continue;
    }
    dataset.posm_requirements.push_back(std::move(requirement));
  }
}

// Returns nullopt when the record shape is unusable. Content problems (no
// responses, no selections, no labels) are left for the submission validator.
std::optional<SurveySubmission> read_submission(const json& item, std::string& issue) {
  if (!item.is_object()) {
    issue = "not an object";
    return std::nullopt;
  }

  SurveySubmission submission;
  submission.submission_id = read_text(item, "id", "_id").value_or("");
  submission.leader_label = read_text(item, "leader").value_or("");
  submission.shop_name_label = read_text(item, "shop_name", "shopName").value_or("");
  submission.submitted_at = read_text(item, "submitted_at", "submittedAt")
                                .value_or(read_text(item, "created_at", "createdAt").value_or(""));

  const auto responses = item.find("responses");
  if (responses == item.end() || responses->is_null()) {
    return submission;
  }
  if (!responses->is_array()) {
    issue = "responses is not an array";
    return std::nullopt;
  }

  for (const auto& response : *responses) {
    if (!response.is_object()) {
      issue = "response entry is not an object";
      return std::nullopt;
    }
    ModelResponse model_response;
    model_response.model = read_text(response, "model").value_or("");

    auto selections = response.find("posm_selections");
    if (selections == response.end()) {
      selections = response.find("posmSelections");
    }
    if (selections != response.end() && selections->is_array()) {
      for (const auto& selection : *selections) {
        if (!selection.is_object()) {
          continue;
        }
        PosmSelection posm;
        posm.posm_code = read_text(selection, "posm_code", "posmCode").value_or("");
        posm.selected = read_flag(selection, "selected", "isSelected", false);
        model_response.posm_selections.push_back(std::move(posm));
      }
    }
    submission.model_responses.push_back(std::move(model_response));
  }

  return submission;
}

void load_submissions(const json& root, Dataset& dataset, LoadReport& report) {
  const json* items = find_array(root, "submissions", report);
  if (items == nullptr) {
    return;
  }
  std::size_t index = 0;
  for (const auto& item : *items) {
    const std::size_t pos = index++;
    std::string issue;
    auto submission = read_submission(item, issue);
    if (!submission.has_value()) {
      ++report.skipped_submissions;
      report.issues.push_back("submissions[" + std::to_string(pos) + "]: " + issue);
      continue;
    }
    dataset.submissions.push_back(std::move(*submission));
  }
}

}  // namespace

core::Result<LoadedDataset, std::string> parse_dataset_json(const std::string& text) {
  using R = core::Result<LoadedDataset, std::string>;

  const json root = json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    return R::err("dataset is not valid JSON");
  }
  if (!root.is_object()) {
    return R::err("dataset root must be a JSON object");
  }

  LoadedDataset loaded;
  load_stores(root, loaded.dataset, loaded.report);
  load_displays(root, loaded.dataset, loaded.report);
  load_requirements(root, loaded.dataset, loaded.report);
  load_submissions(root, loaded.dataset, loaded.report);
  return R::ok(std::move(loaded));
}

core::Result<LoadedDataset, std::string> load_dataset_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return core::Result<LoadedDataset, std::string>::err("cannot open dataset file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse_dataset_json(buffer.str());
}

}  // namespace posmr::domain
