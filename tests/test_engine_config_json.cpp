#include "posmr/config/engine_config_json.h"
#include "posmr/config/presets.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

using namespace posmr::config;

TEST_CASE("Defaults carry the tuned constants", "[config]") {
  const EngineConfig config = default_preset();
  CHECK(config.identity.accept_threshold == 0.85);
  CHECK(config.identity.partial_min_overlap == 0.85);
  CHECK(config.identity.min_identifier_length == 4);
  CHECK(config.identity.identifier_in_name_confidence == 0.88);
  CHECK(config.identity.label_in_name_confidence == 0.87);
  CHECK(config.model.similarity_threshold == 0.80);
  CHECK(config.audit.bucket_width == 10);
}

TEST_CASE("Overlay keeps unspecified values", "[config][json]") {
  const auto parsed = engine_config_from_json(
      R"({"identity": {"accept_threshold": 0.9}, "aggregation": {"max_workers": 2}})");
  REQUIRE(parsed.has_value());
  const auto& config = parsed.value();
  CHECK(config.identity.accept_threshold == 0.9);
  CHECK(config.identity.exact_confidence == 1.0);
  CHECK(config.aggregation.max_workers == 2);
  CHECK_FALSE(config.aggregation.include_hidden_displays);
}

TEST_CASE("Overlay starts from the given base", "[config][json]") {
  const auto parsed = engine_config_from_json(R"({"audit": {"bucket_width": 20}})", strict_preset());
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().identity.accept_threshold == 0.90);
  CHECK(parsed.value().audit.bucket_width == 20);
}

TEST_CASE("Invalid values are rejected with every problem listed", "[config][json]") {
  const auto parsed = engine_config_from_json(
      R"({"identity": {"accept_threshold": 1.5, "min_identifier_length": -1},
          "model": {"similarity_threshold": "high"},
          "audit": {"bucket_width": 0}})");
  REQUIRE_FALSE(parsed.has_value());
  const auto& error = parsed.error();
  CHECK(error.find("accept_threshold out of range") != std::string::npos);
  CHECK(error.find("min_identifier_length") != std::string::npos);
  CHECK(error.find("similarity_threshold must be a number") != std::string::npos);
  CHECK(error.find("bucket_width") != std::string::npos);
}

TEST_CASE("Bucket width outside int range is rejected, not narrowed", "[config][json]") {
  // 4294967306 is 2^32 + 10.
  CHECK_FALSE(engine_config_from_json(R"({"audit": {"bucket_width": 4294967306}})").has_value());
  CHECK_FALSE(
      engine_config_from_json(R"({"audit": {"bucket_width": 18446744073709551615}})").has_value());
  CHECK_FALSE(engine_config_from_json(R"({"audit": {"bucket_width": 12.5}})").has_value());

  const auto parsed = engine_config_from_json(R"({"audit": {"bucket_width": 100}})");
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().audit.bucket_width == 100);
}

TEST_CASE("Partial confidence floor must not exceed ceiling", "[config][json]") {
  const auto parsed = engine_config_from_json(
      R"({"identity": {"partial_confidence_floor": 0.95, "partial_confidence_ceiling": 0.9}})");
  CHECK_FALSE(parsed.has_value());
}

TEST_CASE("Non-object documents are rejected", "[config][json]") {
  CHECK_FALSE(engine_config_from_json("[]").has_value());
  CHECK_FALSE(engine_config_from_json("nope").has_value());
  CHECK_FALSE(engine_config_from_json(R"({"identity": 3})").has_value());
}

TEST_CASE("Serialized config reloads to the same values", "[config][json]") {
  EngineConfig config = strict_preset();
  config.aggregation.include_hidden_displays = true;
  const std::string text = engine_config_to_json(config);

  const auto reloaded = engine_config_from_json(text);
  REQUIRE(reloaded.has_value());
  CHECK(engine_config_to_json(reloaded.value()) == text);
  CHECK(nlohmann::json::parse(text).at("identity").contains("accept_threshold"));
}
