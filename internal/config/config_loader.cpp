#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace dispatch::config {

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";

constexpr uint64_t kDefaultOfferWindowMs   = 30'000;
constexpr uint32_t kDefaultBatchSize       = 5;
constexpr uint64_t kDefaultSearchTimeoutMs = 10 * 60 * 1000;
constexpr uint32_t kDefaultWorkerThreads   = 4;

constexpr double   kDefaultInitialRadiusKm = 5.0;
constexpr double   kDefaultRadiusStepKm    = 5.0;
constexpr double   kDefaultMaxRadiusKm     = 15.0;
constexpr uint64_t kDefaultHeartbeatTtlMs  = 5 * 60 * 1000;
constexpr double   kDefaultDistanceWeight  = 0.6;
constexpr double   kDefaultRatingWeight    = 0.3;
constexpr double   kDefaultIdleWeight      = 0.1;
constexpr double   kDefaultSpeedKmh        = 30.0;

constexpr double kDefaultBaseFare    = 2.50;
constexpr double kDefaultPerKm       = 1.20;
constexpr double kDefaultMinimumFare = 5.00;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

dispatch::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  dispatch::runtime::config::RuntimeConfig config;

  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(dispatch::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* dispatch = config.mutable_dispatch();
  if (dispatch->offer_window_ms() == 0) dispatch->set_offer_window_ms(kDefaultOfferWindowMs);
  if (dispatch->batch_size() == 0) dispatch->set_batch_size(kDefaultBatchSize);
  if (dispatch->search_timeout_ms() == 0) dispatch->set_search_timeout_ms(kDefaultSearchTimeoutMs);
  if (dispatch->worker_threads() == 0) dispatch->set_worker_threads(kDefaultWorkerThreads);
  if (dispatch->recovery_grace_ms() == 0) dispatch->set_recovery_grace_ms(dispatch->offer_window_ms());

  auto* matching = config.mutable_matching();
  if (matching->initial_radius_km() <= 0) matching->set_initial_radius_km(kDefaultInitialRadiusKm);
  if (matching->radius_step_km() <= 0) matching->set_radius_step_km(kDefaultRadiusStepKm);
  if (matching->max_radius_km() <= 0) matching->set_max_radius_km(kDefaultMaxRadiusKm);
  if (matching->max_radius_km() < matching->initial_radius_km()) matching->set_max_radius_km(matching->initial_radius_km());
  if (matching->heartbeat_ttl_ms() == 0) matching->set_heartbeat_ttl_ms(kDefaultHeartbeatTtlMs);
  if (matching->distance_weight() <= 0 && matching->rating_weight() <= 0 && matching->idle_weight() <= 0) {
    matching->set_distance_weight(kDefaultDistanceWeight);
    matching->set_rating_weight(kDefaultRatingWeight);
    matching->set_idle_weight(kDefaultIdleWeight);
  }
  if (matching->average_speed_kmh() <= 0) matching->set_average_speed_kmh(kDefaultSpeedKmh);

  auto* pricing = config.mutable_pricing();
  if (pricing->base_fare() <= 0) pricing->set_base_fare(kDefaultBaseFare);
  if (pricing->per_km() <= 0) pricing->set_per_km(kDefaultPerKm);
  if (pricing->minimum_fare() <= 0) pricing->set_minimum_fare(kDefaultMinimumFare);
  if (pricing->currency().empty()) pricing->set_currency("USD");
}

} // namespace dispatch::config
