#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace framecache::config {

namespace {

constexpr uint32_t kDefaultCycleIntervalMs = 2000;
constexpr uint32_t kDefaultBusyTimeoutMs   = 5000;
constexpr uint32_t kDefaultGeocodeTimeout  = 5000;

constexpr const char* kDefaultGeocodeEndpoint = "https://nominatim.openstreetmap.org/reverse";
constexpr const char* kDefaultUserAgent       = "framecache";

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // quoted scalars stay strings ("0755", "2024")
  if (node.Tag() != "!") {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (!scalar_value.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
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

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

framecache::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  framecache::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(framecache::runtime::config::RuntimeConfig& config) {
  auto* sqlite = config.mutable_database()->mutable_sqlite();
  if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(kDefaultBusyTimeoutMs);

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->cycle_interval_ms() == 0) scheduler->set_cycle_interval_ms(kDefaultCycleIntervalMs);
  if (!scheduler->has_fast_first_scan()) scheduler->set_fast_first_scan(true);
  if (!scheduler->has_autostart()) scheduler->set_autostart(true);

  auto* geocode = config.mutable_geocode();
  if (geocode->endpoint().empty()) geocode->set_endpoint(kDefaultGeocodeEndpoint);
  if (geocode->user_agent().empty()) geocode->set_user_agent(kDefaultUserAgent);
  if (geocode->timeout_ms() == 0) geocode->set_timeout_ms(kDefaultGeocodeTimeout);
}

void ConfigLoader::Validate(const framecache::runtime::config::RuntimeConfig& config) {
  if (config.library().picture_dir().empty()) {
    throw std::runtime_error("Invalid configuration: library.picture_dir is required");
  }
  if (config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
}

} // namespace framecache::config
