#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tgstats::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("#", "01")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
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

static void Reject(const std::string& field, const std::string& reason) {
  throw std::runtime_error("Invalid configuration: " + field + ": " + reason);
}

static void ValidateConfig(const tgstats::runtime::config::RuntimeConfig& config) {
  // spdlog maps unknown names to "off" instead of failing.
  const auto& level = config.logging().level();
  if (!level.empty() && level != "off" && spdlog::level::from_str(level) == spdlog::level::off) {
    Reject("logging.level", "unknown level '" + level + "'");
  }

  const auto& hour_activity = config.hour_activity();
  if (hour_activity.has_scale() && hour_activity.scale() < 0) {
    Reject("hour_activity.scale", "must not be negative, got " + std::to_string(hour_activity.scale()));
  }

  // Each hour is printed on its own line.
  if (hour_activity.marker().find_first_of("\r\n") != std::string::npos) {
    Reject("hour_activity.marker", "must not contain a line break");
  }

  if (!hour_activity.timezone().empty()) {
    try {
      (void)util::LoadZone(hour_activity.timezone());
    } catch (const util::InvalidArgument& e) {
      Reject("hour_activity.timezone", e.what());
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

tgstats::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  tgstats::runtime::config::RuntimeConfig config;

  // An empty document is a valid, all-defaults configuration.
  if (yaml.IsNull()) {
    return config;
  }

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

  ValidateConfig(config);
  return config;
}

} // namespace tgstats::config
