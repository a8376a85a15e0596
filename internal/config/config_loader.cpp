#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace graphflow::config {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("30s", "007")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

graphflow::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  // an empty document is a valid, all-defaults config
  if (json_value.kind_case() == google::protobuf::Value::kNullValue) {
    return {};
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  graphflow::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

void RequireUnitInterval(double value, const char* field) {
  if (value < 0.0 || value > 1.0) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " must be within [0, 1]");
  }
}

void RequireNonNegative(const google::protobuf::Duration& d, const char* field) {
  if (d.seconds() < 0 || d.nanos() < 0) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " must not be negative");
  }
}

} // namespace

void ConfigLoader::Validate(const graphflow::runtime::config::RuntimeConfig& config) {
  using graphflow::runtime::config::BLOB_TIER_OBJECT;

  const auto& router = config.router();
  RequireUnitInterval(router.history_weight(), "router.history_weight");
  RequireUnitInterval(router.default_success_rate(), "router.default_success_rate");
  RequireUnitInterval(router.probabilistic_jitter(), "router.probabilistic_jitter");
  RequireUnitInterval(router.close_contender_threshold(), "router.close_contender_threshold");
  if (router.exclusive_boost() < 0.0 || router.ai_nudge() < 0.0) {
    throw std::runtime_error("Invalid configuration: router boosts must not be negative");
  }

  RequireNonNegative(router.ai_timeout(), "router.ai_timeout");
  RequireNonNegative(config.engine().node_timeout(), "engine.node_timeout");
  RequireNonNegative(config.state_store().cache_ttl(), "state_store.cache_ttl");
  RequireNonNegative(config.debugger().trace_retention(), "debugger.trace_retention");
  RequireNonNegative(config.maintenance().interval(), "maintenance.interval");
  RequireNonNegative(config.maintenance().state_retention(), "maintenance.state_retention");
  RequireNonNegative(config.maintenance().backtrack_max_age(), "maintenance.backtrack_max_age");

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  if (config.storage().blob_tier() == BLOB_TIER_OBJECT && config.storage().object().root_path().empty()) {
    throw std::runtime_error("Invalid configuration: storage.object.root_path is required for BLOB_TIER_OBJECT");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

graphflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

graphflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

} // namespace graphflow::config
