#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace caretask::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // quoted scalars stay strings ("50061" for a port name, etc.)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
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

caretask::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  caretask::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Normalize(config);
  return config;
}

void ConfigLoader::Normalize(caretask::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* database = config.mutable_database();
  switch (database->backend_case()) {
    case caretask::runtime::config::DatabaseConfig::kSqlite:
      if (database->sqlite().path().empty()) {
        throw util::ValidationError("Invalid configuration: database.sqlite.path must not be empty");
      }
      break;
    case caretask::runtime::config::DatabaseConfig::kPostgres:
      if (database->postgres().connection_uri().empty()) {
        throw util::ValidationError("Invalid configuration: database.postgres.connection_uri must not be empty");
      }
      break;
    case caretask::runtime::config::DatabaseConfig::kMemory:
      break;
    case caretask::runtime::config::DatabaseConfig::BACKEND_NOT_SET:
      database->mutable_memory();
      break;
  }

  if (config.cache().backend_case() == caretask::runtime::config::CacheConfig::BACKEND_NOT_SET) {
    config.mutable_cache()->mutable_memory();
  }
}

} // namespace caretask::config
