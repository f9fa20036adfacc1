#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace edgestore::config {

using edgestore::runtime::config::RuntimeConfig;

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("123" must not become a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
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
      for (std::size_t i = 0; i < node.size(); ++i) {
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

RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsDefined() && !yaml.IsNull()) {
    YamlToProtoValue(yaml, &json_value);
  } else {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.database().backend_case() == edgestore::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite() && config.database().sqlite().busy_timeout_ms() == 0) {
    config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(5000);
  }
  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(16);
  }

  auto* mirror = config.mutable_mirror();
  if (mirror->insert_batch_size() == 0) mirror->set_insert_batch_size(500);
  if (mirror->read_page_size() == 0) mirror->set_read_page_size(256);

  auto* views = config.mutable_views();
  if (views->read_page_size() == 0) views->set_read_page_size(256);
  if (views->default_transform().empty()) views->set_default_transform("merge_context");

  auto* userdb = config.mutable_userdb();
  if (userdb->default_ts_path().empty()) userdb->set_default_ts_path("$.updated_at");
  if (userdb->max_indexes_per_table() == 0) userdb->set_max_indexes_per_table(16);
  if (userdb->default_list_limit() == 0) userdb->set_default_list_limit(100);
  if (userdb->max_list_limit() == 0) userdb->set_max_list_limit(1000);
  if (userdb->max_list_limit() < userdb->default_list_limit()) {
    throw std::runtime_error("Invalid configuration: userdb.max_list_limit is smaller than userdb.default_list_limit");
  }

  auto* transactions = config.mutable_transactions();
  if (!transactions->has_max_conflict_retries()) transactions->set_max_conflict_retries(8);
}

} // namespace edgestore::config
