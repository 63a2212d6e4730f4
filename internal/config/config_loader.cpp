#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace heritage::config {

using heritage::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("1", "true" as header names)
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
// Defaults
// ------------------------------------------------------------

static void SetIfEmpty(std::string* field, const char* value) {
  if (field->empty()) {
    *field = value;
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* dataset = config.mutable_dataset();
  SetIfEmpty(dataset->mutable_delimiter(), ",");

  auto* columns = dataset->mutable_columns();
  SetIfEmpty(columns->mutable_source_id(), "source_id");
  SetIfEmpty(columns->mutable_source_name(), "source_name");
  SetIfEmpty(columns->mutable_source_age(), "age");
  SetIfEmpty(columns->mutable_kind(), "kind");
  SetIfEmpty(columns->mutable_target_id(), "target_id");
  SetIfEmpty(columns->mutable_target_name(), "target_name");
  SetIfEmpty(columns->mutable_target_age(), "target_age");

  if (dataset->column_order().empty()) {
    for (const char* name : {"source_id", "source_name", "source_age", "kind", "target_id"}) {
      dataset->add_column_order(name);
    }
  }

  auto* logging = config.mutable_logging();
  SetIfEmpty(logging->mutable_level(), "warn");
  SetIfEmpty(logging->mutable_pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& dataset = config.dataset();

  if (dataset.delimiter().size() != 1) {
    throw std::runtime_error("Invalid configuration: dataset.delimiter must be a single character, got '" +
                             dataset.delimiter() + "'");
  }
  if (dataset.delimiter() == "\"" || dataset.delimiter() == "\n" || dataset.delimiter() == "\r") {
    throw std::runtime_error("Invalid configuration: dataset.delimiter cannot be a quote or line break");
  }

  static const std::set<std::string> kLogicalColumns = {"source_id", "source_name", "source_age", "kind",
                                                        "target_id", "target_name", "target_age"};

  std::set<std::string> seen;
  for (const auto& name : dataset.column_order()) {
    if (!kLogicalColumns.count(name)) {
      throw std::runtime_error("Invalid configuration: unknown column '" + name + "' in dataset.column_order");
    }
    if (!seen.insert(name).second) {
      throw std::runtime_error("Invalid configuration: column '" + name + "' listed twice in dataset.column_order");
    }
  }

  if (dataset.headerless()) {
    for (const char* required : {"source_id", "kind", "target_id"}) {
      if (!seen.count(required)) {
        throw std::runtime_error(std::string("Invalid configuration: dataset.column_order lacks '") + required + "'");
      }
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty document is a valid "all defaults" file
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
  Validate(config);
  return config;
}

} // namespace heritage::config
