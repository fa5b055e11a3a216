#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fraudit::config {

namespace {

constexpr std::uint32_t kDefaultBatchSize            = 1000;
constexpr std::uint32_t kDefaultMatchingWorkers      = 4;
constexpr std::uint32_t kDefaultCandidatesPerItem    = 10;
constexpr std::uint32_t kDefaultMaxBlockSize         = 5000;
constexpr std::uint32_t kDefaultBlockingPrefixLength = 3;
constexpr std::uint32_t kDefaultDetectionWorkers     = 6;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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
      throw util::ValidationError("unsupported YAML node");
  }
}

void Validate(const RuntimeConfig& config) {
  const auto& backend = config.database().backend();
  if (backend != "memory" && backend != "sqlite") {
    throw util::ValidationError("database.backend must be memory or sqlite, got: " + backend);
  }
  if (backend == "sqlite" && config.database().sqlite().path().empty()) {
    throw util::ValidationError("database.sqlite.path is required for the sqlite backend");
  }
  if (!config.detection().as_of().empty() && !util::ParseDate(config.detection().as_of())) {
    throw util::ValidationError("detection.as_of must be YYYY-MM-DD, got: " + config.detection().as_of());
  }
}

} // namespace

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* database = config->mutable_database();
  if (database->backend().empty()) {
    database->set_backend("memory");
  }

  auto* matching = config->mutable_matching();
  if (matching->batch_size() == 0) matching->set_batch_size(kDefaultBatchSize);
  if (matching->max_workers() == 0) matching->set_max_workers(kDefaultMatchingWorkers);
  if (matching->max_candidates_per_item() == 0) matching->set_max_candidates_per_item(kDefaultCandidatesPerItem);
  if (matching->max_block_size() == 0) matching->set_max_block_size(kDefaultMaxBlockSize);
  if (matching->blocking_prefix_length() == 0) matching->set_blocking_prefix_length(kDefaultBlockingPrefixLength);

  auto* detection = config->mutable_detection();
  if (detection->max_workers() == 0) detection->set_max_workers(kDefaultDetectionWorkers);
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

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

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

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

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

} // namespace fraudit::config
