#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace rowcast::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

namespace {

constexpr const char* kDefaultBindAddress     = "0.0.0.0:50061";
constexpr const char* kDefaultConsumingRole   = "authenticated";
constexpr const char* kDefaultClaimsSetting   = "request.jwt.claim.sub";
constexpr uint32_t    kDefaultBatchSize       = 100;
constexpr uint32_t    kDefaultPollIntervalMs  = 200;
constexpr uint32_t    kDefaultAdmissionMs     = 5000;
constexpr uint32_t    kDefaultShardSize       = 1024;
constexpr uint32_t    kDefaultQueueCapacity   = 1024;
constexpr uint32_t    kDefaultPoolSize        = 16;
constexpr const char* kDefaultSlotName        = "realtime";
constexpr const char* kDefaultPublication     = "supabase_realtime";

rowcast::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  if (!yaml || yaml.IsNull()) {
    rowcast::runtime::config::RuntimeConfig empty;
    ConfigLoader::ApplyDefaults(empty);
    return empty;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  rowcast::runtime::config::RuntimeConfig config;

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

rowcast::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

rowcast::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(rowcast::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);

  auto* engine = config.mutable_engine();
  if (engine->consuming_role().empty()) engine->set_consuming_role(kDefaultConsumingRole);
  if (engine->claims_setting().empty()) engine->set_claims_setting(kDefaultClaimsSetting);
  if (engine->batch_size() == 0) engine->set_batch_size(kDefaultBatchSize);
  if (engine->poll_interval_ms() == 0) engine->set_poll_interval_ms(kDefaultPollIntervalMs);
  if (engine->admission_timeout_ms() == 0) engine->set_admission_timeout_ms(kDefaultAdmissionMs);
  if (engine->admission_shard_size() == 0) engine->set_admission_shard_size(kDefaultShardSize);

  auto* fanout = config.mutable_fanout();
  if (fanout->queue_capacity() == 0) fanout->set_queue_capacity(kDefaultQueueCapacity);

  if (config.database().has_postgres()) {
    auto* postgres = config.mutable_database()->mutable_postgres();
    if (postgres->pool_size() == 0) postgres->set_pool_size(kDefaultPoolSize);
  }

  if (config.source().has_postgres_slot()) {
    auto* slot = config.mutable_source()->mutable_postgres_slot();
    if (slot->slot_name().empty()) slot->set_slot_name(kDefaultSlotName);
    if (slot->publication().empty()) slot->set_publication(kDefaultPublication);
  }
}

} // namespace rowcast::config
