#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace batch::config {
namespace {

using batch::runtime::config::RuntimeConfig;

void ToValue(const YAML::Node& node, google::protobuf::Value* value);

// Plain scalars are typed by content; quoted ones ("42") stay strings.
void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }
  if (text == "true" || text == "True" || text == "false" || text == "False") {
    value->set_bool_value(text[0] == 't' || text[0] == 'T');
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end != nullptr && *end == '\0') {
    value->set_number_value(number);
  } else {
    value->set_string_value(text);
  }
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  if (node.IsNull()) {
    value->set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    ScalarToValue(node, value);
  } else if (node.IsSequence()) {
    auto* list = value->mutable_list_value();
    for (const auto& item : node) {
      ToValue(item, list->add_values());
    }
  } else if (node.IsMap()) {
    auto& fields = *value->mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      ToValue(entry.second, &fields[entry.first.Scalar()]);
    }
  } else {
    throw std::runtime_error("Unsupported YAML node");
  }
}

// YAML -> google.protobuf.Value -> JSON -> RuntimeConfig, so the proto's
// JSON mapping (enum names, unknown-field rejection) applies to YAML too.
RuntimeConfig Parse(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document is a valid, all-defaults config
  if (!yaml.IsNull()) {
    google::protobuf::Value tree;
    ToValue(yaml, &tree);

    std::string json;
    const auto  dumped = google::protobuf::util::MessageToJsonString(tree, &json);
    if (!dumped.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(dumped.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    const auto parsed             = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!parsed.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(parsed.message()));
    }
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

batch::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

batch::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(batch::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address("0.0.0.0:50061");
  }
  if (server->shutdown_grace_ms() == 0) {
    server->set_shutdown_grace_ms(5000);
  }

  auto* engine = config.mutable_engine();
  if (engine->max_queue_size() == 0) {
    engine->set_max_queue_size(1000);
  }
  if (engine->poll_interval_ms() == 0) {
    engine->set_poll_interval_ms(100);
  }
  if (engine->data_dir().empty()) {
    engine->set_data_dir("./data");
  }
  if (!engine->has_recover_on_start()) {
    engine->set_recover_on_start(true);
  }

  auto* retry = engine->mutable_default_retry();
  if (retry->max_attempts() == 0) {
    retry->set_max_attempts(3);
  }
  if (retry->base_delay_ms() == 0) {
    retry->set_base_delay_ms(1000);
  }
  if (retry->multiplier() <= 0.0) {
    retry->set_multiplier(2.0);
  }
  if (retry->max_delay_ms() == 0) {
    retry->set_max_delay_ms(60000);
  }

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) {
    observability->set_service_name("batch-engine");
  }
  if (observability->trace_sample_ratio() <= 0.0 || observability->trace_sample_ratio() > 1.0) {
    observability->set_trace_sample_ratio(1.0);
  }
  if (observability->collection_interval_ms() == 0) {
    observability->set_collection_interval_ms(1000);
  }

  if (config.database().backend_case() == batch::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_sqlite();
  }
}

} // namespace batch::config
