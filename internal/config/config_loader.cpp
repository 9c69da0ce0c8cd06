#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "internal/store/api/paths.hpp"

namespace rackwise::config {

using rackwise::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress      = "0.0.0.0:7070";
constexpr const char* kDefaultNodesRoot        = "/nodes";
constexpr const char* kDefaultRacksRoot        = "/racks";
constexpr const char* kDefaultRackAttributeKey = "rackid";
constexpr const char* kDefaultRackId           = "DEFAULT";
constexpr uint64_t    kDefaultCheckIntervalMs  = 60000;
constexpr uint64_t    kDefaultShutdownGraceMs  = 5000;
constexpr uint32_t    kDefaultBusyTimeoutMs    = 5000;

void ToValue(const YAML::Node& node, google::protobuf::Value* value);

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // Quoted scalars stay strings, so default_rack_id: "42" is not a number.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      return;
    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToValue(item, list->add_values());
      }
      return;
    }
    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      return;
    }
    default:
      throw std::runtime_error("unsupported YAML node in config");
  }
}

// True when inner equals outer or lies somewhere below it.
bool IsWithin(std::string_view inner, std::string_view outer) {
  if (outer == "/") return true;
  return inner == outer || (inner.size() > outer.size() && inner.substr(0, outer.size()) == outer && inner[outer.size()] == '/');
}

void CheckPath(const std::string& field, const std::string& path) {
  try {
    store::ValidatePath(path);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument(field + ": " + e.what());
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  google::protobuf::Value value;
  ToValue(yaml, &value);

  std::string json;
  const auto  to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  const auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid configuration " + path + ": " + std::string(parsed.message()));
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }
  if (server->shutdown_grace_ms() == 0) {
    server->set_shutdown_grace_ms(kDefaultShutdownGraceMs);
  }

  auto* coordination = config->mutable_coordination();
  if (coordination->has_sqlite() && coordination->sqlite().busy_timeout_ms() == 0) {
    coordination->mutable_sqlite()->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  }
  if (coordination->nodes_root().empty()) {
    coordination->set_nodes_root(kDefaultNodesRoot);
  }
  if (coordination->racks_root().empty()) {
    coordination->set_racks_root(kDefaultRacksRoot);
  }

  auto* topology = config->mutable_topology();
  if (topology->rack_id_attribute_key().empty()) {
    topology->set_rack_id_attribute_key(kDefaultRackAttributeKey);
  }
  if (topology->default_rack_id().empty()) {
    topology->set_default_rack_id(kDefaultRackId);
  }

  auto* upstream_check = config->mutable_upstream_check();
  if (upstream_check->interval_ms() == 0) {
    upstream_check->set_interval_ms(kDefaultCheckIntervalMs);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& coordination = config.coordination();
  if (coordination.has_sqlite() && coordination.sqlite().path().empty()) {
    throw std::invalid_argument("coordination.sqlite.path is required");
  }

  CheckPath("coordination.nodes_root", coordination.nodes_root());
  CheckPath("coordination.racks_root", coordination.racks_root());
  if (IsWithin(coordination.nodes_root(), coordination.racks_root()) || IsWithin(coordination.racks_root(), coordination.nodes_root())) {
    throw std::invalid_argument("coordination.nodes_root and coordination.racks_root must not overlap");
  }

  const auto& catalog_root = coordination.catalog_root();
  if (!catalog_root.empty() && catalog_root != "/") {
    CheckPath("coordination.catalog_root", catalog_root);
  }

  const auto& check = config.upstream_check();
  if (check.enabled() && check.load_balancer_endpoint().empty()) {
    throw std::invalid_argument("upstream_check.load_balancer_endpoint is required when upstream_check.enabled is set");
  }
}

} // namespace rackwise::config
