#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace mvtracker::config {

using mvtracker::runtime::config::RuntimeConfig;
using mvtracker::util::ConfigError;

namespace {

constexpr uint32_t kMaxSearchResults = 50;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("123" as a group id)
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
      throw ConfigError("Unsupported YAML node");
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  if (!yaml.IsMap()) {
    throw ConfigError("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
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
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* catalog = config.mutable_catalog();
  if (catalog->base_url().empty()) catalog->set_base_url("https://www.googleapis.com/youtube/v3");
  if (!catalog->has_max_results()) catalog->set_max_results(kMaxSearchResults);
  catalog->set_max_results(std::clamp<uint32_t>(catalog->max_results(), 1, kMaxSearchResults));
  if (!catalog->has_timeout_seconds()) catalog->set_timeout_seconds(10);

  auto* sink = config.mutable_sink();
  if (sink->base_url().empty()) sink->set_base_url("https://api.mackerelio.com/api/v0");
  if (sink->service_name().empty()) sink->set_service_name("kpop-trends");
  if (sink->metric_namespace().empty()) sink->set_metric_namespace("kpop.youtube");
  if (!sink->has_timeout_seconds()) sink->set_timeout_seconds(10);

  auto* state = config.mutable_state();
  if (state->backend().empty()) state->set_backend("json");
  if (state->path().empty()) state->set_path(state->backend() == "sqlite" ? "state.db" : "state.json");

  auto* schedule = config.mutable_schedule();
  if (schedule->search_hours().empty()) {
    schedule->add_search_hours(14);
    schedule->add_search_hours(19);
  }
  if (!schedule->has_utc_offset_hours()) schedule->set_utc_offset_hours(9);

  auto* resolver = config.mutable_resolver();
  if (resolver->relaxed_marker().empty()) resolver->set_relaxed_marker("mv");
  if (!resolver->has_min_duration_seconds()) resolver->set_min_duration_seconds(60);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.state().backend() != "json" && config.state().backend() != "sqlite") {
    throw ConfigError("Invalid configuration: state.backend must be 'json' or 'sqlite', got '" + config.state().backend() + "'");
  }

  for (const auto hour : config.schedule().search_hours()) {
    if (hour > 23) {
      throw ConfigError("Invalid configuration: schedule.search_hours entries must be within 0..23");
    }
  }

  const auto offset = config.schedule().utc_offset_hours();
  if (offset < -12 || offset > 14) {
    throw ConfigError("Invalid configuration: schedule.utc_offset_hours must be within -12..14");
  }

  // a blank keyword would reject every title, a blank suffix accept every one
  for (const auto& keyword : config.resolver().exclude_keywords()) {
    if (util::Trim(keyword).empty()) {
      throw ConfigError("Invalid configuration: resolver.exclude_keywords entries must not be blank");
    }
  }
  for (const auto& suffix : config.resolver().accept_suffixes()) {
    if (util::Trim(suffix).empty()) {
      throw ConfigError("Invalid configuration: resolver.accept_suffixes entries must not be blank");
    }
  }
  if (util::Trim(config.resolver().relaxed_marker()).empty()) {
    throw ConfigError("Invalid configuration: resolver.relaxed_marker must not be blank");
  }

  if (config.groups().empty()) {
    throw ConfigError("Invalid configuration: at least one group is required");
  }

  std::unordered_set<std::string> ids;
  for (const auto& group : config.groups()) {
    if (group.id().empty() || util::Trim(group.name()).empty() || group.channel_id().empty()) {
      throw ConfigError("Invalid configuration: groups require id, name and channel_id");
    }
    if (!ids.insert(group.id()).second) {
      throw ConfigError("Invalid configuration: duplicate group id '" + group.id() + "'");
    }
  }
}

} // namespace mvtracker::config
