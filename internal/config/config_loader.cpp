#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace arena::config {

using arena::runtime::config::RunConfig;
using arena::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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
      throw util::ConfigError("unsupported YAML node");
  }
}

// "second_price" -> "CLEARING_RULE_SECOND_PRICE"
static void ExpandEnum(google::protobuf::Struct* section, const std::string& field, const std::string& prefix) {
  auto it = section->mutable_fields()->find(field);
  if (it == section->mutable_fields()->end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return;
  }
  std::string name = it->second.string_value();
  for (auto& c : name) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  if (name.rfind(prefix, 0) != 0) {
    name = prefix + name;
  }
  it->second.set_string_value(name);
}

static google::protobuf::Struct* Section(google::protobuf::Value& root, const std::string& name) {
  if (root.kind_case() != google::protobuf::Value::kStructValue) return nullptr;
  auto& fields = *root.mutable_struct_value()->mutable_fields();
  auto  it     = fields.find(name);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStructValue) return nullptr;
  return it->second.mutable_struct_value();
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  if (auto* run = Section(json_value, "run")) {
    ExpandEnum(run, "clearing_rule", "CLEARING_RULE_");
    ExpandEnum(run, "isolation", "ISOLATION_MODE_");
  }
  if (auto* observability = Section(json_value, "observability")) {
    ExpandEnum(observability, "transport", "OTLP_TRANSPORT_");
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigError("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigError("invalid configuration: " + std::string(status.message()));
  }

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
    throw util::ConfigError("failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::ConfigError("failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RunConfig ConfigLoader::WithDefaults(const RunConfig& run) {
  RunConfig out = run;
  if (out.clearing_rule() == arena::core::v1::CLEARING_RULE_UNSPECIFIED) {
    out.set_clearing_rule(arena::core::v1::CLEARING_RULE_SECOND_PRICE);
  }
  if (out.per_invocation_timeout_ms() == 0) out.set_per_invocation_timeout_ms(kDefaultInvocationTimeoutMs);
  if (out.per_invocation_memory_limit_bytes() == 0) {
    out.set_per_invocation_memory_limit_bytes(kDefaultInvocationMemoryBytes);
  }
  if (!out.has_disqualify_after_n_faults()) out.set_disqualify_after_n_faults(kDefaultDisqualifyAfterNFaults);
  if (!out.has_starting_budget_per_strategy()) out.set_starting_budget_per_strategy(kDefaultStartingBudget);
  if (out.max_steps_per_invocation() == 0) out.set_max_steps_per_invocation(kDefaultMaxSteps);
  if (out.max_call_depth() == 0) out.set_max_call_depth(kDefaultMaxCallDepth);
  if (out.isolation() == arena::runtime::config::ISOLATION_MODE_UNSPECIFIED) {
    out.set_isolation(arena::runtime::config::ISOLATION_MODE_PROCESS);
  }
  if (out.history_interval() == 0) out.set_history_interval(kDefaultHistoryInterval);
  if (!out.has_compute_market_summary()) out.set_compute_market_summary(true);
  return out;
}

RunConfig ConfigLoader::Merge(const RunConfig& base, const RunConfig& overrides) {
  RunConfig out = base;
  out.MergeFrom(overrides);
  return out;
}

void ConfigLoader::ValidateRunConfig(const RunConfig& run) {
  if (run.clearing_rule() != arena::core::v1::CLEARING_RULE_FIRST_PRICE &&
      run.clearing_rule() != arena::core::v1::CLEARING_RULE_SECOND_PRICE) {
    throw util::ConfigError("run.clearing_rule must be first_price or second_price");
  }
  if (run.per_invocation_timeout_ms() == 0) {
    throw util::ConfigError("run.per_invocation_timeout_ms must be positive");
  }
  if (run.per_invocation_memory_limit_bytes() == 0) {
    throw util::ConfigError("run.per_invocation_memory_limit_bytes must be positive");
  }
  if (run.has_starting_budget_per_strategy() &&
      (!std::isfinite(run.starting_budget_per_strategy()) || run.starting_budget_per_strategy() < 0.0)) {
    throw util::ConfigError("run.starting_budget_per_strategy must be a non-negative number");
  }
  if (run.max_steps_per_invocation() == 0) {
    throw util::ConfigError("run.max_steps_per_invocation must be positive");
  }
  if (run.max_call_depth() == 0) {
    throw util::ConfigError("run.max_call_depth must be positive");
  }
  if (run.isolation() != arena::runtime::config::ISOLATION_MODE_PROCESS &&
      run.isolation() != arena::runtime::config::ISOLATION_MODE_IN_PROCESS) {
    throw util::ConfigError("run.isolation must be process or in_process");
  }
  if (run.history_interval() == 0) {
    throw util::ConfigError("run.history_interval must be positive");
  }
}

} // namespace arena::config
