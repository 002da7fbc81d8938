#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "internal/config/defaults.hpp"
#include "internal/util/json_value.hpp"

namespace resonance::config {

using resonance::runtime::config::RuntimeConfig;

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
    case YAML::NodeType::Undefined:
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
// Environment overrides
// ------------------------------------------------------------

namespace {

uint64_t ParseUnsigned(const char* name, const char* raw) {
  if (auto value = util::ParseUnsigned(raw)) {
    return *value;
  }
  throw std::runtime_error(std::string("Invalid ") + name + ": '" + raw + "' is not an unsigned integer in range");
}

double ParseDouble(const char* name, const char* raw) {
  char*        endptr = nullptr;
  const double value  = strtod(raw, &endptr);
  if (endptr == raw || *endptr != '\0') {
    throw std::runtime_error(std::string("Invalid ") + name + ": '" + raw + "' is not a number");
  }
  return value;
}

template <typename Setter>
void OverrideUnsigned(const char* name, Setter&& setter) {
  if (const char* raw = std::getenv(name)) {
    setter(ParseUnsigned(name, raw));
  }
}

template <typename Setter>
void OverrideDouble(const char* name, Setter&& setter) {
  if (const char* raw = std::getenv(name)) {
    setter(ParseDouble(name, raw));
  }
}

template <typename T>
  requires std::is_arithmetic_v<T>
T OrDefault(T value, T fallback) {
  return value ? value : fallback;
}

std::string OrDefault(const std::string& value, std::string_view fallback) {
  return value.empty() ? std::string(fallback) : value;
}

std::string Join(const std::string& directory, std::string_view file) {
  return (std::filesystem::path(directory) / std::string(file)).string();
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

  return config;
}

RuntimeConfig ConfigLoader::Load(const std::string& path) {
  auto config = LoadFromYaml(path);
  ApplyEnvironment(&config);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig* config) {
  auto* migration = config->mutable_migration();
  auto* governor  = config->mutable_governor();
  auto* routing   = config->mutable_routing();
  auto* linking   = config->mutable_linking();

  OverrideUnsigned("RESONANCE_BATCH_SIZE", [&](uint64_t v) { migration->set_batch_size(static_cast<uint32_t>(v)); });
  OverrideUnsigned("RESONANCE_HEARTBEAT_INTERVAL",
                   [&](uint64_t v) { migration->set_heartbeat_interval(static_cast<uint32_t>(v)); });
  OverrideUnsigned("RESONANCE_CHECKPOINT_INTERVAL",
                   [&](uint64_t v) { migration->set_checkpoint_interval(static_cast<uint32_t>(v)); });
  OverrideUnsigned("RESONANCE_MEMORY_TARGET_MB", [&](uint64_t v) { governor->set_memory_target_mb(v); });
  OverrideUnsigned("RESONANCE_MEMORY_HARD_KILL_MB", [&](uint64_t v) { governor->set_memory_hard_kill_mb(v); });
  OverrideUnsigned("RESONANCE_BFS_MAX_DEPTH", [&](uint64_t v) { routing->set_max_depth(static_cast<uint32_t>(v)); });
  OverrideUnsigned("RESONANCE_BFS_TIME_BUDGET_MS",
                   [&](uint64_t v) { routing->set_time_budget_ms(static_cast<uint32_t>(v)); });
  OverrideUnsigned("RESONANCE_LINK_TOP_K", [&](uint64_t v) { linking->set_top_k(static_cast<uint32_t>(v)); });
  OverrideDouble("RESONANCE_PROPOSAL_THRESHOLD", [&](double v) { linking->set_proposal_threshold(v); });
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  namespace d = defaults;

  auto* sources = config->mutable_sources();
  sources->set_gates(OrDefault(sources->gates(), "data/gates.json"));
  sources->set_pain_points(OrDefault(sources->pain_points(), "data/pain-points.json"));
  sources->set_tools_canonical(OrDefault(sources->tools_canonical(), "data/tools-canonical.json"));
  sources->set_tools(OrDefault(sources->tools(), "data/tools.json"));
  sources->set_insights(OrDefault(sources->insights(), "data/insights.json"));
  sources->set_signals(OrDefault(sources->signals(), "data/signals/latest.json"));

  auto* output = config->mutable_output();
  output->set_directory(OrDefault(output->directory(), d::kOutputDirectory));
  output->set_registry_file(OrDefault(output->registry_file(), d::kRegistryFile));
  output->set_link_map_file(OrDefault(output->link_map_file(), d::kLinkMapFile));
  output->set_proposals_file(OrDefault(output->proposals_file(), d::kProposalsFile));
  output->set_self_heal_file(OrDefault(output->self_heal_file(), d::kSelfHealFile));
  output->set_version(OrDefault(output->version(), d::kDocumentVersion));

  auto* scoring = config->mutable_scoring();
  if (!scoring->has_initial_resonance()) scoring->set_initial_resonance(d::kInitialResonance);
  if (!scoring->has_resonance_floor()) scoring->set_resonance_floor(d::kResonanceFloor);
  if (!scoring->has_ctr_cap()) scoring->set_ctr_cap(d::kCtrCap);
  if (!scoring->has_ctr_weight()) scoring->set_ctr_weight(d::kCtrWeight);
  if (!scoring->has_dwell_cap_minutes()) scoring->set_dwell_cap_minutes(d::kDwellCapMinutes);
  if (!scoring->has_dwell_weight()) scoring->set_dwell_weight(d::kDwellWeight);
  if (!scoring->has_depth_cap()) scoring->set_depth_cap(d::kDepthCap);
  if (!scoring->has_depth_weight()) scoring->set_depth_weight(d::kDepthWeight);
  if (!scoring->has_return_visit_cap()) scoring->set_return_visit_cap(d::kReturnVisitCap);
  if (!scoring->has_return_visit_weight()) scoring->set_return_visit_weight(d::kReturnVisitWeight);
  if (!scoring->has_unobserved_decay_step()) scoring->set_unobserved_decay_step(d::kUnobservedDecayStep);
  if (!scoring->has_unobserved_decay_cap()) scoring->set_unobserved_decay_cap(d::kUnobservedDecayCap);
  if (!scoring->has_age_decay_per_day()) scoring->set_age_decay_per_day(d::kAgeDecayPerDay);
  if (!scoring->has_age_decay_cap()) scoring->set_age_decay_cap(d::kAgeDecayCap);

  auto* linking = config->mutable_linking();
  linking->set_top_k(OrDefault(linking->top_k(), d::kTopK));
  if (!linking->has_proposal_threshold()) linking->set_proposal_threshold(d::kProposalThreshold);
  linking->set_reason(OrDefault(linking->reason(), d::kLinkReason));

  auto* migration = config->mutable_migration();
  migration->set_input(OrDefault(migration->input(), Join(output->directory(), output->registry_file())));
  migration->set_output_directory(OrDefault(migration->output_directory(), d::kMigrationOutput));
  migration->set_checkpoint_file(OrDefault(migration->checkpoint_file(), d::kCheckpointFile));
  migration->set_heartbeat_log(OrDefault(migration->heartbeat_log(), d::kHeartbeatLog));
  migration->set_batch_size(OrDefault(migration->batch_size(), d::kBatchSize));
  migration->set_heartbeat_interval(OrDefault(migration->heartbeat_interval(), d::kHeartbeatInterval));
  migration->set_checkpoint_interval(OrDefault(migration->checkpoint_interval(), d::kCheckpointInterval));
  migration->set_read_chunk_bytes(OrDefault(migration->read_chunk_bytes(), d::kReadChunkBytes));
  if (!migration->has_default_resonance()) migration->set_default_resonance(d::kDefaultResonance);
  if (!migration->has_default_decay()) migration->set_default_decay(d::kDefaultDecay);
  if (migration->gold_standard_anchors().empty()) {
    for (auto anchor : d::kGoldStandardAnchors) {
      migration->add_gold_standard_anchors(std::string(anchor));
    }
  }

  auto* routing = config->mutable_routing();
  routing->set_link_map(OrDefault(routing->link_map(), Join(output->directory(), output->link_map_file())));
  routing->set_max_depth(OrDefault(routing->max_depth(), d::kMaxDepth));
  routing->set_max_routes(OrDefault(routing->max_routes(), d::kMaxRoutes));
  routing->set_time_budget_ms(OrDefault(routing->time_budget_ms(), d::kTimeBudgetMs));

  auto* governor = config->mutable_governor();
  governor->set_memory_target_mb(OrDefault(governor->memory_target_mb(), d::kMemoryTargetMb));
  governor->set_memory_hard_kill_mb(OrDefault(governor->memory_hard_kill_mb(), d::kMemoryHardKillMb));
  if (!governor->has_thermal_throttle_celsius()) governor->set_thermal_throttle_celsius(d::kThermalThrottleCelsius);
  if (!governor->has_thermal_hard_kill_celsius()) governor->set_thermal_hard_kill_celsius(d::kThermalHardKillCelsius);
  governor->set_throttle_delay_ms(OrDefault(governor->throttle_delay_ms(), d::kThrottleDelayMs));
  governor->set_failover_timeout_ms(OrDefault(governor->failover_timeout_ms(), d::kFailoverTimeoutMs));
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& governor = config.governor();
  if (governor.memory_target_mb() > governor.memory_hard_kill_mb()) {
    std::ostringstream msg;
    msg << "Invalid configuration: governor.memory_target_mb (" << governor.memory_target_mb()
        << ") exceeds governor.memory_hard_kill_mb (" << governor.memory_hard_kill_mb() << ")";
    throw std::runtime_error(msg.str());
  }
  if (governor.thermal_throttle_celsius() > governor.thermal_hard_kill_celsius()) {
    throw std::runtime_error("Invalid configuration: thermal throttle threshold exceeds hard-kill threshold");
  }

  const auto& scoring = config.scoring();
  if (scoring.resonance_floor() < 0.0) {
    throw std::runtime_error("Invalid configuration: scoring.resonance_floor must not be negative");
  }
  if (scoring.age_decay_cap() < 0.0 || scoring.unobserved_decay_cap() < 0.0) {
    throw std::runtime_error("Invalid configuration: decay caps must not be negative");
  }
}

} // namespace resonance::config
