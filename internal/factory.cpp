#include "factory.hpp"

#include "internal/governor/samplers.hpp"

namespace resonance::factory {

using resonance::runtime::config::GovernorConfig;
using resonance::runtime::config::MigrationConfig;
using resonance::runtime::config::RuntimeConfig;

std::shared_ptr<governor::ResourceGovernor> BuildGovernor(const GovernorConfig& config) {
  auto memory = std::make_shared<governor::ProcessMemorySampler>();

  std::shared_ptr<governor::HardwareMonitor> hardware;
  if (config.thermal_sensor_path().empty()) {
    hardware = std::make_shared<governor::NullHardwareMonitor>();
  } else {
    hardware = std::make_shared<governor::SysfsHardwareMonitor>(config.thermal_sensor_path());
  }

  return std::make_shared<governor::ResourceGovernor>(config, std::move(memory), std::move(hardware));
}

std::shared_ptr<observability::EventSink> BuildEventSink(const MigrationConfig& config, bool dry_run) {
  if (dry_run || config.heartbeat_log().empty()) {
    return std::make_shared<observability::NullEventSink>();
  }
  return std::make_shared<observability::JsonlFileSink>(config.heartbeat_log());
}

std::unique_ptr<migration::MigrationEngine> BuildMigration(const RuntimeConfig& config, bool dry_run,
                                                           std::optional<uint64_t> limit) {
  auto options    = migration::MigrationOptions::FromConfig(config.migration());
  options.dry_run = dry_run;
  options.limit   = limit;

  return std::make_unique<migration::MigrationEngine>(std::move(options), BuildEventSink(config.migration(), dry_run),
                                                      BuildGovernor(config.governor()));
}

std::unique_ptr<runtime::MatrixPipeline> BuildPipeline(const RuntimeConfig& config) {
  return std::make_unique<runtime::MatrixPipeline>(config);
}

} // namespace resonance::factory
