#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "config/config.pb.h"

#include "internal/governor/resource_governor.hpp"
#include "internal/migration/migration_engine.hpp"
#include "internal/observability/event_sink.hpp"
#include "internal/runtime/matrix_pipeline.hpp"

namespace resonance::factory {

/*
  Composition root.

  The only place that picks concrete samplers, sinks and output destinations.
  Everything below receives its collaborators through constructors.
*/

std::shared_ptr<governor::ResourceGovernor> BuildGovernor(const resonance::runtime::config::GovernorConfig& config);

// Dry runs get a NullEventSink; otherwise the heartbeat log is appended to.
std::shared_ptr<observability::EventSink> BuildEventSink(const resonance::runtime::config::MigrationConfig& config,
                                                         bool                                               dry_run);

std::unique_ptr<migration::MigrationEngine> BuildMigration(const resonance::runtime::config::RuntimeConfig& config,
                                                           bool dry_run, std::optional<uint64_t> limit);

std::unique_ptr<runtime::MatrixPipeline> BuildPipeline(const resonance::runtime::config::RuntimeConfig& config);

} // namespace resonance::factory
