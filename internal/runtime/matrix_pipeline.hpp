#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/scoring/resonance_scorer.hpp"
#include "internal/util/time.hpp"
#include "resonance/graph/v1/link.pb.h"

namespace resonance::runtime {

struct BuildSummary {
  size_t                             nodes{0};
  size_t                             recommendations{0};
  size_t                             proposals{0};
  scoring::ScoringReport             scoring;
  std::vector<std::filesystem::path> outputs;
};

struct HealSummary {
  resonance::graph::v1::SelfHealReport report;
  bool                                 failover{false};
  std::string                          engine;
  std::filesystem::path                output;
};

/*
  Matrix build and self-heal, end to end.

  Build: sources -> registry nodes -> signal scoring and decay ->
  link recommendations and node proposals -> registry.json, link-map.json,
  node-proposals.json.

  Heal: link map -> route discovery around the failed ids, run through a
  fail-safe executor whose legacy path only accepts direct reroutes ->
  self-heal.json.

  dry_run computes everything and writes nothing.
*/
class MatrixPipeline {
 public:
  explicit MatrixPipeline(resonance::runtime::config::RuntimeConfig config);

  BuildSummary Build(bool dry_run, util::TimePoint now) const;

  HealSummary Heal(const std::vector<std::string>& failed_ids, bool dry_run, util::TimePoint now) const;

 private:
  std::filesystem::path OutputPath(const std::string& file) const;

  resonance::runtime::config::RuntimeConfig config_;
};

} // namespace resonance::runtime
