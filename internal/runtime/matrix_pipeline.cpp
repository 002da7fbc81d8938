#include "matrix_pipeline.hpp"

#include <chrono>
#include <memory>

#include "internal/governor/failsafe_executor.hpp"
#include "internal/linking/link_recommender.hpp"
#include "internal/loader/graph_loader.hpp"
#include "internal/loader/source_reader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/routing/route_discovery.hpp"
#include "internal/scoring/signal_reader.hpp"
#include "internal/util/json_file.hpp"

namespace resonance::runtime {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

MatrixPipeline::MatrixPipeline(resonance::runtime::config::RuntimeConfig config) : config_(std::move(config)) {
}

std::filesystem::path MatrixPipeline::OutputPath(const std::string& file) const {
  return std::filesystem::path(config_.output().directory()) / file;
}

// ------------------------------------------------------------
// Build
// ------------------------------------------------------------

BuildSummary MatrixPipeline::Build(bool dry_run, util::TimePoint now) const {
  const auto sources = loader::SourceReader(config_.sources()).Read();
  auto       nodes   = loader::GraphLoader(config_.scoring().initial_resonance()).Build(sources);
  const auto signals = scoring::SignalReader(config_.sources()).Read();

  BuildSummary summary;
  summary.scoring = scoring::ResonanceScorer(config_.scoring()).Score(&nodes, signals, now);

  const linking::LinkRecommender recommender(config_.linking());
  const auto                     recommendations = recommender.Recommend(nodes);
  const auto                     proposals       = recommender.Propose(nodes);

  summary.nodes           = nodes.size();
  summary.recommendations = recommendations.size();
  summary.proposals       = proposals.size();

  const auto& version   = config_.output().version();
  const auto  generated = util::ToIso8601(now);

  if (!dry_run) {
    const auto registry_path  = OutputPath(config_.output().registry_file());
    const auto link_map_path  = OutputPath(config_.output().link_map_file());
    const auto proposals_path = OutputPath(config_.output().proposals_file());

    util::WriteJsonAtomic(registry_path, loader::MakeRegistry(nodes, version, generated));
    util::WriteJsonAtomic(link_map_path, linking::MakeLinkMap(recommendations, version, generated));
    util::WriteJsonAtomic(proposals_path, linking::MakeProposals(proposals, version, generated));

    summary.outputs = {registry_path, link_map_path, proposals_path};
  }

  RESONANCE_LOG_INFO("Matrix build finished", {IntField("nodes", static_cast<int64_t>(summary.nodes)),
                                               IntField("recommendations", static_cast<int64_t>(summary.recommendations)),
                                               IntField("proposals", static_cast<int64_t>(summary.proposals)),
                                               BoolField("dry_run", dry_run),
                                               StringField("output", config_.output().directory())});
  return summary;
}

// ------------------------------------------------------------
// Heal
// ------------------------------------------------------------

HealSummary MatrixPipeline::Heal(const std::vector<std::string>& failed_ids, bool dry_run, util::TimePoint now) const {
  const auto  link_map       = routing::LoadLinkMap(config_.routing().link_map());
  const auto& routing_config = config_.routing();

  // the primary may outlive this call when it times out, so it owns its engine
  auto primary = std::make_shared<routing::RouteDiscovery>(
      link_map, routing::RouteOptions{routing_config.max_depth(), routing_config.max_routes()});
  routing::RouteDiscovery legacy(link_map, routing::RouteOptions{1, routing_config.max_routes()});

  governor::FailSafeExecutor executor(std::chrono::milliseconds(config_.governor().failover_timeout_ms()));
  const auto                 budget = std::chrono::milliseconds(routing_config.time_budget_ms());

  auto outcome = executor.Execute(
      "self_heal", [primary, failed_ids, budget] { return primary->SelfHeal(failed_ids, budget); },
      [&] { return legacy.SelfHeal(failed_ids, budget); });

  HealSummary summary;
  summary.report   = std::move(outcome.value);
  summary.failover = outcome.failover;
  summary.engine   = outcome.engine;
  summary.report.set_version(config_.output().version());
  summary.report.set_generated(util::ToIso8601(now));

  if (!dry_run) {
    summary.output = OutputPath(config_.output().self_heal_file());
    util::WriteJsonAtomic(summary.output, summary.report);
  }

  RESONANCE_LOG_INFO("Self-heal report ready", {StringField("engine", summary.engine),
                                                IntField("rerouted", summary.report.rerouted()),
                                                IntField("unresolved", summary.report.unresolved()),
                                                BoolField("within_budget", summary.report.within_budget()),
                                                BoolField("dry_run", dry_run)});
  return summary;
}

} // namespace resonance::runtime
