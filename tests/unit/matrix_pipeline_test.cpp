#include "internal/runtime/matrix_pipeline.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"
#include "resonance/graph/v1.hpp"
#include "support/temp_dir.hpp"

namespace {

using resonance::runtime::MatrixPipeline;
using resonance::testing::FreshDir;
using resonance::testing::WriteText;

resonance::runtime::config::RuntimeConfig MakeConfig(const std::filesystem::path& dir) {
  WriteText(dir / "gates.json", R"({"gates": [{"id": "grief", "title": "Grief"}, {"id": "anger", "title": "Anger"}]})");
  WriteText(dir / "pain-points.json", R"({"painPoints": {"grief": [{"id": "sleepless"}, {"id": "numb"}]}})");
  WriteText(dir / "tools-canonical.json", R"({"tools": [{"slug": "journal", "title": "Journal", "gateIds": ["grief"]}]})");
  WriteText(dir / "signals.json", R"([{"nodeId": "grief", "impressions": 100, "clicks": 50, "dwellSeconds": 600,
                                      "traversalDepth": 5, "returnVisits": 5},
                                     {"path": "/gates/unknown", "clicks": 3}])");

  auto config   = resonance::config::ConfigLoader::Defaults();
  auto* sources = config.mutable_sources();
  sources->set_gates((dir / "gates.json").string());
  sources->set_pain_points((dir / "pain-points.json").string());
  sources->set_tools_canonical((dir / "tools-canonical.json").string());
  sources->set_tools((dir / "tools.json").string());
  sources->set_insights((dir / "insights.json").string());
  sources->set_signals((dir / "signals.json").string());

  config.mutable_output()->set_directory((dir / "matrix").string());
  config.mutable_routing()->set_link_map((dir / "matrix" / "link-map.json").string());
  config.mutable_linking()->set_top_k(2);
  return config;
}

void TestBuildWritesRegistryLinkMapAndProposals() {
  const auto dir = FreshDir("matrix_pipeline", "build");
  MatrixPipeline pipeline(MakeConfig(dir));

  auto summary = pipeline.Build(false, resonance::util::Now());

  // 2 gates, 2 pain points, 1 tool
  assert(summary.nodes == 5);
  assert(summary.scoring.signals_applied == 1);
  assert(summary.scoring.signals_dropped == 1);
  assert(summary.recommendations == 2);
  assert(summary.proposals == 1);
  assert(summary.outputs.size() == 3);

  resonance::graph::v1::Registry registry;
  resonance::util::ReadJsonMessage(dir / "matrix" / "registry.json", &registry);
  assert(registry.nodes_size() == 5);
  assert(registry.version() == "1.0");
  for (const auto& node : registry.nodes()) {
    assert(node.resonance_score() >= 0.5);
  }

  resonance::graph::v1::NodeProposals proposals;
  resonance::util::ReadJsonMessage(dir / "matrix" / "node-proposals.json", &proposals);
  assert(proposals.status() == "draft");
  assert(proposals.proposals(0).parent_node_id() == "grief");
}

void TestHealReroutesAroundFailedHub() {
  const auto dir    = FreshDir("matrix_pipeline", "heal");
  const auto config = MakeConfig(dir);
  MatrixPipeline pipeline(config);
  (void)pipeline.Build(false, resonance::util::Now());

  auto summary = pipeline.Heal({"grief"}, false, resonance::util::Now());

  assert(summary.report.failed_size() == 1);
  assert(summary.report.rerouted() == 2);
  assert(summary.report.unresolved() == 0);
  assert(summary.report.version() == "1.0");
  assert(std::filesystem::exists(dir / "matrix" / "self-heal.json"));

  for (const auto& entry : summary.report.routes()) {
    assert(entry.failed() == "grief");
    assert(entry.alternatives_size() == 1);
    assert(entry.alternatives(0).hops(1) == "grief::sleepless");
  }
}

void TestDryRunWritesNothing() {
  const auto dir = FreshDir("matrix_pipeline", "dry_run");
  MatrixPipeline pipeline(MakeConfig(dir));

  auto summary = pipeline.Build(true, resonance::util::Now());
  assert(summary.nodes == 5);
  assert(summary.outputs.empty());
  assert(!std::filesystem::exists(dir / "matrix"));
}

void TestHealWithoutLinkMapIsIOError() {
  const auto dir = FreshDir("matrix_pipeline", "heal_missing");
  MatrixPipeline pipeline(MakeConfig(dir));

  bool threw = false;
  try {
    (void)pipeline.Heal({"grief"}, true, resonance::util::Now());
  } catch (const resonance::util::IOError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBuildWritesRegistryLinkMapAndProposals();
  TestHealReroutesAroundFailedHub();
  TestDryRunWritesNothing();
  TestHealWithoutLinkMapIsIOError();

  std::cout << "resonance_unit_matrix_pipeline: pass\n";
  return 0;
}
