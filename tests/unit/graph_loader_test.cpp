#include "internal/loader/graph_loader.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/loader/source_reader.hpp"
#include "internal/scoring/resonance_scorer.hpp"
#include "internal/util/json_file.hpp"
#include "internal/util/time.hpp"
#include "support/temp_dir.hpp"

namespace {

using resonance::graph::v1::ToolRecord;
using resonance::loader::ContentSources;
using resonance::loader::GraphLoader;
using resonance::loader::SourceReader;
using resonance::testing::FreshDir;
using resonance::testing::WriteText;
using resonance::util::ParseJsonValue;

void TestToolResolutionOrder() {
  auto raw = ParseJsonValue(R"({"name": "Box Breathing", "summary": "Slow the body down"})");
  auto tool = resonance::loader::ResolveTool(raw.struct_value(), "tools.json");

  assert(tool.has_value());
  assert(tool->id() == "box-breathing");
  assert(tool->slug() == "box-breathing");
  assert(tool->title() == "Box Breathing");
  assert(tool->description() == "Slow the body down");
  assert(tool->source() == "tools.json");

  auto nameless = ParseJsonValue(R"({"description": "no identity"})");
  assert(!resonance::loader::ResolveTool(nameless.struct_value(), "tools.json").has_value());
}

void TestMergeKeepsEarlierFieldsAndFillsGaps() {
  ToolRecord canonical;
  canonical.set_id("journal");
  canonical.set_slug("journal");
  canonical.set_title("Grief Journal");

  ToolRecord fallback;
  fallback.set_id("journal");
  fallback.set_slug("Journal");
  fallback.set_title("Journal (old)");
  fallback.set_description("Write it down");
  fallback.add_gate_ids("grief");

  ToolRecord other;
  other.set_id("walk");

  auto merged = resonance::loader::MergeTools({canonical, other, fallback});

  assert(merged.size() == 2);
  assert(merged[0].id() == "journal");
  assert(merged[0].title() == "Grief Journal");
  assert(merged[0].description() == "Write it down");
  assert(merged[0].gate_ids_size() == 1);
  assert(merged[1].id() == "walk");
}

void TestNodeConstruction() {
  GraphLoader loader(1.0);

  ContentSources sources;
  resonance::graph::v1::GateRecord gate;
  gate.set_id("grief");
  gate.set_title("Grief");
  sources.gates.push_back(gate);

  resonance::graph::v1::PainPointRecord pain;
  pain.set_gate_id("grief");
  pain.set_id("sleepless");
  pain.set_title("Sleepless nights");
  sources.pain_points.push_back(pain);

  ToolRecord tool;
  tool.set_id("journal");
  tool.set_slug("journal");
  tool.set_title("Journal");
  sources.tools.push_back(tool);

  resonance::graph::v1::InsightRecord insight;
  insight.set_title("What Grief Teaches");
  sources.insights.push_back(insight);

  resonance::graph::v1::InsightRecord second_insight;
  second_insight.set_title("Letting Go");
  sources.insights.push_back(second_insight);

  auto nodes = loader.Build(sources);
  assert(nodes.size() == 5);

  assert(nodes[0].id() == "grief");
  assert(nodes[0].path() == "/gates/grief");
  assert(nodes[0].link_weight() == 1.0);
  assert(nodes[0].resonance_score() == 1.0);
  assert(nodes[0].decay_score() == 0.0);

  assert(nodes[1].id() == "grief::sleepless");
  assert(nodes[1].path() == "/gates/grief/sleepless");
  assert(nodes[1].cluster() == "grief");
  assert(nodes[1].link_weight() == 0.8);

  assert(nodes[2].id() == "tool::journal");
  assert(nodes[2].path() == "/tools/journal");
  assert(nodes[2].cluster() == "general");
  assert(nodes[2].tags_size() == 1 && nodes[2].tags(0) == "general");
  assert(nodes[2].link_weight() == 0.9);

  assert(nodes[3].id() == "insight::what-grief-teaches");
  assert(nodes[3].cluster() == "insights");
  assert(nodes[3].link_weight() == 0.7);

  // slugless insights get distinct paths from their normalized titles
  assert(nodes[3].path() == "/insights/what-grief-teaches");
  assert(nodes[4].path() == "/insights/letting-go");
}

void TestSignalsKeyedByBareIdsReachTheirNodes() {
  GraphLoader loader(1.0);

  resonance::graph::v1::GateRecord gate;
  gate.set_id("fathers-sons");
  gate.set_title("Fathers and Sons");

  resonance::graph::v1::PainPointRecord pain;
  pain.set_gate_id("fathers-sons");
  pain.set_id("silence");

  ContentSources sources;
  sources.gates.push_back(gate);
  sources.pain_points.push_back(pain);
  auto nodes = loader.Build(sources);

  resonance::graph::v1::Signal by_gate;
  by_gate.set_node_id("fathers-sons");
  by_gate.set_clicks(10);
  by_gate.set_impressions(100);

  resonance::graph::v1::Signal by_pain_point;
  by_pain_point.set_node_id("fathers-sons::silence");
  by_pain_point.set_return_visits(2);

  resonance::scoring::ResonanceScorer scorer(resonance::config::ConfigLoader::Defaults().scoring());
  auto report = scorer.Score(&nodes, {by_gate, by_pain_point}, resonance::util::Now());

  assert(report.signals_applied == 2);
  assert(report.signals_dropped == 0);
  assert(nodes[0].resonance_score() > 1.0);
  assert(nodes[1].resonance_score() > 1.0);
}

void TestReaderDegradesOnMissingAndMalformedFiles() {
  const auto dir = FreshDir("graph_loader", "degrade");

  WriteText(dir / "gates.json", R"({"gates": [{"id": "grief", "title": "Grief"}, {"title": "no id"}]})");
  WriteText(dir / "pain-points.json", R"({"painPoints": {"grief": [{"id": "sleepless"}], "anger": [{"id": "rage"}]}})");
  WriteText(dir / "tools.json", "[{\"id\": \"walk\"");
  WriteText(dir / "tools-canonical.json", R"([{"slug": "journal", "title": "Journal"}])");

  resonance::runtime::config::SourcesConfig config;
  config.set_gates((dir / "gates.json").string());
  config.set_pain_points((dir / "pain-points.json").string());
  config.set_tools_canonical((dir / "tools-canonical.json").string());
  config.set_tools((dir / "tools.json").string());
  config.set_insights((dir / "missing-insights.json").string());

  auto sources = SourceReader(config).Read();

  assert(sources.gates.size() == 1);
  assert(sources.pain_points.size() == 2);
  // gate keys come out alphabetically
  assert(sources.pain_points[0].gate_id() == "anger");
  assert(sources.pain_points[1].gate_id() == "grief");
  assert(sources.tools.size() == 1);
  assert(sources.tools[0].id() == "journal");
  assert(sources.insights.empty());

  auto nodes = GraphLoader(1.0).Build(sources);
  assert(nodes.size() == 4);
  assert(nodes[0].source() == config.gates());
}

void TestRegistryDocument() {
  GraphLoader loader(1.0);
  resonance::graph::v1::GateRecord gate;
  gate.set_id("anger");
  gate.set_title("Anger");

  auto registry = resonance::loader::MakeRegistry({loader.FromGate(gate)}, "1.0", "2024-01-01T00:00:00Z");
  assert(registry.version() == "1.0");
  assert(registry.generated() == "2024-01-01T00:00:00Z");
  assert(registry.nodes_size() == 1);
}

} // namespace

int main() {
  TestToolResolutionOrder();
  TestMergeKeepsEarlierFieldsAndFillsGaps();
  TestNodeConstruction();
  TestSignalsKeyedByBareIdsReachTheirNodes();
  TestReaderDegradesOnMissingAndMalformedFiles();
  TestRegistryDocument();

  std::cout << "resonance_unit_graph_loader: pass\n";
  return 0;
}
