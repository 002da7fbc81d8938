#include "internal/scoring/resonance_scorer.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/scoring/signal_reader.hpp"
#include "internal/util/json_file.hpp"

namespace {

using resonance::graph::v1::Node;
using resonance::graph::v1::Signal;
using resonance::scoring::ResonanceScorer;
using resonance::scoring::ScoringReport;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

ResonanceScorer DefaultScorer() {
  return ResonanceScorer(resonance::config::ConfigLoader::Defaults().scoring());
}

Node MakeNode(const std::string& id, const std::string& path, double resonance) {
  Node node;
  node.set_id(id);
  node.set_path(path);
  node.set_resonance_score(resonance);
  node.set_decay_score(0.0);
  return node;
}

Signal FullSignal(const std::string& node_id) {
  Signal signal;
  signal.set_node_id(node_id);
  signal.set_impressions(1000);
  signal.set_clicks(100);
  signal.set_dwell_seconds(120);
  signal.set_traversal_depth(2);
  signal.set_return_visits(1);
  return signal;
}

void TestBoostFormula() {
  auto scorer = DefaultScorer();
  assert(Near(scorer.ScoreBoost(FullSignal("grief")), 1.5));

  // explicit ctr wins over clicks / impressions; the cap applies
  Signal capped = FullSignal("grief");
  capped.set_ctr(0.9);
  assert(Near(scorer.ScoreBoost(capped), 0.25 * 4.0 + 0.6 + 0.3 + 0.2));

  // ctr of zero falls back to the ratio
  Signal zero_ctr = FullSignal("grief");
  zero_ctr.set_ctr(0.0);
  assert(Near(scorer.ScoreBoost(zero_ctr), 1.5));
}

void TestObservedNodeGainsBoostWithoutAgeDecay() {
  auto       scorer = DefaultScorer();
  const auto now    = resonance::util::Now();

  std::vector<Node> nodes{MakeNode("grief", "/gates/grief", 0.5)};
  auto              report = scorer.Score(&nodes, {FullSignal("grief")}, now);

  assert(report.signals_applied == 1);
  assert(report.nodes_aged == 1);
  assert(Near(nodes[0].resonance_score(), 2.0));
  assert(Near(nodes[0].decay_score(), 0.0));
  assert(resonance::util::ToUnixMillis(resonance::util::FromProto(nodes[0].last_updated())) ==
         resonance::util::ToUnixMillis(now));
}

void TestPathMatchIgnoresTrailingSlash() {
  auto scorer = DefaultScorer();

  std::vector<Node> nodes{MakeNode("tool::journal", "/tools/journal", 1.0)};
  Signal            by_path;
  by_path.set_path("/tools/journal/");
  by_path.set_return_visits(1);

  Signal unknown;
  unknown.set_node_id("tool::missing");

  ScoringReport report;
  scorer.ApplySignals(&nodes, {by_path, unknown}, resonance::util::Now(), &report);

  assert(report.signals_applied == 1);
  assert(report.signals_dropped == 1);
  assert(Near(nodes[0].resonance_score(), 1.2));
}

void TestUnobservedNodesDecayOncePerRun() {
  auto              scorer = DefaultScorer();
  std::vector<Node> nodes{MakeNode("anger", "/gates/anger", 1.0), MakeNode("fear", "/gates/fear", 0.5)};

  auto report = scorer.Score(&nodes, {}, resonance::util::Now());

  assert(report.nodes_unobserved == 2);
  assert(nodes[0].resonance_score() < 1.0);
  assert(Near(nodes[0].resonance_score(), 0.95));
  assert(Near(nodes[0].decay_score(), 0.05));

  // floor holds
  assert(Near(nodes[1].resonance_score(), 0.5));
  assert(nodes[1].decay_score() > 0.0);
}

void TestUnobservedDecayIsCapped() {
  auto scorer = DefaultScorer();
  Node node   = MakeNode("anger", "/gates/anger", 3.0);
  node.set_decay_score(0.28);

  std::vector<Node> nodes{node};
  ScoringReport     report;
  scorer.ApplyDecay(&nodes, resonance::util::Now(), &report);

  assert(Near(nodes[0].decay_score(), 0.3));
}

void TestAgeDecay() {
  auto       scorer = DefaultScorer();
  const auto now    = resonance::util::Now();

  Node recent = MakeNode("grief", "/gates/grief", 1.0);
  *recent.mutable_last_updated() = resonance::util::ToProto(now - std::chrono::hours(24 * 10));

  Node ancient = MakeNode("anger", "/gates/anger", 0.6);
  *ancient.mutable_last_updated() = resonance::util::ToProto(now - std::chrono::hours(24 * 400));

  std::vector<Node> nodes{recent, ancient};
  ScoringReport     report;
  scorer.ApplyDecay(&nodes, now, &report);

  assert(report.nodes_aged == 2);
  assert(std::fabs(nodes[0].decay_score() - 0.1) < 1e-6);
  assert(std::fabs(nodes[0].resonance_score() - 0.9) < 1e-6);
  assert(Near(nodes[1].decay_score(), 0.5));
  assert(Near(nodes[1].resonance_score(), 0.5));
}

void TestSignalResolution() {
  auto raw = resonance::util::ParseJsonValue(
      R"({"node_id": "grief", "impressions": "1000", "clicks": 100, "navigationDepth": 3,
          "timestamp": "2024-03-01T12:00:00Z"})");
  auto signal = resonance::scoring::ResolveSignal(raw.struct_value(), "signals");

  assert(signal.node_id() == "grief");
  assert(signal.impressions() == 1000);
  assert(!signal.has_ctr());
  assert(signal.traversal_depth() == 3);
  assert(signal.source() == "signals");
  assert(signal.has_timestamp());

  size_t skipped = 0;
  auto   lines   = resonance::scoring::ParseSignalLines(
      "{\"nodeId\": \"a\"}\nnot json\n\n{\"path\": \"/b\", \"ctr\": 0.2}\n[1, 2]\n", "signals-jsonl", &skipped);
  assert(lines.size() == 2);
  assert(skipped == 2);
  assert(lines[1].has_ctr());

  auto ga4 = resonance::scoring::ParseGa4Aggregate(resonance::util::ParseJsonValue(
      R"([{"path": "/gates/grief", "impressions": 10, "avgEngagementTime": 45}, {"impressions": 3}])"));
  assert(ga4.size() == 1);
  assert(ga4[0].source() == "ga4-aggregate");
  assert(ga4[0].dwell_seconds() == 45);
}

} // namespace

int main() {
  TestBoostFormula();
  TestObservedNodeGainsBoostWithoutAgeDecay();
  TestPathMatchIgnoresTrailingSlash();
  TestUnobservedNodesDecayOncePerRun();
  TestUnobservedDecayIsCapped();
  TestAgeDecay();
  TestSignalResolution();

  std::cout << "resonance_unit_resonance_scorer: pass\n";
  return 0;
}
