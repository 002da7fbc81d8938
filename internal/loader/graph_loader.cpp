#include "graph_loader.hpp"

#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace resonance::loader {

using namespace resonance::graph::v1;

namespace {

constexpr double kGateWeight      = 1.0;
constexpr double kPainPointWeight = 0.8;
constexpr double kToolWeight      = 0.9;
constexpr double kInsightWeight   = 0.7;

constexpr const char* kUngatedCluster = "general";

} // namespace

GraphLoader::GraphLoader(double initial_resonance) : initial_resonance_(initial_resonance) {
}

Node GraphLoader::NewNode(const std::string& type, double link_weight) const {
  Node node;
  node.set_type(type);
  node.set_resonance_score(initial_resonance_);
  node.set_decay_score(0.0);
  node.set_link_weight(link_weight);
  return node;
}

Node GraphLoader::FromGate(const GateRecord& gate) const {
  auto node = NewNode("gate", kGateWeight);
  node.set_id(gate.id());
  node.set_path("/gates/" + gate.id());
  node.set_title(gate.title());
  node.add_tags(gate.id());
  node.set_cluster(gate.id());
  return node;
}

Node GraphLoader::FromPainPoint(const PainPointRecord& pain_point) const {
  auto node = NewNode("pain-point", kPainPointWeight);
  node.set_id(pain_point.gate_id() + "::" + pain_point.id());
  node.set_path("/gates/" + pain_point.gate_id() + "/" + pain_point.id());
  node.set_title(pain_point.title());
  node.add_tags(pain_point.gate_id());
  node.add_tags(pain_point.id());
  node.set_cluster(pain_point.gate_id());
  return node;
}

Node GraphLoader::FromTool(const ToolRecord& tool) const {
  auto node = NewNode("tool", kToolWeight);
  node.set_id("tool::" + tool.id());
  node.set_path("/tools/" + (tool.slug().empty() ? tool.id() : tool.slug()));
  node.set_title(tool.title());
  if (tool.gate_ids().empty()) {
    node.add_tags(kUngatedCluster);
    node.set_cluster(kUngatedCluster);
  } else {
    *node.mutable_tags() = tool.gate_ids();
    node.set_cluster(tool.gate_ids(0));
  }
  node.set_source(tool.source());
  return node;
}

Node GraphLoader::FromInsight(const InsightRecord& insight) const {
  const auto key = insight.slug().empty() ? util::NormalizeKey(insight.title()) : insight.slug();

  auto node = NewNode("insight", kInsightWeight);
  node.set_id("insight::" + key);
  node.set_path("/insights/" + key);
  node.set_title(insight.title());
  node.add_tags("insights");
  node.set_cluster("insights");
  return node;
}

std::vector<Node> GraphLoader::Build(const ContentSources& sources) const {
  std::vector<Node> nodes;
  nodes.reserve(sources.gates.size() + sources.pain_points.size() + sources.tools.size() + sources.insights.size());

  for (const auto& gate : sources.gates) {
    nodes.push_back(FromGate(gate));
    nodes.back().set_source(sources.gates_source);
  }
  for (const auto& pain_point : sources.pain_points) {
    nodes.push_back(FromPainPoint(pain_point));
    nodes.back().set_source(sources.pain_points_source);
  }
  for (const auto& tool : sources.tools) {
    nodes.push_back(FromTool(tool));
  }
  for (const auto& insight : sources.insights) {
    nodes.push_back(FromInsight(insight));
    nodes.back().set_source(sources.insights_source);
  }

  std::unordered_set<std::string> seen;
  size_t                          duplicates = 0;
  for (const auto& node : nodes) {
    if (!seen.insert(node.id()).second) ++duplicates;
  }
  if (duplicates) {
    RESONANCE_LOG_WARN("Registry contains duplicate node ids",
                       {observability::IntField("duplicates", static_cast<int64_t>(duplicates))});
  }

  return nodes;
}

Registry MakeRegistry(const std::vector<Node>& nodes, const std::string& version, const std::string& generated) {
  Registry registry;
  registry.set_version(version);
  registry.set_generated(generated);
  for (const auto& node : nodes) {
    *registry.add_nodes() = node;
  }
  return registry;
}

} // namespace resonance::loader
