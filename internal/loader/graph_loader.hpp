#pragma once

#include <string>
#include <vector>

#include "internal/loader/source_reader.hpp"
#include "resonance/graph/v1/node.pb.h"

namespace resonance::loader {

/*
  Turns resolved content records into registry nodes.

    gate        <id>                 /gates/<id>          weight 1.0
    pain-point  <gate>::<id>         /gates/<gate>/<id>   weight 0.8
    tool        tool::<id>           /tools/<slug>        weight 0.9
    insight     insight::<key>       /insights/<key>      weight 0.7

  A tool without gates lands in the "general" cluster.

  Node order: gates, pain points, tools, insights. Pain points follow their
  gate keys alphabetically, everything else keeps source order.
*/
class GraphLoader {
 public:
  explicit GraphLoader(double initial_resonance);

  std::vector<resonance::graph::v1::Node> Build(const ContentSources& sources) const;

  resonance::graph::v1::Node FromGate(const resonance::graph::v1::GateRecord& gate) const;
  resonance::graph::v1::Node FromPainPoint(const resonance::graph::v1::PainPointRecord& pain_point) const;
  resonance::graph::v1::Node FromTool(const resonance::graph::v1::ToolRecord& tool) const;
  resonance::graph::v1::Node FromInsight(const resonance::graph::v1::InsightRecord& insight) const;

 private:
  resonance::graph::v1::Node NewNode(const std::string& type, double link_weight) const;

  double initial_resonance_;
};

resonance::graph::v1::Registry MakeRegistry(const std::vector<resonance::graph::v1::Node>& nodes,
                                            const std::string&                             version,
                                            const std::string&                             generated);

} // namespace resonance::loader
