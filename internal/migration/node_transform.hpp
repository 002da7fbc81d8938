#pragma once

#include <string>
#include <vector>

#include "resonance/graph/v1/migration.pb.h"
#include "resonance/graph/v1/node.pb.h"

namespace resonance::migration {

/*
  Registry node -> MigratedNode.

    ParentID    cluster, else the prefix of an "a::b" id, else null
    RiskWeight  round(clamp(R * (1 - D), 0, 1), 2)
                R, D fall back to the configured defaults when absent
    slug        path without the leading '/'

  A node is gold standard when its id contains an anchor or its cluster
  equals one.
*/
class NodeTransformer {
 public:
  NodeTransformer(std::vector<std::string> anchors, double default_resonance, double default_decay);

  // Throws ValidationError when the text is not a node object.
  resonance::graph::v1::Node Parse(const std::string& text) const;

  // Throws ValidationError on an empty id or a self-reference.
  void Validate(const resonance::graph::v1::Node& node) const;

  resonance::graph::v1::MigratedNode Transform(const resonance::graph::v1::Node& node) const;

  bool IsGoldStandard(const resonance::graph::v1::Node& node) const;

  const std::vector<std::string>& anchors() const {
    return anchors_;
  }

 private:
  std::vector<std::string> anchors_;
  double                   default_resonance_;
  double                   default_decay_;
};

double RiskWeight(double resonance, double decay);

} // namespace resonance::migration
