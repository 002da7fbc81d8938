#include "node_transform.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"
#include "internal/util/text.hpp"

namespace resonance::migration {

using namespace resonance::graph::v1;

double RiskWeight(double resonance, double decay) {
  const double normalized = std::clamp(resonance * (1.0 - decay), 0.0, 1.0);
  return std::round(normalized * 100.0) / 100.0;
}

NodeTransformer::NodeTransformer(std::vector<std::string> anchors, double default_resonance, double default_decay)
    : anchors_(std::move(anchors)), default_resonance_(default_resonance), default_decay_(default_decay) {
}

Node NodeTransformer::Parse(const std::string& text) const {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos || text[first] != '{') {
    throw util::ValidationError("element is not a node object");
  }

  Node node;
  util::ParseJsonMessage(text, &node, /*ignore_unknown_fields=*/true);
  return node;
}

void NodeTransformer::Validate(const Node& node) const {
  if (node.id().empty()) {
    throw util::ValidationError("missing id");
  }

  auto references_self = [&](const google::protobuf::RepeatedPtrField<std::string>& links) {
    return std::find(links.begin(), links.end(), node.id()) != links.end();
  };

  if (references_self(node.connects_to())) {
    throw util::ValidationError("circular reference in connectsTo");
  }
  if (references_self(node.outbound_links())) {
    throw util::ValidationError("circular reference in outboundLinks");
  }
  if (references_self(node.inbound_links())) {
    throw util::ValidationError("circular reference in inboundLinks");
  }
}

bool NodeTransformer::IsGoldStandard(const Node& node) const {
  return std::any_of(anchors_.begin(), anchors_.end(), [&](const std::string& anchor) {
    if (anchor.empty()) return false;
    return node.id().find(anchor) != std::string::npos || (node.has_cluster() && node.cluster() == anchor);
  });
}

MigratedNode NodeTransformer::Transform(const Node& node) const {
  const double resonance   = node.has_resonance_score() ? node.resonance_score() : default_resonance_;
  const double decay       = node.has_decay_score() ? node.decay_score() : default_decay_;
  const double link_weight = node.has_link_weight() ? node.link_weight() : 1.0;

  MigratedNode out;
  out.set_id(node.id());

  if (node.has_cluster() && !node.cluster().empty()) {
    out.set_parent_id(node.cluster());
  } else if (auto separator = node.id().find("::"); separator != std::string::npos && separator > 0) {
    out.set_parent_id(node.id().substr(0, separator));
  }

  out.set_risk_weight(RiskWeight(resonance, decay));
  out.set_type(node.type());
  out.set_title(node.title().empty() ? node.id() : node.title());
  out.set_path(node.path());
  out.set_slug(util::StripLeadingSlashes(node.path()));
  if (node.has_cluster()) {
    out.set_cluster(node.cluster());
  }
  *out.mutable_tags() = node.tags();
  out.set_resonance_score(resonance);
  out.set_decay_score(decay);
  out.set_link_weight(link_weight);
  out.set_is_gold_standard(IsGoldStandard(node));
  return out;
}

} // namespace resonance::migration
