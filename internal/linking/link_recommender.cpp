#include "link_recommender.hpp"

#include <algorithm>
#include <unordered_map>

namespace resonance::linking {

using namespace resonance::graph::v1;

LinkRecommender::LinkRecommender(resonance::runtime::config::LinkingConfig config) : config_(std::move(config)) {
}

std::vector<LinkRecommendation> LinkRecommender::Recommend(const std::vector<Node>& nodes) const {
  // group, remembering first appearance
  std::vector<std::string>                                 cluster_order;
  std::unordered_map<std::string, std::vector<const Node*>> by_cluster;
  for (const auto& node : nodes) {
    const auto& cluster = node.cluster();
    auto [it, inserted] = by_cluster.try_emplace(cluster);
    if (inserted) cluster_order.push_back(cluster);
    it->second.push_back(&node);
  }

  std::vector<LinkRecommendation> recommendations;
  for (const auto& cluster : cluster_order) {
    auto members = by_cluster[cluster];
    std::stable_sort(members.begin(), members.end(),
                     [](const Node* a, const Node* b) { return a->resonance_score() > b->resonance_score(); });

    const size_t hub_count = std::min<size_t>(config_.top_k(), members.size());

    std::vector<std::string> hubs;
    hubs.reserve(hub_count);
    for (size_t i = 0; i < hub_count; ++i) hubs.push_back(members[i]->id());

    for (size_t i = hub_count; i < members.size(); ++i) {
      const auto& from = members[i]->id();

      LinkRecommendation recommendation;
      recommendation.set_from(from);
      for (const auto& hub : hubs) {
        // duplicate ids may share a cluster; never target yourself
        if (hub != from) recommendation.add_to(hub);
      }
      recommendation.set_cluster(cluster);
      recommendation.set_reason(config_.reason());
      recommendation.set_status(kDraftStatus);
      recommendations.push_back(std::move(recommendation));
    }
  }

  return recommendations;
}

std::vector<NodeProposal> LinkRecommender::Propose(const std::vector<Node>& nodes) const {
  std::vector<NodeProposal> proposals;
  for (const auto& node : nodes) {
    if (node.resonance_score() < config_.proposal_threshold()) continue;

    NodeProposal proposal;
    proposal.set_parent_node_id(node.id());
    proposal.set_parent_path(node.path());
    proposal.set_proposal(kProposalKind);
    proposal.set_intent_seed(node.title());
    proposal.set_status(kDraftStatus);
    proposal.set_requires_review(true);
    proposal.set_resonance_score(node.resonance_score());
    proposals.push_back(std::move(proposal));
  }
  return proposals;
}

LinkMap MakeLinkMap(const std::vector<LinkRecommendation>& recommendations, const std::string& version,
                    const std::string& generated) {
  LinkMap map;
  map.set_version(version);
  map.set_generated(generated);
  for (const auto& recommendation : recommendations) {
    *map.add_recommendations() = recommendation;
  }
  return map;
}

NodeProposals MakeProposals(const std::vector<NodeProposal>& proposals, const std::string& version,
                            const std::string& generated) {
  NodeProposals document;
  document.set_version(version);
  document.set_generated(generated);
  document.set_status(kDraftStatus);
  for (const auto& proposal : proposals) {
    *document.add_proposals() = proposal;
  }
  return document;
}

} // namespace resonance::linking
