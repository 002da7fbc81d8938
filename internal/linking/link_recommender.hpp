#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "resonance/graph/v1/link.pb.h"
#include "resonance/graph/v1/node.pb.h"

namespace resonance::linking {

inline constexpr const char* kDraftStatus  = "draft";
inline constexpr const char* kProposalKind = "adjacent-intent-draft";

/*
  Cluster hub recommendations.

  Nodes are grouped by cluster (clusters in first-appearance order). Within a
  cluster the top_k highest-resonance nodes become hubs; ties keep input
  order. Every non-hub is recommended to link to all hubs of its cluster.
*/
class LinkRecommender {
 public:
  explicit LinkRecommender(resonance::runtime::config::LinkingConfig config);

  std::vector<resonance::graph::v1::LinkRecommendation> Recommend(
      const std::vector<resonance::graph::v1::Node>& nodes) const;

  // Draft expansion proposals for every node at or above proposal_threshold.
  std::vector<resonance::graph::v1::NodeProposal> Propose(const std::vector<resonance::graph::v1::Node>& nodes) const;

 private:
  resonance::runtime::config::LinkingConfig config_;
};

resonance::graph::v1::LinkMap MakeLinkMap(const std::vector<resonance::graph::v1::LinkRecommendation>& recommendations,
                                          const std::string& version, const std::string& generated);

resonance::graph::v1::NodeProposals MakeProposals(const std::vector<resonance::graph::v1::NodeProposal>& proposals,
                                                  const std::string& version, const std::string& generated);

} // namespace resonance::linking
