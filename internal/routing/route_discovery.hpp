#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "resonance/graph/v1/link.pb.h"

namespace resonance::routing {

struct RouteResult {
  std::vector<std::vector<std::string>> routes;
  uint32_t                              depth{0};
  double                                discovery_time_ms{0};
  bool                                  cached{false};
};

struct RouteOptions {
  uint32_t max_depth{3};
  uint32_t max_routes{5};
};

/*
  Replacement routes around failed nodes of the link-map graph.

  Routes start at `target`, the surviving end of the broken edge. Its
  live successors are returned at depth 1 without searching. When none
  is left, a depth-bounded BFS over links in either direction collects
  paths ending at any node that still links onward (dead ends are walked
  through but never returned).

  Failed nodes never appear in a route. Results are cached per
  (failed, target, depth) until the failed set changes.
*/
class RouteDiscovery {
 public:
  RouteDiscovery(const resonance::graph::v1::LinkMap& link_map, RouteOptions options);

  // Registers the failed set; a different set invalidates the cache.
  void SetFailed(const std::unordered_set<std::string>& failed);

  RouteResult FindAlternativeRoutes(const std::string& failed, const std::string& target);
  RouteResult FindAlternativeRoutes(const std::string& failed, const std::string& target, uint32_t max_depth);

  // Reroutes every recommendation edge touching a failed node.
  resonance::graph::v1::SelfHealReport SelfHeal(const std::vector<std::string>& failed_ids,
                                                std::chrono::milliseconds        budget);

  const std::vector<std::string>& Successors(const std::string& node) const;
  const std::vector<std::string>& Predecessors(const std::string& node) const;

  size_t cache_size() const {
    return cache_.size();
  }

  const RouteOptions& options() const {
    return options_;
  }

 private:
  using Adjacency = std::unordered_map<std::string, std::vector<std::string>>;

  RouteResult Search(const std::string& failed, const std::string& target, uint32_t max_depth) const;

  bool IsFailed(const std::string& node, const std::string& failed) const;

  static void AddEdge(Adjacency* adjacency, const std::string& from, const std::string& to);
  static const std::vector<std::string>& Neighbors(const Adjacency& adjacency, const std::string& node);

  resonance::graph::v1::LinkMap link_map_;
  RouteOptions                  options_;

  Adjacency successors_;
  Adjacency predecessors_;

  std::unordered_set<std::string>              failed_;
  std::unordered_map<std::string, RouteResult> cache_;
};

resonance::graph::v1::LinkMap LoadLinkMap(const std::string& path);

} // namespace resonance::routing
