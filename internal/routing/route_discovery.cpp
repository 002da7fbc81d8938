#include "route_discovery.hpp"

#include <algorithm>
#include <queue>

#include "internal/observability/logging.hpp"
#include "internal/util/json_file.hpp"

namespace resonance::routing {

using namespace resonance::graph::v1;
using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

const std::vector<std::string> kNoNeighbors;

double MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

RouteDiscovery::RouteDiscovery(const LinkMap& link_map, RouteOptions options)
    : link_map_(link_map), options_(options) {
  for (const auto& recommendation : link_map_.recommendations()) {
    for (const auto& to : recommendation.to()) {
      if (to == recommendation.from()) continue;
      AddEdge(&successors_, recommendation.from(), to);
      AddEdge(&predecessors_, to, recommendation.from());
    }
  }
}

void RouteDiscovery::AddEdge(Adjacency* adjacency, const std::string& from, const std::string& to) {
  auto& neighbors = (*adjacency)[from];
  if (std::find(neighbors.begin(), neighbors.end(), to) == neighbors.end()) {
    neighbors.push_back(to);
  }
}

const std::vector<std::string>& RouteDiscovery::Neighbors(const Adjacency& adjacency, const std::string& node) {
  auto it = adjacency.find(node);
  return it == adjacency.end() ? kNoNeighbors : it->second;
}

const std::vector<std::string>& RouteDiscovery::Successors(const std::string& node) const {
  return Neighbors(successors_, node);
}

const std::vector<std::string>& RouteDiscovery::Predecessors(const std::string& node) const {
  return Neighbors(predecessors_, node);
}

void RouteDiscovery::SetFailed(const std::unordered_set<std::string>& failed) {
  if (failed == failed_) {
    return;
  }
  failed_ = failed;
  cache_.clear();
}

bool RouteDiscovery::IsFailed(const std::string& node, const std::string& failed) const {
  return node == failed || failed_.count(node) > 0;
}

// ------------------------------------------------------------
// Search
// ------------------------------------------------------------

RouteResult RouteDiscovery::Search(const std::string& failed, const std::string& target, uint32_t max_depth) const {
  RouteResult result;
  if (max_depth == 0 || IsFailed(target, failed)) {
    return result;
  }

  // direct neighbors need no search
  for (const auto& next : Successors(target)) {
    if (result.routes.size() >= options_.max_routes) break;
    if (!IsFailed(next, failed)) {
      result.routes.push_back({target, next});
    }
  }
  if (!result.routes.empty()) {
    result.depth = 1;
    return result;
  }

  std::queue<std::pair<std::string, std::vector<std::string>>> q;
  std::unordered_set<std::string>                              visited{target, failed};

  q.emplace(target, std::vector<std::string>{target});

  while (!q.empty() && result.routes.size() < options_.max_routes) {
    auto [node, path] = q.front();
    q.pop();

    if (path.size() - 1 >= max_depth)
      continue;

    // the target has no live successor left, so the walk follows links both ways
    for (const auto* neighbors : {&Successors(node), &Predecessors(node)}) {
      for (const auto& next : *neighbors) {
        if (result.routes.size() >= options_.max_routes) break;

        if (IsFailed(next, failed))
          continue;

        if (!visited.insert(next).second)
          continue;

        auto extended = path;
        extended.push_back(next);

        // a dead end is no replacement, but the walk may continue past it
        if (!Successors(next).empty()) {
          result.routes.push_back(extended);
        }

        q.emplace(next, std::move(extended));
      }
    }
  }

  if (!result.routes.empty()) {
    result.depth = static_cast<uint32_t>(result.routes.front().size() - 1);
  }
  return result;
}

RouteResult RouteDiscovery::FindAlternativeRoutes(const std::string& failed, const std::string& target) {
  return FindAlternativeRoutes(failed, target, options_.max_depth);
}

RouteResult RouteDiscovery::FindAlternativeRoutes(const std::string& failed, const std::string& target,
                                                  uint32_t max_depth) {
  const auto key = failed + '\n' + target + '\n' + std::to_string(max_depth);

  if (auto it = cache_.find(key); it != cache_.end()) {
    auto hit   = it->second;
    hit.cached = true;
    return hit;
  }

  const auto start = std::chrono::steady_clock::now();

  RouteResult result       = Search(failed, target, max_depth);
  result.discovery_time_ms = MillisSince(start);

  cache_.emplace(key, result);
  return result;
}

// ------------------------------------------------------------
// Self-heal
// ------------------------------------------------------------

SelfHealReport RouteDiscovery::SelfHeal(const std::vector<std::string>& failed_ids, std::chrono::milliseconds budget) {
  const auto start = std::chrono::steady_clock::now();

  SetFailed(std::unordered_set<std::string>(failed_ids.begin(), failed_ids.end()));

  SelfHealReport report;
  for (const auto& id : failed_ids) report.add_failed(id);
  report.set_budget_ms(static_cast<double>(budget.count()));

  for (const auto& recommendation : link_map_.recommendations()) {
    const bool source_failed = failed_.count(recommendation.from()) > 0;

    for (const auto& to : recommendation.to()) {
      const bool target_failed = failed_.count(to) > 0;
      if (source_failed == target_failed) continue;

      auto* entry = report.add_routes();
      entry->set_from(recommendation.from());
      entry->set_to(to);

      RouteResult found;
      if (source_failed) {
        entry->set_failed(recommendation.from());
        found = FindAlternativeRoutes(recommendation.from(), to);
      } else {
        entry->set_failed(to);
        found = FindAlternativeRoutes(to, recommendation.from());
      }

      for (const auto& hops : found.routes) {
        auto* route = entry->add_alternatives();
        for (const auto& hop : hops) route->add_hops(hop);
      }
      entry->set_discovery_time_ms(found.discovery_time_ms);
      entry->set_cached(found.cached);

      if (found.routes.empty()) {
        report.set_unresolved(report.unresolved() + 1);
      } else {
        report.set_rerouted(report.rerouted() + 1);
      }
    }
  }

  report.set_total_time_ms(MillisSince(start));
  report.set_within_budget(report.total_time_ms() <= report.budget_ms());

  observability::Log(report.within_budget() ? spdlog::level::info : spdlog::level::warn, "Self-heal finished",
                     {IntField("failed", report.failed_size()), IntField("rerouted", report.rerouted()),
                      IntField("unresolved", report.unresolved()),
                      DoubleField("total_time_ms", report.total_time_ms()),
                      DoubleField("budget_ms", report.budget_ms()), BoolField("within_budget", report.within_budget())});
  return report;
}

LinkMap LoadLinkMap(const std::string& path) {
  LinkMap link_map;
  util::ReadJsonMessage(path, &link_map, /*ignore_unknown_fields=*/true);
  return link_map;
}

} // namespace resonance::routing
