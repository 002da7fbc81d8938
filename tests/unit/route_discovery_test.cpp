#include "internal/routing/route_discovery.hpp"

#include <cassert>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"
#include "support/temp_dir.hpp"

namespace {

using resonance::graph::v1::LinkMap;
using resonance::routing::RouteDiscovery;
using resonance::routing::RouteOptions;
using Route = std::vector<std::string>;

LinkMap MakeLinkMap(std::initializer_list<std::pair<std::string, std::vector<std::string>>> edges) {
  LinkMap map;
  map.set_version("1.0");
  for (const auto& [from, targets] : edges) {
    auto* recommendation = map.add_recommendations();
    recommendation->set_from(from);
    for (const auto& to : targets) recommendation->add_to(to);
  }
  return map;
}

// s -> f -> g, and s -> p -> q -> g
LinkMap DetourGraph() {
  return MakeLinkMap({{"s", {"f", "p"}}, {"p", {"q"}}, {"q", {"g"}}, {"f", {"g"}}});
}

void TestDirectSiblingHubsAreReturnedWithoutSearch() {
  RouteDiscovery discovery(MakeLinkMap({{"n1", {"h1", "h2", "h3"}}, {"n2", {"h1", "h2", "h3"}}}), RouteOptions{});
  discovery.SetFailed({"h1"});

  auto result = discovery.FindAlternativeRoutes("h1", "n1");
  assert(result.depth == 1);
  assert((result.routes == std::vector<Route>{{"n1", "h2"}, {"n1", "h3"}}));
  assert(!result.cached);
}

void TestFailedHubInClusterFallsBackToSiblings() {
  RouteDiscovery discovery(MakeLinkMap({{"x", {"h1", "h2", "h3", "h4", "h5"}}}), RouteOptions{});
  discovery.SetFailed({"h1"});

  auto result = discovery.FindAlternativeRoutes("h1", "x");
  assert(result.depth == 1);
  assert((result.routes == std::vector<Route>{{"x", "h2"}, {"x", "h3"}, {"x", "h4"}, {"x", "h5"}}));
}

void TestFailedSourceRoutesStartAtSurvivingTarget() {
  RouteDiscovery discovery(MakeLinkMap({{"a", {"b"}}, {"b", {"c"}}}), RouteOptions{});
  discovery.SetFailed({"a"});

  auto result = discovery.FindAlternativeRoutes("a", "b");
  assert(result.depth == 1);
  assert((result.routes == std::vector<Route>{{"b", "c"}}));

  auto report = discovery.SelfHeal({"a"}, std::chrono::milliseconds(1000));
  assert(report.routes_size() == 1);
  assert(report.routes(0).failed() == "a");
  assert(report.rerouted() == 1);
  assert(report.unresolved() == 0);
}

void TestSearchWalksLinksBothWaysWhenTargetIsStuck() {
  // s only links to the failed f; p links into s and onwards to q
  RouteDiscovery discovery(MakeLinkMap({{"s", {"f"}}, {"p", {"s", "q"}}, {"q", {"g"}}, {"f", {"g"}}}),
                           RouteOptions{});
  discovery.SetFailed({"f"});

  auto result = discovery.FindAlternativeRoutes("f", "s");
  assert(result.depth == 1);
  // g is reachable but has no onward links
  assert((result.routes == std::vector<Route>{{"s", "p"}, {"s", "p", "q"}}));

  auto shallow = discovery.FindAlternativeRoutes("f", "s", 1);
  assert((shallow.routes == std::vector<Route>{{"s", "p"}}));
}

void TestNoPathIsEmptyNotAnError() {
  RouteDiscovery discovery(MakeLinkMap({{"x", {"y"}}}), RouteOptions{});
  discovery.SetFailed({"y"});

  auto result = discovery.FindAlternativeRoutes("y", "x");
  assert(result.routes.empty());
  assert(result.depth == 0);

  auto zero_depth = discovery.FindAlternativeRoutes("y", "x", 0);
  assert(zero_depth.routes.empty());
}

void TestCacheIsInvalidatedWhenFailedSetChanges() {
  RouteDiscovery discovery(DetourGraph(), RouteOptions{});
  discovery.SetFailed({"f"});

  auto first = discovery.FindAlternativeRoutes("f", "s");
  assert((first.routes == std::vector<Route>{{"s", "p"}}));
  auto again = discovery.FindAlternativeRoutes("f", "s");
  assert(again.cached);
  assert(again.routes.size() == 1);
  assert(discovery.cache_size() == 1);

  // same set keeps the cache
  discovery.SetFailed({"f"});
  assert(discovery.cache_size() == 1);

  // with p failed as well s has nowhere left to go
  discovery.SetFailed({"f", "p"});
  assert(discovery.cache_size() == 0);
  auto blocked = discovery.FindAlternativeRoutes("f", "s");
  assert(!blocked.cached);
  assert(blocked.routes.empty());
}

void TestRouteCountIsBounded() {
  std::vector<std::string> hubs;
  for (int i = 0; i < 9; ++i) hubs.push_back("h" + std::to_string(i));
  std::vector<std::string> with_failed = hubs;
  with_failed.push_back("dead");

  RouteDiscovery discovery(MakeLinkMap({{"a", with_failed}, {"b", with_failed}}), RouteOptions{3, 5});
  discovery.SetFailed({"dead"});

  auto result = discovery.FindAlternativeRoutes("dead", "a");
  assert(result.routes.size() == 5);
  for (const auto& route : result.routes) {
    for (const auto& hop : route) assert(hop != "dead");
  }
}

void TestSelfHealReport() {
  RouteDiscovery discovery(MakeLinkMap({{"s", {"f", "p"}}, {"p", {"q"}}, {"q", {"g"}}, {"f", {"g"}}, {"x", {"y"}}}),
                           RouteOptions{});

  auto report = discovery.SelfHeal({"f", "y"}, std::chrono::milliseconds(50));

  assert(report.failed_size() == 2);
  assert(report.budget_ms() == 50.0);
  // s -> f, f -> g and x -> y touch a failed node
  assert(report.routes_size() == 3);
  assert(report.rerouted() == 2);
  assert(report.unresolved() == 1);

  for (const auto& entry : report.routes()) {
    if (entry.from() == "s") {
      assert(entry.failed() == "f");
      assert(entry.alternatives_size() == 1);
      assert(entry.alternatives(0).hops_size() == 2);
      assert(entry.alternatives(0).hops(1) == "p");
    }
    if (entry.from() == "f") {
      assert(entry.failed() == "f");
      assert(entry.alternatives_size() >= 1);
      assert(entry.alternatives(0).hops_size() == 2);
      assert(entry.alternatives(0).hops(0) == "g");
      assert(entry.alternatives(0).hops(1) == "q");
    }
    if (entry.to() == "y") {
      assert(entry.alternatives_size() == 0);
    }
  }

  auto late = discovery.SelfHeal({"f"}, std::chrono::milliseconds(0));
  assert(!late.within_budget());
}

void TestLoadLinkMap() {
  const auto dir  = resonance::testing::FreshDir("route_discovery", "load");
  const auto path = dir / "link-map.json";
  resonance::util::WriteJsonAtomic(path, DetourGraph());

  auto map = resonance::routing::LoadLinkMap(path.string());
  assert(map.recommendations_size() == 4);

  bool threw = false;
  try {
    (void)resonance::routing::LoadLinkMap((dir / "missing.json").string());
  } catch (const resonance::util::IOError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDirectSiblingHubsAreReturnedWithoutSearch();
  TestFailedHubInClusterFallsBackToSiblings();
  TestFailedSourceRoutesStartAtSurvivingTarget();
  TestSearchWalksLinksBothWaysWhenTargetIsStuck();
  TestNoPathIsEmptyNotAnError();
  TestCacheIsInvalidatedWhenFailedSetChanges();
  TestRouteCountIsBounded();
  TestSelfHealReport();
  TestLoadLinkMap();

  std::cout << "resonance_unit_route_discovery: pass\n";
  return 0;
}
