/**
 * @file test_reachability_analyzer.cpp
 * @brief Tests for orphan / dead-end classification
 */

#include "NavGraph/analysis/reachability_analyzer.hpp"
#include "NavGraph/graph/graph_builder.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <set>

using namespace NavGraph;
using namespace NavGraph::analysis;
using namespace NavGraph::graph;

namespace {

using Paths = std::vector<std::string>;

RouteGraph buildGraph(const Paths& paths,
                      const std::vector<std::pair<std::string, std::string>>& links) {
  std::vector<RouteNode> nodes;
  for (const auto& path : paths) {
    nodes.push_back({path, "", RouteKind::Static});
  }
  std::vector<LinkEdge> edges;
  for (const auto& [from, to] : links) {
    edges.push_back({from, to, LinkKind::Navigational});
  }
  GraphBuilder builder;
  auto result = builder.build(nodes, edges);
  REQUIRE(result.isOk());
  return std::move(result).value();
}

void checkPartition(const RouteGraph& graph, const ReachabilityResult& result) {
  std::multiset<std::string> all;
  all.insert(result.reachable.begin(), result.reachable.end());
  all.insert(result.orphans.begin(), result.orphans.end());
  all.insert(result.deadEnds.begin(), result.deadEnds.end());

  const Paths nodes = graph.nodePaths();
  CHECK(all.size() == nodes.size());
  CHECK(std::set<std::string>(all.begin(), all.end()) ==
        std::set<std::string>(nodes.begin(), nodes.end()));
}

} // namespace

TEST_CASE("Reachability - linear graph without terminals", "[reachability]") {
  // "/" -> "/login" -> "/dashboard"
  RouteGraph graph =
      buildGraph({"/", "/login", "/dashboard"}, {{"/", "/login"}, {"/login", "/dashboard"}});

  ReachabilityAnalyzer analyzer;
  auto result = analyzer.analyze(graph, {"/"}, {});
  REQUIRE(result.isOk());

  CHECK(result.value().reached == Paths{"/", "/dashboard", "/login"});
  CHECK(result.value().orphans.empty());
  CHECK(result.value().deadEnds == Paths{"/dashboard"});
  CHECK(result.value().reachable == Paths{"/", "/login"});
  checkPartition(graph, result.value());
}

TEST_CASE("Reachability - allowed terminal is not a dead end", "[reachability]") {
  RouteGraph graph =
      buildGraph({"/", "/login", "/dashboard"}, {{"/", "/login"}, {"/login", "/dashboard"}});

  ReachabilityAnalyzer analyzer;
  auto result = analyzer.analyze(graph, {"/"}, {"/dashboard"});
  REQUIRE(result.isOk());

  CHECK(result.value().deadEnds.empty());
  CHECK(result.value().reachable == Paths{"/", "/dashboard", "/login"});
  checkPartition(graph, result.value());
}

TEST_CASE("Reachability - isolated route is an orphan", "[reachability]") {
  RouteGraph graph = buildGraph({"/", "/login", "/dashboard", "/legacy"},
                                {{"/", "/login"}, {"/login", "/dashboard"}});

  ReachabilityAnalyzer analyzer;
  auto result = analyzer.analyze(graph, {"/"}, {});
  REQUIRE(result.isOk());

  CHECK(result.value().orphans == Paths{"/legacy"});
  // Orphans are never reported again as dead ends
  CHECK(result.value().deadEnds == Paths{"/dashboard"});
  CHECK(result.value().isOrphan("/legacy"));
  CHECK_FALSE(result.value().isOrphan("/login"));
  checkPartition(graph, result.value());
}

TEST_CASE("Reachability - outbound links do not rescue an orphan", "[reachability]") {
  RouteGraph graph = buildGraph({"/", "/about", "/old-promo"},
                                {{"/", "/about"}, {"/about", "/"}, {"/old-promo", "/about"}});

  ReachabilityAnalyzer analyzer;
  auto result = analyzer.analyze(graph, {"/"}, {});
  REQUIRE(result.isOk());

  CHECK(result.value().orphans == Paths{"/old-promo"});
  CHECK(result.value().deadEnds.empty());
}

TEST_CASE("Reachability - cycles terminate", "[reachability]") {
  RouteGraph graph =
      buildGraph({"/", "/a", "/b", "/c"},
                 {{"/", "/a"}, {"/a", "/b"}, {"/b", "/a"}, {"/b", "/b"}, {"/c", "/c"}});

  ReachabilityAnalyzer analyzer;
  auto result = analyzer.analyze(graph, {"/"}, {});
  REQUIRE(result.isOk());

  CHECK(result.value().reachable == Paths{"/", "/a", "/b"});
  CHECK(result.value().orphans == Paths{"/c"});
  CHECK(result.value().deadEnds.empty());
}

TEST_CASE("Reachability - multiple entry points traverse as one", "[reachability]") {
  RouteGraph graph = buildGraph({"/", "/admin", "/admin/users", "/help"},
                                {{"/admin", "/admin/users"}, {"/", "/help"}});

  ReachabilityAnalyzer analyzer;
  auto result = analyzer.analyze(graph, {"/", "/admin"}, {"/help", "/admin/users"});
  REQUIRE(result.isOk());

  CHECK(result.value().orphans.empty());
  CHECK(result.value().deadEnds.empty());
  CHECK(result.value().reachable.size() == 4);
}

TEST_CASE("Reachability - long chains do not exhaust the stack", "[reachability]") {
  Paths paths;
  std::vector<std::pair<std::string, std::string>> links;
  constexpr int kLength = 100000;
  for (int i = 0; i < kLength; ++i) {
    paths.push_back("/step/" + std::to_string(i));
    if (i > 0) {
      links.emplace_back("/step/" + std::to_string(i - 1), "/step/" + std::to_string(i));
    }
  }
  RouteGraph graph = buildGraph(paths, links);

  ReachabilityAnalyzer analyzer;
  auto result = analyzer.analyze(graph, {"/step/0"}, {});
  REQUIRE(result.isOk());
  CHECK(result.value().orphans.empty());
  CHECK(result.value().deadEnds == Paths{"/step/" + std::to_string(kLength - 1)});
}

TEST_CASE("Reachability - linking an orphan from a reachable route", "[reachability]") {
  const Paths paths = {"/", "/about", "/legacy"};
  ReachabilityAnalyzer analyzer;

  RouteGraph before = buildGraph(paths, {{"/", "/about"}, {"/about", "/"}});
  auto first = analyzer.analyze(before, {"/"}, {});
  REQUIRE(first.isOk());
  CHECK(first.value().orphans == Paths{"/legacy"});

  SECTION("Route with outbound links becomes reachable") {
    RouteGraph after = buildGraph(
        paths, {{"/", "/about"}, {"/about", "/"}, {"/about", "/legacy"}, {"/legacy", "/"}});
    auto second = analyzer.analyze(after, {"/"}, {});
    REQUIRE(second.isOk());
    CHECK(second.value().orphans.empty());
    CHECK(std::find(second.value().reachable.begin(), second.value().reachable.end(),
                    "/legacy") != second.value().reachable.end());
  }

  SECTION("Route without outbound links becomes a dead end") {
    RouteGraph after =
        buildGraph(paths, {{"/", "/about"}, {"/about", "/"}, {"/about", "/legacy"}});
    auto second = analyzer.analyze(after, {"/"}, {});
    REQUIRE(second.isOk());
    CHECK(second.value().orphans.empty());
    CHECK(second.value().deadEnds == Paths{"/legacy"});
  }
}

TEST_CASE("Reachability - entry point errors", "[reachability][errors]") {
  RouteGraph graph = buildGraph({"/", "/home"}, {{"/", "/home"}});
  ReachabilityAnalyzer analyzer;

  SECTION("Empty entry set is a configuration error") {
    auto result = analyzer.analyze(graph, {}, {});
    REQUIRE(result.isError());
    CHECK(result.error().code == GraphErrorCode::EmptyEntryPointSet);
    CHECK(result.error().isConfigurationError());
  }

  SECTION("Unknown entry point names the typo") {
    auto result = analyzer.analyze(graph, {"/", "/hom"}, {});
    REQUIRE(result.isError());
    CHECK(result.error().code == GraphErrorCode::UnknownEntryPoint);
    CHECK(result.error().subject == "/hom");
    CHECK(result.error().suggestions == Paths{"/home"});
    CHECK(result.error().format().find("did you mean '/home'") != std::string::npos);
  }
}

TEST_CASE("Reachability - unknown allowed terminals are ignored", "[reachability]") {
  RouteGraph graph = buildGraph({"/", "/end"}, {{"/", "/end"}});
  ReachabilityAnalyzer analyzer;

  auto result = analyzer.analyze(graph, {"/"}, {"/logout", "/404"});
  REQUIRE(result.isOk());
  CHECK(result.value().deadEnds == Paths{"/end"});
}

TEST_CASE("Reachability - expired deadline aborts traversal", "[reachability][errors]") {
  RouteGraph graph = buildGraph({"/", "/a"}, {{"/", "/a"}});
  ReachabilityAnalyzer analyzer;

  SECTION("Deadline in the past") {
    analyzer.setDeadline(
        AnalysisDeadline::at(AnalysisDeadline::Clock::now() - std::chrono::seconds(1)));
    auto result = analyzer.analyze(graph, {"/"}, {});
    REQUIRE(result.isError());
    CHECK(result.error().code == GraphErrorCode::AnalysisTimeout);
    CHECK(result.error().category() == GraphErrorCategory::Timeout);
  }

  SECTION("Generous deadline completes") {
    analyzer.setDeadline(AnalysisDeadline::after(std::chrono::minutes(5)));
    auto result = analyzer.analyze(graph, {"/"}, {});
    REQUIRE(result.isOk());
  }

  SECTION("Budget beyond the clock range never expires") {
    AnalysisDeadline unlimited = AnalysisDeadline::after(std::chrono::milliseconds::max());
    CHECK_FALSE(unlimited.isSet());
    CHECK_FALSE(unlimited.expired());

    // Roughly 317 years: representable in milliseconds, not in clock ticks
    CHECK_FALSE(AnalysisDeadline::after(std::chrono::milliseconds(10000000000000LL)).expired());

    analyzer.setDeadline(unlimited);
    auto result = analyzer.analyze(graph, {"/"}, {});
    REQUIRE(result.isOk());
    CHECK(result.value().deadEnds == Paths{"/a"});
  }

  SECTION("Default deadline never expires") {
    AnalysisDeadline none;
    CHECK_FALSE(none.isSet());
    CHECK_FALSE(none.expired());
  }
}

TEST_CASE("Reachability - repeated runs are identical", "[reachability]") {
  RouteGraph graph = buildGraph({"/", "/b", "/a", "/z", "/orphan"},
                                {{"/", "/z"}, {"/", "/a"}, {"/a", "/b"}, {"/z", "/"}});
  ReachabilityAnalyzer analyzer;

  auto first = analyzer.analyze(graph, {"/"}, {});
  auto second = analyzer.analyze(graph, {"/"}, {});
  REQUIRE(first.isOk());
  REQUIRE(second.isOk());
  CHECK(first.value().reachable == second.value().reachable);
  CHECK(first.value().orphans == second.value().orphans);
  CHECK(first.value().deadEnds == second.value().deadEnds);
  CHECK(std::is_sorted(first.value().reachable.begin(), first.value().reachable.end()));
}
