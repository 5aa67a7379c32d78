#pragma once

/**
 * @file reachability_analyzer.hpp
 * @brief Classifies every route as reachable, orphaned or a dead end
 *
 * - Orphan: not reachable from any entry point
 * - Dead end: reachable, no outbound links, not an allowed terminal
 * - Reachable: everything else
 *
 * The three sets partition the graph's routes.
 */

#include "NavGraph/analysis/analysis_deadline.hpp"
#include "NavGraph/core/result.hpp"
#include "NavGraph/graph/graph_error.hpp"
#include "NavGraph/graph/route_graph.hpp"
#include <set>
#include <string>
#include <vector>

namespace NavGraph::analysis {

/**
 * @brief Traversal roots; must be non-empty and name known routes
 */
using EntryPointSet = std::set<std::string>;

/**
 * @brief Routes allowed to have no outbound links (logout, error pages)
 */
using AllowedTerminalSet = std::set<std::string>;

/**
 * @brief Classification of every route; each list is sorted
 */
struct ReachabilityResult {
  std::vector<std::string> reached; // visited by traversal: reachable + deadEnds
  std::vector<std::string> reachable;
  std::vector<std::string> orphans;
  std::vector<std::string> deadEnds;

  [[nodiscard]] bool isOrphan(const std::string& path) const;
  [[nodiscard]] bool isDeadEnd(const std::string& path) const;
};

class ReachabilityAnalyzer {
public:
  ReachabilityAnalyzer() = default;

  /**
   * @brief Abort traversal with AnalysisTimeout once @p deadline expires
   */
  void setDeadline(AnalysisDeadline deadline) { m_deadline = deadline; }

  /**
   * @brief Traverse from all entry points at once and classify every route
   * @return The classification, or EmptyEntryPointSet / UnknownEntryPoint /
   *         AnalysisTimeout
   */
  [[nodiscard]] Result<ReachabilityResult, graph::GraphError>
  analyze(const graph::RouteGraph& graph, const EntryPointSet& entryPoints,
          const AllowedTerminalSet& terminals) const;

private:
  [[nodiscard]] Result<void, graph::GraphError>
  validateEntryPoints(const graph::RouteGraph& graph, const EntryPointSet& entryPoints) const;

  AnalysisDeadline m_deadline;
};

} // namespace NavGraph::analysis
