#include "NavGraph/analysis/reachability_analyzer.hpp"
#include "NavGraph/core/logger.hpp"

#include <algorithm>
#include <unordered_set>

namespace NavGraph::analysis {

using graph::GraphError;
using graph::GraphErrorCode;

bool ReachabilityResult::isOrphan(const std::string& path) const {
  return std::binary_search(orphans.begin(), orphans.end(), path);
}

bool ReachabilityResult::isDeadEnd(const std::string& path) const {
  return std::binary_search(deadEnds.begin(), deadEnds.end(), path);
}

Result<void, GraphError>
ReachabilityAnalyzer::validateEntryPoints(const graph::RouteGraph& graph,
                                          const EntryPointSet& entryPoints) const {
  if (entryPoints.empty()) {
    return Result<void, GraphError>::error(
        GraphError(GraphErrorCode::EmptyEntryPointSet, "",
                   "At least one entry point must be declared"));
  }

  for (const auto& entry : entryPoints) {
    if (!graph.hasNode(entry)) {
      GraphError error(GraphErrorCode::UnknownEntryPoint, entry,
                       "Entry point '" + entry + "' is not a declared route");
      return Result<void, GraphError>::error(
          error.withSuggestions(graph::findSimilarStrings(entry, graph.nodePaths())));
    }
  }
  return Result<void, GraphError>::ok();
}

Result<ReachabilityResult, GraphError>
ReachabilityAnalyzer::analyze(const graph::RouteGraph& graph, const EntryPointSet& entryPoints,
                              const AllowedTerminalSet& terminals) const {
  auto entryCheck = validateEntryPoints(graph, entryPoints);
  if (entryCheck.isError()) {
    return Result<ReachabilityResult, GraphError>::error(entryCheck.error());
  }

  for (const auto& terminal : terminals) {
    if (!graph.hasNode(terminal)) {
      NAVGRAPH_LOG_WARN("Allowed terminal '{}' is not a declared route; ignoring", terminal);
    }
  }

  // Iterative DFS from every entry point at once
  std::unordered_set<std::string> visited;
  visited.reserve(graph.nodeCount());
  std::vector<const std::string*> stack;
  stack.reserve(entryPoints.size());

  for (const auto& entry : entryPoints) {
    if (visited.insert(entry).second) {
      stack.push_back(&entry);
    }
  }

  while (!stack.empty()) {
    if (m_deadline.expired()) {
      return Result<ReachabilityResult, GraphError>::error(GraphError(
          GraphErrorCode::AnalysisTimeout, "",
          "Reachability traversal aborted after visiting " + std::to_string(visited.size()) +
              " of " + std::to_string(graph.nodeCount()) + " routes"));
    }

    const std::string* current = stack.back();
    stack.pop_back();

    for (const auto& next : graph.successors(*current)) {
      if (visited.insert(next).second) {
        stack.push_back(&next);
      }
    }
  }

  ReachabilityResult result;
  for (const auto& path : graph.nodePaths()) {
    if (visited.find(path) == visited.end()) {
      result.orphans.push_back(path);
      continue;
    }
    result.reached.push_back(path);
    if (graph.outDegree(path) == 0 && terminals.find(path) == terminals.end()) {
      result.deadEnds.push_back(path);
    } else {
      result.reachable.push_back(path);
    }
  }

  NAVGRAPH_LOG_DEBUG("Reachability: {} reachable, {} orphans, {} dead ends",
                     result.reachable.size(), result.orphans.size(), result.deadEnds.size());

  return Result<ReachabilityResult, GraphError>::ok(std::move(result));
}

} // namespace NavGraph::analysis
