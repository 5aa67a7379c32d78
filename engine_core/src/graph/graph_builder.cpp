#include "NavGraph/graph/graph_builder.hpp"
#include "NavGraph/core/logger.hpp"

#include <unordered_set>

namespace NavGraph::graph {

namespace {

GraphError danglingEdgeError(const RouteGraph& graph, const LinkEdge& edge,
                             const std::string& missing) {
  GraphError error(GraphErrorCode::DanglingEdge, missing,
                   "Link '" + edge.from + "' -> '" + edge.to + "' (" +
                       linkKindToString(edge.kind) + ") references unknown route '" + missing +
                       "'");
  return error.withSuggestions(findSimilarStrings(missing, graph.nodePaths()));
}

} // namespace

Result<RouteGraph, GraphError> GraphBuilder::build(const std::vector<RouteNode>& nodes,
                                                   const std::vector<LinkEdge>& edges) {
  m_duplicateEdges = 0;

  RouteGraph graph;
  graph.m_nodes.reserve(nodes.size());
  graph.m_nodeIndex.reserve(nodes.size());

  for (const auto& node : nodes) {
    auto [it, inserted] = graph.m_nodeIndex.emplace(node.path, graph.m_nodes.size());
    if (!inserted) {
      const RouteNode& existing = graph.m_nodes[it->second];
      std::string message = "Route '" + node.path + "' is declared more than once";
      if (!existing.sourceRef.empty() || !node.sourceRef.empty()) {
        message += " (" + existing.sourceRef + ", " + node.sourceRef + ")";
      }
      return Result<RouteGraph, GraphError>::error(
          GraphError(GraphErrorCode::DuplicateNode, node.path, message));
    }
    graph.m_nodes.push_back(node);
  }

  // Dedup key includes the kind: (a, b, navigational) and (a, b, programmatic)
  // are distinct links but share one adjacency entry
  std::unordered_set<std::string> seenLinks;
  seenLinks.reserve(edges.size());
  graph.m_edges.reserve(edges.size());
  graph.m_edgeKeys.reserve(edges.size());

  for (const auto& edge : edges) {
    if (!graph.hasNode(edge.from)) {
      return Result<RouteGraph, GraphError>::error(danglingEdgeError(graph, edge, edge.from));
    }
    if (!graph.hasNode(edge.to)) {
      return Result<RouteGraph, GraphError>::error(danglingEdgeError(graph, edge, edge.to));
    }

    std::string key = RouteGraph::edgeKey(edge.from, edge.to);
    if (!seenLinks.insert(key + static_cast<char>('0' + static_cast<int>(edge.kind))).second) {
      ++m_duplicateEdges;
      continue;
    }
    graph.m_edges.push_back(edge);

    if (graph.m_edgeKeys.insert(std::move(key)).second) {
      graph.m_forward[edge.from].push_back(edge.to);
      graph.m_reverse[edge.to].push_back(edge.from);
    }
  }

  NAVGRAPH_LOG_DEBUG("Built route graph: {} routes, {} links ({} duplicate links dropped)",
                     graph.nodeCount(), graph.edgeCount(), m_duplicateEdges);

  return Result<RouteGraph, GraphError>::ok(std::move(graph));
}

} // namespace NavGraph::graph
