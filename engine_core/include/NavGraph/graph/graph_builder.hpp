#pragma once

/**
 * @file graph_builder.hpp
 * @brief Assembles a RouteGraph from extracted route and link facts
 */

#include "NavGraph/core/result.hpp"
#include "NavGraph/graph/graph_error.hpp"
#include "NavGraph/graph/route_graph.hpp"
#include <vector>

namespace NavGraph::graph {

/**
 * @brief Builds an immutable RouteGraph
 *
 * Rejects duplicate route paths (DuplicateNode) and links whose endpoint is
 * not a declared route (DanglingEdge). Exact duplicate links (same from, to
 * and kind) are dropped silently since independent extractions of the same
 * link are expected. Forward and reverse adjacency are built in one pass.
 *
 * Example usage:
 * @code
 * GraphBuilder builder;
 * auto graph = builder.build(routes, links);
 * if (graph.isError()) {
 *     NAVGRAPH_LOG_ERROR(graph.error().format());
 * }
 * @endcode
 */
class GraphBuilder {
public:
  GraphBuilder() = default;

  [[nodiscard]] Result<RouteGraph, GraphError> build(const std::vector<RouteNode>& nodes,
                                                     const std::vector<LinkEdge>& edges);

  /**
   * @brief Number of exact duplicate links dropped by the last build()
   */
  [[nodiscard]] size_t duplicateEdgeCount() const { return m_duplicateEdges; }

private:
  size_t m_duplicateEdges = 0;
};

} // namespace NavGraph::graph
