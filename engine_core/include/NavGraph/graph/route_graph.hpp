#pragma once

/**
 * @file route_graph.hpp
 * @brief Immutable directed graph of routes (nodes) and links (edges)
 *
 * A RouteGraph can only be produced by GraphBuilder. Once built it exposes
 * const queries only, so every later pipeline stage reads the same facts.
 */

#include "NavGraph/core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace NavGraph::graph {

/**
 * @brief Route flavour. Dynamic routes carry parameter slots
 * (e.g. "/products/:id") but are ordinary nodes for graph purposes.
 */
enum class RouteKind : u8 { Static, Dynamic };

/**
 * @brief Link flavour. Informational only; all kinds count equally.
 */
enum class LinkKind : u8 { Navigational, Programmatic };

[[nodiscard]] const char* routeKindToString(RouteKind kind);
[[nodiscard]] std::optional<RouteKind> stringToRouteKind(std::string_view name);
[[nodiscard]] const char* linkKindToString(LinkKind kind);
[[nodiscard]] std::optional<LinkKind> stringToLinkKind(std::string_view name);

/**
 * @brief A declared page or endpoint
 */
struct RouteNode {
  std::string path;
  std::string sourceRef; // where the route was declared; carried for reporting only
  RouteKind kind = RouteKind::Static;
};

/**
 * @brief A directed navigational connection
 */
struct LinkEdge {
  std::string from;
  std::string to;
  LinkKind kind = LinkKind::Navigational;

  bool operator==(const LinkEdge& other) const = default;
};

class RouteGraph {
public:
  RouteGraph() = default;

  [[nodiscard]] bool hasNode(const std::string& path) const;
  [[nodiscard]] const RouteNode* findNode(const std::string& path) const;

  /**
   * @brief Distinct successors of @p path; empty for unknown paths
   */
  [[nodiscard]] const std::vector<std::string>& successors(const std::string& path) const;

  /**
   * @brief Distinct predecessors of @p path; empty for unknown paths
   */
  [[nodiscard]] const std::vector<std::string>& predecessors(const std::string& path) const;

  /**
   * @brief Whether a link from -> to exists (direction matters)
   */
  [[nodiscard]] bool hasEdge(const std::string& from, const std::string& to) const;

  [[nodiscard]] size_t outDegree(const std::string& path) const {
    return successors(path).size();
  }
  [[nodiscard]] size_t inDegree(const std::string& path) const {
    return predecessors(path).size();
  }

  [[nodiscard]] const std::vector<RouteNode>& nodes() const { return m_nodes; }
  [[nodiscard]] const std::vector<LinkEdge>& edges() const { return m_edges; }

  /**
   * @brief All route paths, sorted
   */
  [[nodiscard]] std::vector<std::string> nodePaths() const;

  [[nodiscard]] size_t nodeCount() const { return m_nodes.size(); }
  [[nodiscard]] size_t edgeCount() const { return m_edges.size(); }

private:
  friend class GraphBuilder;

  [[nodiscard]] static std::string edgeKey(const std::string& from, const std::string& to);

  std::vector<RouteNode> m_nodes;
  std::unordered_map<std::string, size_t> m_nodeIndex;
  std::vector<LinkEdge> m_edges;

  // Built once by GraphBuilder; each successor/predecessor listed once
  std::unordered_map<std::string, std::vector<std::string>> m_forward;
  std::unordered_map<std::string, std::vector<std::string>> m_reverse;
  std::unordered_set<std::string> m_edgeKeys;
};

} // namespace NavGraph::graph
