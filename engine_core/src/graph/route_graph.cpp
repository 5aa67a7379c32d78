#include "NavGraph/graph/route_graph.hpp"

#include <algorithm>

namespace NavGraph::graph {

namespace {
const std::vector<std::string> kNoNeighbours;
} // namespace

const char* routeKindToString(RouteKind kind) {
  switch (kind) {
  case RouteKind::Static:
    return "static";
  case RouteKind::Dynamic:
    return "dynamic";
  }
  return "static";
}

std::optional<RouteKind> stringToRouteKind(std::string_view name) {
  if (name == "static")
    return RouteKind::Static;
  if (name == "dynamic")
    return RouteKind::Dynamic;
  return std::nullopt;
}

const char* linkKindToString(LinkKind kind) {
  switch (kind) {
  case LinkKind::Navigational:
    return "navigational";
  case LinkKind::Programmatic:
    return "programmatic";
  }
  return "navigational";
}

std::optional<LinkKind> stringToLinkKind(std::string_view name) {
  if (name == "navigational")
    return LinkKind::Navigational;
  if (name == "programmatic")
    return LinkKind::Programmatic;
  return std::nullopt;
}

bool RouteGraph::hasNode(const std::string& path) const {
  return m_nodeIndex.find(path) != m_nodeIndex.end();
}

const RouteNode* RouteGraph::findNode(const std::string& path) const {
  auto it = m_nodeIndex.find(path);
  if (it == m_nodeIndex.end()) {
    return nullptr;
  }
  return &m_nodes[it->second];
}

const std::vector<std::string>& RouteGraph::successors(const std::string& path) const {
  auto it = m_forward.find(path);
  return it != m_forward.end() ? it->second : kNoNeighbours;
}

const std::vector<std::string>& RouteGraph::predecessors(const std::string& path) const {
  auto it = m_reverse.find(path);
  return it != m_reverse.end() ? it->second : kNoNeighbours;
}

bool RouteGraph::hasEdge(const std::string& from, const std::string& to) const {
  return m_edgeKeys.find(edgeKey(from, to)) != m_edgeKeys.end();
}

std::vector<std::string> RouteGraph::nodePaths() const {
  std::vector<std::string> paths;
  paths.reserve(m_nodes.size());
  for (const auto& node : m_nodes) {
    paths.push_back(node.path);
  }
  std::sort(paths.begin(), paths.end());
  return paths;
}

std::string RouteGraph::edgeKey(const std::string& from, const std::string& to) {
  // Length prefix keeps the key unambiguous for any pair of paths
  std::string key = std::to_string(from.size());
  key.reserve(key.size() + from.size() + to.size() + 1);
  key.push_back(':');
  key.append(from);
  key.append(to);
  return key;
}

} // namespace NavGraph::graph
