#pragma once

/**
 * @file route_facts.hpp
 * @brief Loader for extracted route/link facts
 *
 * Expected document:
 * @code
 * {
 *   "routes": [ { "path": "/", "sourceRef": "app/page.tsx", "kind": "static" } ],
 *   "links":  [ { "from": "/", "to": "/login", "kind": "navigational" } ],
 *   "entryPoints": ["/"],                       // optional
 *   "allowedTerminals": ["/logout", "/404"]     // optional
 * }
 * @endcode
 * "sourceRef" and both "kind" fields are optional (defaults: "", static,
 * navigational).
 */

#include "NavGraph/analysis/reachability_analyzer.hpp"
#include "NavGraph/core/result.hpp"
#include "NavGraph/graph/route_graph.hpp"
#include <optional>
#include <string>
#include <vector>

namespace NavGraph::io {

struct RouteFacts {
  std::vector<graph::RouteNode> routes;
  std::vector<graph::LinkEdge> links;
  std::optional<analysis::EntryPointSet> entryPoints;
  std::optional<analysis::AllowedTerminalSet> allowedTerminals;
};

class RouteFactsLoader {
public:
  [[nodiscard]] static Result<RouteFacts> loadFromFile(const std::string& path);
  [[nodiscard]] static Result<RouteFacts> parseFromString(const std::string& json);
};

} // namespace NavGraph::io
