#include "NavGraph/io/route_facts.hpp"
#include "NavGraph/core/logger.hpp"
#include "json_detail.hpp"

namespace NavGraph::io {

namespace {

Result<graph::RouteNode> parseRoute(const nlohmann::json& item, const std::string& context) {
  if (!item.is_object()) {
    return Result<graph::RouteNode>::error(context + ": route must be an object");
  }

  auto path = detail::requireString(item, "path", context);
  if (path.isError()) {
    return Result<graph::RouteNode>::error(path.error());
  }
  auto sourceRef = detail::optionalString(item, "sourceRef", context);
  if (sourceRef.isError()) {
    return Result<graph::RouteNode>::error(sourceRef.error());
  }
  auto kindName = detail::optionalString(item, "kind", context, "static");
  if (kindName.isError()) {
    return Result<graph::RouteNode>::error(kindName.error());
  }
  auto kind = graph::stringToRouteKind(kindName.value());
  if (!kind) {
    return Result<graph::RouteNode>::error(context + ": unknown route kind '" +
                                           kindName.value() + "' (expected static or dynamic)");
  }

  graph::RouteNode node;
  node.path = std::move(path).value();
  node.sourceRef = std::move(sourceRef).value();
  node.kind = *kind;
  return Result<graph::RouteNode>::ok(std::move(node));
}

Result<graph::LinkEdge> parseLink(const nlohmann::json& item, const std::string& context) {
  if (!item.is_object()) {
    return Result<graph::LinkEdge>::error(context + ": link must be an object");
  }

  auto from = detail::requireString(item, "from", context);
  if (from.isError()) {
    return Result<graph::LinkEdge>::error(from.error());
  }
  auto to = detail::requireString(item, "to", context);
  if (to.isError()) {
    return Result<graph::LinkEdge>::error(to.error());
  }
  auto kindName = detail::optionalString(item, "kind", context, "navigational");
  if (kindName.isError()) {
    return Result<graph::LinkEdge>::error(kindName.error());
  }
  auto kind = graph::stringToLinkKind(kindName.value());
  if (!kind) {
    return Result<graph::LinkEdge>::error(context + ": unknown link kind '" + kindName.value() +
                                          "' (expected navigational or programmatic)");
  }

  graph::LinkEdge edge;
  edge.from = std::move(from).value();
  edge.to = std::move(to).value();
  edge.kind = *kind;
  return Result<graph::LinkEdge>::ok(std::move(edge));
}

} // namespace

Result<RouteFacts> RouteFactsLoader::loadFromFile(const std::string& path) {
  auto content = detail::readFileToString(path);
  if (content.isError()) {
    return Result<RouteFacts>::error(content.error());
  }
  auto facts = parseFromString(content.value());
  if (facts.isError()) {
    return Result<RouteFacts>::error(path + ": " + facts.error());
  }
  NAVGRAPH_LOG_DEBUG("Loaded {} routes and {} links from {}", facts.value().routes.size(),
                     facts.value().links.size(), path);
  return facts;
}

Result<RouteFacts> RouteFactsLoader::parseFromString(const std::string& json) {
  auto docResult = detail::parseDocument(json);
  if (docResult.isError()) {
    return Result<RouteFacts>::error(docResult.error());
  }
  const nlohmann::json& doc = docResult.value();

  RouteFacts facts;

  auto routes = doc.find("routes");
  if (routes == doc.end() || !routes->is_array()) {
    return Result<RouteFacts>::error("'routes' must be an array");
  }
  facts.routes.reserve(routes->size());
  for (size_t i = 0; i < routes->size(); ++i) {
    auto node = parseRoute((*routes)[i], "routes[" + std::to_string(i) + "]");
    if (node.isError()) {
      return Result<RouteFacts>::error(node.error());
    }
    facts.routes.push_back(std::move(node).value());
  }

  // A route set without links is legal: every non-entry route is an orphan
  auto links = doc.find("links");
  if (links != doc.end() && !links->is_null()) {
    if (!links->is_array()) {
      return Result<RouteFacts>::error("'links' must be an array");
    }
    facts.links.reserve(links->size());
    for (size_t i = 0; i < links->size(); ++i) {
      auto edge = parseLink((*links)[i], "links[" + std::to_string(i) + "]");
      if (edge.isError()) {
        return Result<RouteFacts>::error(edge.error());
      }
      facts.links.push_back(std::move(edge).value());
    }
  }

  auto entryPoints = detail::optionalPathSet(doc, "entryPoints");
  if (entryPoints.isError()) {
    return Result<RouteFacts>::error(entryPoints.error());
  }
  facts.entryPoints = std::move(entryPoints).value();

  auto terminals = detail::optionalPathSet(doc, "allowedTerminals");
  if (terminals.isError()) {
    return Result<RouteFacts>::error(terminals.error());
  }
  facts.allowedTerminals = std::move(terminals).value();

  return Result<RouteFacts>::ok(std::move(facts));
}

} // namespace NavGraph::io
