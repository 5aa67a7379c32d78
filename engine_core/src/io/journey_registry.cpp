#include "NavGraph/io/journey_registry.hpp"
#include "NavGraph/core/logger.hpp"
#include "json_detail.hpp"

#include <unordered_set>

namespace NavGraph::io {

namespace {

Result<std::vector<std::string>> parseSteps(const nlohmann::json& steps,
                                            const std::string& context) {
  if (!steps.is_array()) {
    return Result<std::vector<std::string>>::error(context + ": 'steps' must be an array");
  }
  if (steps.size() < 2) {
    return Result<std::vector<std::string>>::error(
        context + ": a journey needs at least two steps (has " + std::to_string(steps.size()) +
        ")");
  }

  std::vector<std::string> result;
  result.reserve(steps.size());
  for (size_t i = 0; i < steps.size(); ++i) {
    if (!steps[i].is_string() || steps[i].get<std::string>().empty()) {
      return Result<std::vector<std::string>>::error(
          context + ": steps[" + std::to_string(i) + "] must be a non-empty string");
    }
    result.push_back(steps[i].get<std::string>());
  }
  return Result<std::vector<std::string>>::ok(std::move(result));
}

Result<analysis::Journey> parseJourneyEntry(const nlohmann::json& item,
                                            const std::string& context) {
  if (!item.is_object()) {
    return Result<analysis::Journey>::error(context + ": journey must be an object");
  }
  auto name = detail::requireString(item, "name", context);
  if (name.isError()) {
    return Result<analysis::Journey>::error(name.error());
  }
  auto steps = item.find("steps");
  if (steps == item.end()) {
    return Result<analysis::Journey>::error(context + ": missing required field 'steps'");
  }
  auto parsed = parseSteps(*steps, context);
  if (parsed.isError()) {
    return Result<analysis::Journey>::error(parsed.error());
  }
  return Result<analysis::Journey>::ok({std::move(name).value(), std::move(parsed).value()});
}

} // namespace

Result<JourneyRegistry> JourneyRegistryLoader::loadFromFile(const std::string& path) {
  auto content = detail::readFileToString(path);
  if (content.isError()) {
    return Result<JourneyRegistry>::error(content.error());
  }
  auto registry = parseFromString(content.value());
  if (registry.isError()) {
    return Result<JourneyRegistry>::error(path + ": " + registry.error());
  }
  NAVGRAPH_LOG_DEBUG("Loaded {} journeys from {}", registry.value().journeys.size(), path);
  return registry;
}

Result<JourneyRegistry> JourneyRegistryLoader::parseFromString(const std::string& json) {
  auto docResult = detail::parseDocument(json);
  if (docResult.isError()) {
    return Result<JourneyRegistry>::error(docResult.error());
  }
  const nlohmann::json& doc = docResult.value();

  JourneyRegistry registry;

  auto journeys = doc.find("journeys");
  if (journeys != doc.end() && !journeys->is_null()) {
    if (journeys->is_array()) {
      for (size_t i = 0; i < journeys->size(); ++i) {
        auto journey = parseJourneyEntry((*journeys)[i], "journeys[" + std::to_string(i) + "]");
        if (journey.isError()) {
          return Result<JourneyRegistry>::error(journey.error());
        }
        registry.journeys.push_back(std::move(journey).value());
      }
    } else if (journeys->is_object()) {
      // nlohmann::json orders object keys, so this form loads name-sorted
      for (const auto& [name, steps] : journeys->items()) {
        if (name.empty()) {
          return Result<JourneyRegistry>::error("journeys: journey names must not be empty");
        }
        auto parsed = parseSteps(steps, "journeys." + name);
        if (parsed.isError()) {
          return Result<JourneyRegistry>::error(parsed.error());
        }
        registry.journeys.push_back({name, std::move(parsed).value()});
      }
    } else {
      return Result<JourneyRegistry>::error("'journeys' must be an array or an object");
    }
  }

  std::unordered_set<std::string> names;
  for (const auto& journey : registry.journeys) {
    if (!names.insert(journey.name).second) {
      return Result<JourneyRegistry>::error("Duplicate journey name '" + journey.name + "'");
    }
  }

  auto entryPoints = detail::optionalPathSet(doc, "entryPoints");
  if (entryPoints.isError()) {
    return Result<JourneyRegistry>::error(entryPoints.error());
  }
  registry.entryPoints = std::move(entryPoints).value();

  auto terminals = detail::optionalPathSet(doc, "allowedTerminals");
  if (terminals.isError()) {
    return Result<JourneyRegistry>::error(terminals.error());
  }
  registry.allowedTerminals = std::move(terminals).value();

  return Result<JourneyRegistry>::ok(std::move(registry));
}

} // namespace NavGraph::io
