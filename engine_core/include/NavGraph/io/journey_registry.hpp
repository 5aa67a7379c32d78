#pragma once

/**
 * @file journey_registry.hpp
 * @brief Loader for the declared journey registry
 *
 * Journeys may be given as a list or as a name -> steps object:
 * @code
 * { "journeys": [ { "name": "auth", "steps": ["/login", "/dashboard"] } ] }
 * { "journeys": { "auth": ["/login", "/dashboard"] } }
 * @endcode
 * The registry may also declare "entryPoints" and "allowedTerminals".
 * Journeys with fewer than two steps and duplicate names are rejected here,
 * so the validator only ever sees well-formed journeys.
 */

#include "NavGraph/analysis/journey_validator.hpp"
#include "NavGraph/analysis/reachability_analyzer.hpp"
#include "NavGraph/core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace NavGraph::io {

struct JourneyRegistry {
  std::vector<analysis::Journey> journeys;
  std::optional<analysis::EntryPointSet> entryPoints;
  std::optional<analysis::AllowedTerminalSet> allowedTerminals;
};

class JourneyRegistryLoader {
public:
  [[nodiscard]] static Result<JourneyRegistry> loadFromFile(const std::string& path);
  [[nodiscard]] static Result<JourneyRegistry> parseFromString(const std::string& json);
};

} // namespace NavGraph::io
