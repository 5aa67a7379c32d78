#include "NavGraph/analysis/journey_validator.hpp"
#include "NavGraph/core/logger.hpp"
#include "strided_workers.hpp"

#include <unordered_set>

namespace NavGraph::analysis {

const char* journeyStatusToString(JourneyStatus status) {
  switch (status) {
  case JourneyStatus::Complete:
    return "complete";
  case JourneyStatus::Partial:
    return "partial";
  }
  return "partial";
}

const char* missingLinkReasonToString(MissingLinkReason reason) {
  switch (reason) {
  case MissingLinkReason::NoEdge:
    return "no_edge";
  case MissingLinkReason::UnknownSource:
    return "unknown_source";
  case MissingLinkReason::UnknownTarget:
    return "unknown_target";
  case MissingLinkReason::UnknownBoth:
    return "unknown_both";
  }
  return "no_edge";
}

JourneyResult JourneyValidator::validateJourney(const graph::RouteGraph& graph,
                                                const Journey& journey,
                                                const ReachabilityResult* reachability) {
  JourneyResult result;
  result.name = journey.name;

  if (journey.steps.size() < 2) {
    // The registry loader rejects these; guard against direct callers
    NAVGRAPH_LOG_WARN("Journey '{}' has {} step(s); at least two are required", journey.name,
                      journey.steps.size());
    return result;
  }

  result.totalPairs = journey.steps.size() - 1;

  for (size_t i = 0; i + 1 < journey.steps.size(); ++i) {
    const std::string& from = journey.steps[i];
    const std::string& to = journey.steps[i + 1];

    const bool knownFrom = graph.hasNode(from);
    const bool knownTo = graph.hasNode(to);

    if (knownFrom && knownTo && graph.hasEdge(from, to)) {
      ++result.satisfiedPairs;
      continue;
    }

    MissingLinkReason reason = MissingLinkReason::NoEdge;
    if (!knownFrom && !knownTo) {
      reason = MissingLinkReason::UnknownBoth;
    } else if (!knownFrom) {
      reason = MissingLinkReason::UnknownSource;
    } else if (!knownTo) {
      reason = MissingLinkReason::UnknownTarget;
    }
    result.missingLinks.push_back({from, to, reason});
  }

  result.coverage =
      static_cast<f64>(result.satisfiedPairs) / static_cast<f64>(result.totalPairs);
  result.status = result.satisfiedPairs == result.totalPairs ? JourneyStatus::Complete
                                                             : JourneyStatus::Partial;

  if (reachability != nullptr) {
    std::unordered_set<std::string> seen;
    for (const auto& step : journey.steps) {
      if (graph.hasNode(step) && reachability->isOrphan(step) && seen.insert(step).second) {
        result.unreachableSteps.push_back(step);
      }
    }
  }

  return result;
}

std::vector<JourneyResult> JourneyValidator::validate(const graph::RouteGraph& graph,
                                                      const std::vector<Journey>& journeys) const {
  std::vector<JourneyResult> results(journeys.size());

  detail::runStrided(journeys.size(), m_workers, [&](size_t i) {
    results[i] = validateJourney(graph, journeys[i], m_reachability);
  });

  for (const auto& result : results) {
    if (!result.isComplete()) {
      NAVGRAPH_LOG_DEBUG("Journey '{}' is partial: {}/{} links present", result.name,
                         result.satisfiedPairs, result.totalPairs);
    }
  }

  return results;
}

std::optional<f64> JourneyValidator::averageCoverage(const std::vector<JourneyResult>& results) {
  if (results.empty()) {
    return std::nullopt;
  }
  f64 total = 0.0;
  for (const auto& result : results) {
    total += result.coverage;
  }
  return total / static_cast<f64>(results.size());
}

} // namespace NavGraph::analysis
