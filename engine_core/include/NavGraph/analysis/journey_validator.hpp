#pragma once

/**
 * @file journey_validator.hpp
 * @brief Checks that declared multi-step user journeys are navigable
 *
 * A journey is satisfied pair by pair: every consecutive (steps[i],
 * steps[i+1]) needs a direct link in that direction. Broken journeys are
 * findings, never errors, so one stale journey cannot hide the rest.
 */

#include "NavGraph/analysis/reachability_analyzer.hpp"
#include "NavGraph/core/types.hpp"
#include "NavGraph/graph/route_graph.hpp"
#include <optional>
#include <string>
#include <vector>

namespace NavGraph::analysis {

/**
 * @brief A named, ordered user flow
 */
struct Journey {
  std::string name;
  std::vector<std::string> steps;
};

enum class JourneyStatus : u8 { Complete, Partial };

/**
 * @brief Why a consecutive step pair is unsatisfied
 *
 * The Unknown* values mark steps naming routes absent from the graph
 * (typically a route removed after the journey was written).
 */
enum class MissingLinkReason : u8 { NoEdge, UnknownSource, UnknownTarget, UnknownBoth };

[[nodiscard]] const char* journeyStatusToString(JourneyStatus status);
[[nodiscard]] const char* missingLinkReasonToString(MissingLinkReason reason);

struct MissingLink {
  std::string from;
  std::string to;
  MissingLinkReason reason = MissingLinkReason::NoEdge;

  [[nodiscard]] bool involvesUnknownRoute() const { return reason != MissingLinkReason::NoEdge; }
};

struct JourneyResult {
  std::string name;
  JourneyStatus status = JourneyStatus::Partial;
  f64 coverage = 0.0;
  size_t totalPairs = 0;
  size_t satisfiedPairs = 0;
  std::vector<MissingLink> missingLinks;  // in step order
  std::vector<std::string> unreachableSteps; // known steps that are orphans

  [[nodiscard]] bool isComplete() const { return status == JourneyStatus::Complete; }
};

class JourneyValidator {
public:
  JourneyValidator() = default;

  /**
   * @brief Validate on up to @p workers threads; 0 and 1 both mean inline
   */
  void setWorkerCount(u32 workers) { m_workers = workers; }
  [[nodiscard]] u32 workerCount() const { return m_workers; }

  /**
   * @brief Cross-reference orphan status into JourneyResult::unreachableSteps
   *
   * The pointer must outlive validate(). Pass nullptr to disable.
   */
  void setReachability(const ReachabilityResult* reachability) { m_reachability = reachability; }

  /**
   * @brief Validate every journey; results are in input order
   */
  [[nodiscard]] std::vector<JourneyResult> validate(const graph::RouteGraph& graph,
                                                    const std::vector<Journey>& journeys) const;

  /**
   * @brief Validate a single journey
   */
  [[nodiscard]] static JourneyResult validateJourney(const graph::RouteGraph& graph,
                                                     const Journey& journey,
                                                     const ReachabilityResult* reachability);

  /**
   * @brief Mean coverage across results, or nullopt when there are none
   */
  [[nodiscard]] static std::optional<f64> averageCoverage(const std::vector<JourneyResult>& results);

private:
  u32 m_workers = 1;
  const ReachabilityResult* m_reachability = nullptr;
};

} // namespace NavGraph::analysis
