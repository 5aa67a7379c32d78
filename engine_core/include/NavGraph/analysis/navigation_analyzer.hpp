#pragma once

/**
 * @file navigation_analyzer.hpp
 * @brief End-to-end analysis pipeline
 *
 * Runs, strictly in order:
 * - GraphBuilder
 * - ReachabilityAnalyzer
 * - JourneyValidator (only when journeys are supplied)
 * - HealthScorer
 * - ResultAssembler
 *
 * Any configuration error, invariant violation or timeout aborts the run;
 * no partial result is returned.
 */

#include "NavGraph/analysis/analysis_result.hpp"
#include "NavGraph/analysis/journey_validator.hpp"
#include "NavGraph/analysis/reachability_analyzer.hpp"
#include "NavGraph/core/result.hpp"
#include "NavGraph/graph/graph_error.hpp"
#include "NavGraph/graph/route_graph.hpp"
#include <chrono>
#include <optional>
#include <vector>

namespace NavGraph::analysis {

/**
 * @brief Everything one analysis run consumes
 *
 * journeys == nullopt means no registry was supplied, which drops the
 * journey term from the score. An empty registry behaves the same way.
 */
struct AnalysisRequest {
  std::vector<graph::RouteNode> routes;
  std::vector<graph::LinkEdge> links;
  EntryPointSet entryPoints;
  AllowedTerminalSet allowedTerminals;
  std::optional<std::vector<Journey>> journeys;
};

using AnalysisOutcome = Result<AnalysisResult, graph::GraphError>;

class NavigationAnalyzer {
public:
  NavigationAnalyzer() = default;

  void setJourneyWorkers(u32 workers) { m_journeyWorkers = workers; }

  /**
   * @brief Per-run time budget; zero disables the deadline
   */
  void setTimeout(std::chrono::milliseconds timeout) { m_timeout = timeout; }

  [[nodiscard]] AnalysisOutcome run(const AnalysisRequest& request) const;

  /**
   * @brief Analyze independent route sets (e.g. one per tenant)
   *
   * Requests share nothing, so they run concurrently on up to the journey
   * worker count threads. Outcomes are returned in request order.
   */
  [[nodiscard]] std::vector<AnalysisOutcome>
  runBatch(const std::vector<AnalysisRequest>& requests) const;

private:
  u32 m_journeyWorkers = 1;
  std::chrono::milliseconds m_timeout{0};
};

} // namespace NavGraph::analysis
