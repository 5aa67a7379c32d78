#pragma once

/**
 * @file analysis_result.hpp
 * @brief Terminal, read-only output of an analysis run
 */

#include "NavGraph/analysis/journey_validator.hpp"
#include "NavGraph/analysis/reachability_analyzer.hpp"
#include "NavGraph/core/result.hpp"
#include "NavGraph/core/types.hpp"
#include "NavGraph/graph/graph_error.hpp"
#include "NavGraph/graph/route_graph.hpp"
#include <optional>
#include <string>
#include <vector>

namespace NavGraph::analysis {

struct GraphStats {
  size_t nodeCount = 0;
  size_t edgeCount = 0;
  size_t duplicateEdgesDropped = 0;
  size_t entryPointCount = 0;
};

/**
 * @brief Immutable analysis result
 *
 * reachable, orphans and deadEnds partition the graph's routes. reached is
 * the traversal's view (reachable plus deadEnds). Only ResultAssembler can
 * construct one.
 */
class AnalysisResult {
public:
  [[nodiscard]] const std::vector<std::string>& reachable() const { return m_reachable; }
  [[nodiscard]] const std::vector<std::string>& orphans() const { return m_orphans; }
  [[nodiscard]] const std::vector<std::string>& deadEnds() const { return m_deadEnds; }
  [[nodiscard]] const std::vector<std::string>& reached() const { return m_reached; }
  [[nodiscard]] const std::vector<JourneyResult>& journeyResults() const {
    return m_journeyResults;
  }
  [[nodiscard]] std::optional<f64> averageJourneyCoverage() const {
    return m_averageJourneyCoverage;
  }
  [[nodiscard]] f64 healthScore() const { return m_healthScore; }
  [[nodiscard]] const GraphStats& stats() const { return m_stats; }

  [[nodiscard]] bool hasOrphans() const { return !m_orphans.empty(); }
  [[nodiscard]] bool allJourneysComplete() const;
  [[nodiscard]] size_t partialJourneyCount() const;

private:
  friend class ResultAssembler;
  AnalysisResult() = default;

  std::vector<std::string> m_reachable;
  std::vector<std::string> m_orphans;
  std::vector<std::string> m_deadEnds;
  std::vector<std::string> m_reached;
  std::vector<JourneyResult> m_journeyResults;
  std::optional<f64> m_averageJourneyCoverage;
  f64 m_healthScore = 0.0;
  GraphStats m_stats;
};

/**
 * @brief Packages the pipeline's outputs into one AnalysisResult
 *
 * Recomputes reachable as routes minus orphans minus dead ends and checks
 * that the three sets are disjoint and cover every route. Any mismatch is
 * an InvariantViolation; nothing is corrected.
 */
class ResultAssembler {
public:
  [[nodiscard]] static Result<AnalysisResult, graph::GraphError>
  assemble(const graph::RouteGraph& graph, const ReachabilityResult& reachability,
           std::vector<JourneyResult> journeyResults, std::optional<f64> averageJourneyCoverage,
           f64 healthScore, const GraphStats& stats);
};

} // namespace NavGraph::analysis
