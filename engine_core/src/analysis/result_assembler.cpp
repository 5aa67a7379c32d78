#include "NavGraph/analysis/analysis_result.hpp"

#include <algorithm>
#include <set>

namespace NavGraph::analysis {

using graph::GraphError;
using graph::GraphErrorCode;

namespace {

GraphError invariantViolation(const std::string& subject, const std::string& message) {
  return GraphError(GraphErrorCode::InvariantViolation, subject, message);
}

} // namespace

bool AnalysisResult::allJourneysComplete() const {
  return std::all_of(m_journeyResults.begin(), m_journeyResults.end(),
                     [](const JourneyResult& result) { return result.isComplete(); });
}

size_t AnalysisResult::partialJourneyCount() const {
  return static_cast<size_t>(
      std::count_if(m_journeyResults.begin(), m_journeyResults.end(),
                    [](const JourneyResult& result) { return !result.isComplete(); }));
}

Result<AnalysisResult, GraphError>
ResultAssembler::assemble(const graph::RouteGraph& graph, const ReachabilityResult& reachability,
                          std::vector<JourneyResult> journeyResults,
                          std::optional<f64> averageJourneyCoverage, f64 healthScore,
                          const GraphStats& stats) {
  using AssembleResult = Result<AnalysisResult, GraphError>;

  const std::set<std::string> orphans(reachability.orphans.begin(), reachability.orphans.end());
  const std::set<std::string> deadEnds(reachability.deadEnds.begin(),
                                       reachability.deadEnds.end());

  if (orphans.size() != reachability.orphans.size()) {
    return AssembleResult::error(invariantViolation("", "Orphan list contains duplicates"));
  }
  if (deadEnds.size() != reachability.deadEnds.size()) {
    return AssembleResult::error(invariantViolation("", "Dead-end list contains duplicates"));
  }

  for (const auto& path : orphans) {
    if (deadEnds.count(path) > 0) {
      return AssembleResult::error(
          invariantViolation(path, "Route '" + path + "' is both an orphan and a dead end"));
    }
    if (!graph.hasNode(path)) {
      return AssembleResult::error(
          invariantViolation(path, "Orphan '" + path + "' is not a route in the graph"));
    }
  }
  for (const auto& path : deadEnds) {
    if (!graph.hasNode(path)) {
      return AssembleResult::error(
          invariantViolation(path, "Dead end '" + path + "' is not a route in the graph"));
    }
  }

  // reachable = routes - orphans - deadEnds, checked against the analyzer's view
  std::vector<std::string> reachable;
  for (const auto& path : graph.nodePaths()) {
    if (orphans.count(path) == 0 && deadEnds.count(path) == 0) {
      reachable.push_back(path);
    }
  }
  if (reachable != reachability.reachable) {
    std::vector<std::string> mismatch;
    std::set_symmetric_difference(reachable.begin(), reachable.end(),
                                  reachability.reachable.begin(), reachability.reachable.end(),
                                  std::back_inserter(mismatch));
    const std::string subject = mismatch.empty() ? "" : mismatch.front();
    return AssembleResult::error(invariantViolation(
        subject, "Reachable set disagrees with routes minus orphans and dead ends (" +
                     std::to_string(mismatch.size()) + " route(s) differ)"));
  }
  if (reachable.size() + orphans.size() + deadEnds.size() != graph.nodeCount()) {
    return AssembleResult::error(
        invariantViolation("", "Classification does not cover every route exactly once"));
  }

  if (healthScore < 0.0 || healthScore > 10.0) {
    return AssembleResult::error(invariantViolation(
        "", "Health score " + std::to_string(healthScore) + " is outside [0, 10]"));
  }

  AnalysisResult result;
  result.m_reachable = std::move(reachable);
  result.m_orphans.assign(orphans.begin(), orphans.end());
  result.m_deadEnds.assign(deadEnds.begin(), deadEnds.end());
  result.m_reached.reserve(result.m_reachable.size() + result.m_deadEnds.size());
  std::merge(result.m_reachable.begin(), result.m_reachable.end(), result.m_deadEnds.begin(),
             result.m_deadEnds.end(), std::back_inserter(result.m_reached));
  result.m_journeyResults = std::move(journeyResults);
  result.m_averageJourneyCoverage = averageJourneyCoverage;
  result.m_healthScore = healthScore;
  result.m_stats = stats;

  return AssembleResult::ok(std::move(result));
}

} // namespace NavGraph::analysis
