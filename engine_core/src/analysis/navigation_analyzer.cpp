#include "NavGraph/analysis/navigation_analyzer.hpp"
#include "NavGraph/analysis/health_scorer.hpp"
#include "NavGraph/core/logger.hpp"
#include "NavGraph/graph/graph_builder.hpp"
#include "strided_workers.hpp"

namespace NavGraph::analysis {

AnalysisOutcome NavigationAnalyzer::run(const AnalysisRequest& request) const {
  AnalysisDeadline deadline;
  if (m_timeout.count() > 0) {
    deadline = AnalysisDeadline::after(m_timeout);
  }

  graph::GraphBuilder builder;
  auto graphResult = builder.build(request.routes, request.links);
  if (graphResult.isError()) {
    return AnalysisOutcome::error(graphResult.error());
  }
  const graph::RouteGraph& graph = graphResult.value();

  ReachabilityAnalyzer reachabilityAnalyzer;
  reachabilityAnalyzer.setDeadline(deadline);
  auto reachabilityResult =
      reachabilityAnalyzer.analyze(graph, request.entryPoints, request.allowedTerminals);
  if (reachabilityResult.isError()) {
    return AnalysisOutcome::error(reachabilityResult.error());
  }
  const ReachabilityResult& reachability = reachabilityResult.value();

  std::vector<JourneyResult> journeyResults;
  std::optional<f64> averageCoverage;
  if (request.journeys.has_value()) {
    JourneyValidator validator;
    validator.setWorkerCount(m_journeyWorkers);
    validator.setReachability(&reachability);
    journeyResults = validator.validate(graph, *request.journeys);
    averageCoverage = JourneyValidator::averageCoverage(journeyResults);
  }

  const f64 score =
      HealthScorer::score(reachability.orphans.size(), reachability.deadEnds.size(),
                          averageCoverage);

  GraphStats stats;
  stats.nodeCount = graph.nodeCount();
  stats.edgeCount = graph.edgeCount();
  stats.duplicateEdgesDropped = builder.duplicateEdgeCount();
  stats.entryPointCount = request.entryPoints.size();

  auto assembled = ResultAssembler::assemble(graph, reachability, std::move(journeyResults),
                                             averageCoverage, score, stats);
  if (assembled.isError()) {
    NAVGRAPH_LOG_FATAL("Analysis invariant violated: {}", assembled.error().format());
    return assembled;
  }

  const AnalysisResult& result = assembled.value();
  NAVGRAPH_LOG_INFO("Analyzed {} routes / {} links: {} orphans, {} dead ends, {} of {} journeys "
                    "partial, health {:.1f}/10",
                    stats.nodeCount, stats.edgeCount, result.orphans().size(),
                    result.deadEnds().size(), result.partialJourneyCount(),
                    result.journeyResults().size(), result.healthScore());
  return assembled;
}

std::vector<AnalysisOutcome>
NavigationAnalyzer::runBatch(const std::vector<AnalysisRequest>& requests) const {
  std::vector<std::optional<AnalysisOutcome>> slots(requests.size());

  detail::runStrided(requests.size(), m_journeyWorkers,
                     [&](size_t i) { slots[i].emplace(run(requests[i])); });

  std::vector<AnalysisOutcome> outcomes;
  outcomes.reserve(slots.size());
  for (auto& slot : slots) {
    outcomes.push_back(std::move(*slot));
  }
  return outcomes;
}

} // namespace NavGraph::analysis
