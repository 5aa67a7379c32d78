#include "NavGraph/analysis/health_scorer.hpp"

#include <algorithm>

namespace NavGraph::analysis {

f64 HealthScorer::score(size_t orphans, size_t deadEnds, std::optional<f64> avgJourneyCoverage) {
  const f64 orphanPenalty =
      std::min(static_cast<f64>(orphans) * kOrphanPenaltyPerNode, kMaxOrphanPenalty);
  const f64 deadEndPenalty =
      std::min(static_cast<f64>(deadEnds) * kDeadEndPenaltyPerNode, kMaxDeadEndPenalty);

  f64 journeyPenalty = 0.0;
  if (avgJourneyCoverage.has_value()) {
    const f64 coverage = std::clamp(*avgJourneyCoverage, 0.0, 1.0);
    journeyPenalty = (1.0 - coverage) * kJourneyPenaltyWeight;
  }

  return std::max(0.0, kBaseScore - orphanPenalty - deadEndPenalty - journeyPenalty);
}

} // namespace NavGraph::analysis
