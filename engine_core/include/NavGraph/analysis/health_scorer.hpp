#pragma once

#include "NavGraph/core/types.hpp"
#include <optional>

namespace NavGraph::analysis {

/**
 * @brief Composite 0-10 navigation health score
 *
 *   score = max(0, 10 - min(orphans * 0.5, 3)
 *                     - min(deadEnds * 0.2, 1)
 *                     - (1 - avgJourneyCoverage) * 2)
 *
 * The journey term is omitted when no journeys were supplied. Weights are
 * fixed so CI gates are reproducible across runs and machines.
 */
class HealthScorer {
public:
  static constexpr f64 kBaseScore = 10.0;
  static constexpr f64 kOrphanPenaltyPerNode = 0.5;
  static constexpr f64 kMaxOrphanPenalty = 3.0;
  static constexpr f64 kDeadEndPenaltyPerNode = 0.2;
  static constexpr f64 kMaxDeadEndPenalty = 1.0;
  static constexpr f64 kJourneyPenaltyWeight = 2.0;

  [[nodiscard]] static f64 score(size_t orphans, size_t deadEnds,
                                 std::optional<f64> avgJourneyCoverage);
};

} // namespace NavGraph::analysis
