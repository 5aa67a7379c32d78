#pragma once

#include <chrono>
#include <optional>

namespace NavGraph::analysis {

/**
 * @brief Optional wall-clock budget for an analysis run
 *
 * Traversal checks expired() once per visited node; a default-constructed
 * deadline never expires.
 */
class AnalysisDeadline {
public:
  using Clock = std::chrono::steady_clock;

  AnalysisDeadline() = default;

  /**
   * @brief Expire @p budget from now
   *
   * A budget reaching past the clock's range never expires.
   */
  static AnalysisDeadline after(std::chrono::milliseconds budget) {
    AnalysisDeadline deadline;
    const Clock::time_point now = Clock::now();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (budget < headroom) {
      deadline.m_expiresAt = now + std::chrono::duration_cast<Clock::duration>(budget);
    }
    return deadline;
  }

  static AnalysisDeadline at(Clock::time_point expiresAt) {
    AnalysisDeadline deadline;
    deadline.m_expiresAt = expiresAt;
    return deadline;
  }

  [[nodiscard]] bool isSet() const { return m_expiresAt.has_value(); }

  [[nodiscard]] bool expired() const { return m_expiresAt && Clock::now() >= *m_expiresAt; }

private:
  std::optional<Clock::time_point> m_expiresAt;
};

} // namespace NavGraph::analysis
