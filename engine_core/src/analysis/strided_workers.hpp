#pragma once

// Fan-out helper shared by journey validation and batch analysis

#include "NavGraph/core/types.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace NavGraph::analysis::detail {

/**
 * @brief Number of threads actually used for @p items work items
 *
 * Never more than the items, nor more than the hardware reports.
 */
inline size_t effectiveWorkerCount(u32 requested, size_t items) {
  size_t workers = std::min<size_t>(std::max<u32>(requested, 1), std::max<size_t>(items, 1));
  const unsigned hardware = std::thread::hardware_concurrency();
  if (hardware > 0) {
    workers = std::min<size_t>(workers, hardware);
  }
  return workers;
}

/**
 * @brief Call @p task(i) for every i in [0, items)
 *
 * Worker w takes indices w, w + workers, ... so tasks writing slot i never
 * share a slot. If a thread cannot be started, the ones already running are
 * joined before the error propagates.
 */
template <typename Task> void runStrided(size_t items, u32 requestedWorkers, Task task) {
  const size_t workers = effectiveWorkerCount(requestedWorkers, items);
  if (workers <= 1) {
    for (size_t i = 0; i < items; ++i) {
      task(i);
    }
    return;
  }

  std::vector<std::thread> threads;
  threads.reserve(workers);
  auto joinAll = [&threads]() {
    for (auto& thread : threads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  };

  try {
    for (size_t w = 0; w < workers; ++w) {
      threads.emplace_back([&task, w, workers, items]() {
        for (size_t i = w; i < items; i += workers) {
          task(i);
        }
      });
    }
  } catch (...) {
    joinAll();
    throw;
  }
  joinAll();
}

} // namespace NavGraph::analysis::detail
