#pragma once

/**
 * @file analysis_config.hpp
 * @brief Analysis configuration - settings for a navgraph_check run
 *
 * Provides configuration for:
 * - Entry points and allowed terminals (framework convention defaults)
 * - Execution (journey worker threads, time budget)
 * - Logging (level, file output, colors)
 * - Output (destination, JSON indentation)
 */

#include "NavGraph/analysis/reachability_analyzer.hpp"
#include "NavGraph/core/types.hpp"
#include <string>

namespace NavGraph::runtime {

/**
 * @brief Graph roots and permitted terminal pages
 */
struct NavigationSettings {
  analysis::EntryPointSet entryPoints = {"/"};
  analysis::AllowedTerminalSet allowedTerminals = {"/logout", "/error", "/404", "/500"};
};

struct ExecutionSettings {
  u32 journeyWorkers = 1; // 1 = validate journeys inline
  i64 timeoutMs = 0;      // 0 = no deadline
};

struct LoggingSettings {
  std::string logLevel = "info"; // trace, debug, info, warning, error, fatal, off
  std::string logFile;           // empty = stderr only
  bool colors = true;
};

struct OutputSettings {
  std::string path; // empty = stdout
  i32 indent = 2;
};

struct AnalysisConfig {
  NavigationSettings navigation;
  ExecutionSettings execution;
  LoggingSettings logging;
  OutputSettings output;
};

} // namespace NavGraph::runtime
