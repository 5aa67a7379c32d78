#pragma once

#include "NavGraph/analysis/analysis_result.hpp"
#include "NavGraph/core/result.hpp"
#include "NavGraph/graph/graph_error.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace NavGraph::io {

/**
 * @brief JSON form of analysis output for report renderers and CI gates
 *
 * Sets are emitted sorted and journeys in registry order, so identical
 * inputs always serialize to identical bytes.
 */
class ResultSerializer {
public:
  [[nodiscard]] static nlohmann::ordered_json toJson(const analysis::AnalysisResult& result);
  [[nodiscard]] static nlohmann::ordered_json toJson(const graph::GraphError& error);

  [[nodiscard]] static std::string toString(const analysis::AnalysisResult& result,
                                            int indent = 2);

  /**
   * @brief Write to @p path atomically (temp file, then rename)
   */
  static Result<void> writeToFile(const analysis::AnalysisResult& result,
                                  const std::string& path, int indent = 2);
};

} // namespace NavGraph::io
