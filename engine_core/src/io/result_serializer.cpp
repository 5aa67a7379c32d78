#include "NavGraph/io/result_serializer.hpp"
#include "NavGraph/core/logger.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace NavGraph::io {

using nlohmann::ordered_json;

namespace {

ordered_json journeyToJson(const analysis::JourneyResult& journey) {
  ordered_json missing = ordered_json::array();
  for (const auto& link : journey.missingLinks) {
    missing.push_back(ordered_json{{"from", link.from},
                                   {"to", link.to},
                                   {"reason", analysis::missingLinkReasonToString(link.reason)}});
  }

  ordered_json out;
  out["name"] = journey.name;
  out["status"] = analysis::journeyStatusToString(journey.status);
  out["coverage"] = journey.coverage;
  out["satisfiedLinks"] = journey.satisfiedPairs;
  out["totalLinks"] = journey.totalPairs;
  out["missingLinks"] = std::move(missing);
  out["unreachableSteps"] = journey.unreachableSteps;
  return out;
}

} // namespace

ordered_json ResultSerializer::toJson(const analysis::AnalysisResult& result) {
  ordered_json journeys = ordered_json::array();
  for (const auto& journey : result.journeyResults()) {
    journeys.push_back(journeyToJson(journey));
  }

  const auto& stats = result.stats();

  ordered_json out;
  out["healthScore"] = result.healthScore();
  out["reachable"] = result.reachable();
  out["orphans"] = result.orphans();
  out["deadEnds"] = result.deadEnds();
  out["reached"] = result.reached();
  out["journeys"] = std::move(journeys);
  if (auto coverage = result.averageJourneyCoverage()) {
    out["averageJourneyCoverage"] = *coverage;
  } else {
    out["averageJourneyCoverage"] = nullptr;
  }
  out["stats"] = {{"routes", stats.nodeCount},
                  {"links", stats.edgeCount},
                  {"duplicateLinksDropped", stats.duplicateEdgesDropped},
                  {"entryPoints", stats.entryPointCount}};
  return out;
}

ordered_json ResultSerializer::toJson(const graph::GraphError& error) {
  ordered_json out;
  out["code"] = error.errorCodeString();
  out["category"] = graph::graphErrorCategoryToString(error.category());
  out["subject"] = error.subject;
  out["message"] = error.message;
  out["suggestions"] = error.suggestions;
  return out;
}

std::string ResultSerializer::toString(const analysis::AnalysisResult& result, int indent) {
  return toJson(result).dump(indent);
}

Result<void> ResultSerializer::writeToFile(const analysis::AnalysisResult& result,
                                           const std::string& path, int indent) {
  try {
    fs::path target(path);
    if (target.has_parent_path()) {
      fs::create_directories(target.parent_path());
    }

    std::string tempPath = path + ".tmp";
    {
      std::ofstream file(tempPath, std::ios::out | std::ios::trunc);
      if (!file.is_open()) {
        return Result<void>::error("Cannot open file for writing: " + path);
      }
      file << toString(result, indent) << '\n';
      if (!file) {
        return Result<void>::error("Failed to write file: " + path);
      }
    }

    fs::rename(tempPath, target);
    NAVGRAPH_LOG_DEBUG("Analysis result written to {}", path);
    return Result<void>::ok();
  } catch (const std::exception& e) {
    return Result<void>::error(std::string("Failed to write result: ") + e.what());
  }
}

} // namespace NavGraph::io
