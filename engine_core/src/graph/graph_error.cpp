#include "NavGraph/graph/graph_error.hpp"

#include <algorithm>
#include <sstream>

namespace NavGraph::graph {

size_t levenshteinDistance(const std::string& s1, const std::string& s2) {
  const size_t m = s1.size();
  const size_t n = s2.size();

  if (m == 0)
    return n;
  if (n == 0)
    return m;

  // Two rows instead of the full matrix
  std::vector<size_t> prev(n + 1);
  std::vector<size_t> curr(n + 1);

  for (size_t j = 0; j <= n; ++j) {
    prev[j] = j;
  }

  for (size_t i = 1; i <= m; ++i) {
    curr[0] = i;
    for (size_t j = 1; j <= n; ++j) {
      size_t cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
      curr[j] = std::min({prev[j] + 1,        // deletion
                          curr[j - 1] + 1,    // insertion
                          prev[j - 1] + cost} // substitution
      );
    }
    std::swap(prev, curr);
  }

  return prev[n];
}

std::vector<std::string> findSimilarStrings(const std::string& name,
                                            const std::vector<std::string>& candidates,
                                            size_t maxDistance, size_t maxResults) {
  std::vector<std::pair<size_t, std::string>> matches;

  for (const auto& candidate : candidates) {
    size_t lenDiff = (name.size() > candidate.size()) ? (name.size() - candidate.size())
                                                      : (candidate.size() - name.size());
    if (lenDiff > maxDistance)
      continue;

    size_t dist = levenshteinDistance(name, candidate);
    if (dist <= maxDistance && dist > 0) {
      matches.emplace_back(dist, candidate);
    }
  }

  std::sort(matches.begin(), matches.end());

  std::vector<std::string> result;
  for (size_t i = 0; i < std::min(matches.size(), maxResults); ++i) {
    result.push_back(matches[i].second);
  }
  return result;
}

const char* graphErrorCodeDescription(GraphErrorCode code) {
  switch (code) {
  case GraphErrorCode::DuplicateNode:
    return "Duplicate route";
  case GraphErrorCode::DanglingEdge:
    return "Link references unknown route";
  case GraphErrorCode::UnknownEntryPoint:
    return "Unknown entry point";
  case GraphErrorCode::EmptyEntryPointSet:
    return "No entry points declared";
  case GraphErrorCode::InvariantViolation:
    return "Internal invariant violated";
  case GraphErrorCode::AnalysisTimeout:
    return "Analysis deadline exceeded";
  }
  return "Unknown error";
}

const char* graphErrorCategoryToString(GraphErrorCategory category) {
  switch (category) {
  case GraphErrorCategory::Configuration:
    return "configuration";
  case GraphErrorCategory::Invariant:
    return "invariant";
  case GraphErrorCategory::Timeout:
    return "timeout";
  }
  return "unknown";
}

GraphErrorCategory GraphError::category() const {
  switch (code) {
  case GraphErrorCode::DuplicateNode:
  case GraphErrorCode::DanglingEdge:
  case GraphErrorCode::UnknownEntryPoint:
  case GraphErrorCode::EmptyEntryPointSet:
    return GraphErrorCategory::Configuration;
  case GraphErrorCode::InvariantViolation:
    return GraphErrorCategory::Invariant;
  case GraphErrorCode::AnalysisTimeout:
    return GraphErrorCategory::Timeout;
  }
  return GraphErrorCategory::Invariant;
}

std::string GraphError::format() const {
  std::ostringstream ss;
  ss << "error[" << errorCodeString() << "]";
  if (!subject.empty()) {
    ss << " '" << subject << "'";
  }
  ss << ": " << (message.empty() ? graphErrorCodeDescription(code) : message);

  if (suggestions.size() == 1) {
    ss << " (did you mean '" << suggestions.front() << "'?)";
  } else if (!suggestions.empty()) {
    ss << " (did you mean one of:";
    for (const auto& suggestion : suggestions) {
      ss << " '" << suggestion << "'";
    }
    ss << "?)";
  }
  return ss.str();
}

} // namespace NavGraph::graph
