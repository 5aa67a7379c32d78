#pragma once

/**
 * @file graph_error.hpp
 * @brief Error reporting for graph construction and analysis
 *
 * Every error that aborts an analysis run is a GraphError. Errors carry
 * the offending identifier (route path, edge, entry point) as their
 * subject, plus optional "did you mean" suggestions drawn from the known
 * route paths.
 */

#include "NavGraph/core/types.hpp"
#include <string>
#include <vector>

namespace NavGraph::graph {

// =============================================================================
// String Similarity Utilities
// =============================================================================

/**
 * @brief Levenshtein (edit) distance between two strings
 */
[[nodiscard]] size_t levenshteinDistance(const std::string& s1, const std::string& s2);

/**
 * @brief Find candidates within an edit distance of @p name
 *
 * Exact matches are excluded. Results are ordered by distance, ties broken
 * lexicographically so the output is deterministic.
 *
 * @param name The string to match against
 * @param candidates Candidate strings
 * @param maxDistance Maximum edit distance to consider
 * @param maxResults Maximum number of results to return
 */
[[nodiscard]] std::vector<std::string>
findSimilarStrings(const std::string& name, const std::vector<std::string>& candidates,
                   size_t maxDistance = 2, size_t maxResults = 3);

// =============================================================================
// Error Codes
// =============================================================================

/**
 * @brief Error codes for engine failures
 *
 * - 1xx: configuration errors (malformed or inconsistent input facts)
 * - 2xx: invariant violations (defects in the engine itself)
 * - 3xx: externally imposed limits
 */
enum class GraphErrorCode : u32 {
  DuplicateNode = 101,
  DanglingEdge = 102,
  UnknownEntryPoint = 103,
  EmptyEntryPointSet = 104,

  InvariantViolation = 201,

  AnalysisTimeout = 301
};

enum class GraphErrorCategory : u8 { Configuration, Invariant, Timeout };

[[nodiscard]] const char* graphErrorCodeDescription(GraphErrorCode code);
[[nodiscard]] const char* graphErrorCategoryToString(GraphErrorCategory category);

/**
 * @brief A fatal analysis error
 */
struct GraphError {
  GraphErrorCode code = GraphErrorCode::InvariantViolation;
  std::string subject; // offending identifier, e.g. the duplicated path
  std::string message;
  std::vector<std::string> suggestions;

  GraphError() = default;
  GraphError(GraphErrorCode c, std::string subj, std::string msg)
      : code(c), subject(std::move(subj)), message(std::move(msg)) {}

  GraphError& withSuggestions(std::vector<std::string> similar) {
    suggestions = std::move(similar);
    return *this;
  }

  [[nodiscard]] GraphErrorCategory category() const;

  [[nodiscard]] bool isConfigurationError() const {
    return category() == GraphErrorCategory::Configuration;
  }

  /**
   * @brief Error code as a string (e.g. "E102")
   */
  [[nodiscard]] std::string errorCodeString() const {
    return "E" + std::to_string(static_cast<u32>(code));
  }

  /**
   * @brief Single-line form
   *
   * Example output:
   *   error[E103] '/hom': Unknown entry point '/hom' (did you mean '/home'?)
   */
  [[nodiscard]] std::string format() const;
};

} // namespace NavGraph::graph
