#pragma once

/**
 * @file nav_check_launcher.hpp
 * @brief navgraph_check - command-line front end for the analysis engine
 *
 * Loads route facts, the optional journey registry and configuration, runs
 * the analysis, writes the JSON result and maps the outcome to an exit code.
 */

#include "NavGraph/analysis/analysis_result.hpp"
#include "NavGraph/core/result.hpp"
#include "NavGraph/core/types.hpp"
#include "NavGraph/runtime/config_manager.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace NavGraph::runtime {

constexpr const char* NAVGRAPH_VERSION = "1.0.0";

/**
 * @brief Process exit codes
 */
enum class ExitCode : int {
  Clean = 0,          // no orphans, every journey complete
  FindingsPresent = 1, // orphans present or a journey is partial
  AnalysisFailed = 2   // bad input, configuration/invariant error, timeout
};

/**
 * @brief Command-line options
 */
struct CheckOptions {
  std::string routesPath;   // --routes (required)
  std::string journeysPath; // --journeys
  std::string configPath;   // --config
  std::string outputPath;   // --output
  std::vector<std::string> entryPoints; // --entry (repeatable)
  std::vector<std::string> terminals;   // --terminal (repeatable)
  std::optional<u32> workers;           // --workers
  std::optional<i64> timeoutMs;         // --timeout-ms
  bool verbose = false;
  bool quiet = false;
  bool help = false;
  bool version = false;
};

class NavCheckLauncher {
public:
  NavCheckLauncher();
  ~NavCheckLauncher();

  NavCheckLauncher(const NavCheckLauncher&) = delete;
  NavCheckLauncher& operator=(const NavCheckLauncher&) = delete;

  /**
   * @brief Parse argv; unknown flags and missing values are errors
   */
  [[nodiscard]] static Result<CheckOptions> parseArgs(int argc, char* argv[]);

  /**
   * @brief Parse arguments and run; returns the process exit code
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Run with already-parsed options
   */
  int run(const CheckOptions& options);

  /**
   * @brief Redirect help, version and result output (default std::cout)
   */
  void setOutputStream(std::ostream* stream);

  /**
   * @brief Directory searched for navgraph.json when --config is absent
   */
  void setWorkingDirectory(const std::string& directory) { m_workingDirectory = directory; }

  [[nodiscard]] static ExitCode exitCodeFor(const analysis::AnalysisResult& result);

  static void printHelp(std::ostream& out, const char* programName);

  [[nodiscard]] const ConfigManager& configManager() const { return m_configManager; }

private:
  Result<void> loadConfiguration(const CheckOptions& options);
  void applyCommandLineOverrides(const CheckOptions& options);
  Result<void> emitResult(const analysis::AnalysisResult& result);
  void emitFailure(const std::string& serializedError);

  [[nodiscard]] std::ostream& out() const;

  ConfigManager m_configManager;
  std::ostream* m_out = nullptr;
  std::string m_workingDirectory = ".";
};

} // namespace NavGraph::runtime
