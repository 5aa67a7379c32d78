#include "NavGraph/runtime/nav_check_launcher.hpp"
#include "NavGraph/analysis/navigation_analyzer.hpp"
#include "NavGraph/core/logger.hpp"
#include "NavGraph/io/journey_registry.hpp"
#include "NavGraph/io/result_serializer.hpp"
#include "NavGraph/io/route_facts.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace NavGraph::runtime {

namespace {

template <typename T> bool parseNumber(const std::string& text, T& out) {
  const char* begin = text.data();
  const char* end = begin + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end;
}

std::string failureDocument(const std::string& code, const std::string& category,
                            const std::string& message) {
  nlohmann::ordered_json doc;
  doc["error"] = {{"code", code}, {"category", category}, {"message", message}};
  return doc.dump(2);
}

} // namespace

NavCheckLauncher::NavCheckLauncher() = default;
NavCheckLauncher::~NavCheckLauncher() = default;

Result<CheckOptions> NavCheckLauncher::parseArgs(int argc, char* argv[]) {
  CheckOptions opts;

  auto requireValue = [&](int& i, const std::string& flag) -> Result<std::string> {
    if (i + 1 >= argc) {
      return Result<std::string>::error("Option " + flag + " requires a value");
    }
    return Result<std::string>::ok(argv[++i]);
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "-q" || arg == "--quiet") {
      opts.quiet = true;
    } else if (arg == "--routes" || arg == "--journeys" || arg == "--config" ||
               arg == "--output" || arg == "--entry" || arg == "--terminal") {
      auto value = requireValue(i, arg);
      if (value.isError()) {
        return Result<CheckOptions>::error(value.error());
      }
      if (arg == "--routes") {
        opts.routesPath = value.value();
      } else if (arg == "--journeys") {
        opts.journeysPath = value.value();
      } else if (arg == "--config") {
        opts.configPath = value.value();
      } else if (arg == "--output") {
        opts.outputPath = value.value();
      } else if (arg == "--entry") {
        opts.entryPoints.push_back(value.value());
      } else {
        opts.terminals.push_back(value.value());
      }
    } else if (arg == "--workers") {
      auto value = requireValue(i, arg);
      if (value.isError()) {
        return Result<CheckOptions>::error(value.error());
      }
      u32 workers = 0;
      if (!parseNumber(value.value(), workers) || workers == 0) {
        return Result<CheckOptions>::error("--workers expects a positive integer, got '" +
                                           value.value() + "'");
      }
      opts.workers = workers;
    } else if (arg == "--timeout-ms") {
      auto value = requireValue(i, arg);
      if (value.isError()) {
        return Result<CheckOptions>::error(value.error());
      }
      i64 timeout = 0;
      if (!parseNumber(value.value(), timeout) || timeout < 0) {
        return Result<CheckOptions>::error(
            "--timeout-ms expects a non-negative integer, got '" + value.value() + "'");
      }
      opts.timeoutMs = timeout;
    } else {
      return Result<CheckOptions>::error("Unknown option: " + arg);
    }
  }

  if (opts.verbose && opts.quiet) {
    return Result<CheckOptions>::error("--verbose and --quiet are mutually exclusive");
  }

  return Result<CheckOptions>::ok(std::move(opts));
}

int NavCheckLauncher::run(int argc, char* argv[]) {
  auto options = parseArgs(argc, argv);
  if (options.isError()) {
    std::cerr << "navgraph_check: " << options.error() << "\n";
    std::cerr << "Try '" << (argc > 0 ? argv[0] : "navgraph_check") << " --help'.\n";
    return static_cast<int>(ExitCode::AnalysisFailed);
  }
  if (options.value().help) {
    printHelp(out(), argc > 0 ? argv[0] : "navgraph_check");
    return static_cast<int>(ExitCode::Clean);
  }
  return run(options.value());
}

int NavCheckLauncher::run(const CheckOptions& options) {
  if (options.help) {
    printHelp(out(), "navgraph_check");
    return static_cast<int>(ExitCode::Clean);
  }
  if (options.version) {
    out() << "navgraph_check " << NAVGRAPH_VERSION << "\n";
    return static_cast<int>(ExitCode::Clean);
  }

  auto configResult = loadConfiguration(options);
  if (configResult.isError()) {
    NAVGRAPH_LOG_ERROR("Configuration error: {}", configResult.error());
    emitFailure(failureDocument("CONFIG", "configuration", configResult.error()));
    return static_cast<int>(ExitCode::AnalysisFailed);
  }

  if (options.routesPath.empty()) {
    NAVGRAPH_LOG_ERROR("No route facts given (use --routes <file>)");
    emitFailure(failureDocument("USAGE", "configuration", "--routes <file> is required"));
    return static_cast<int>(ExitCode::AnalysisFailed);
  }

  auto facts = io::RouteFactsLoader::loadFromFile(options.routesPath);
  if (facts.isError()) {
    NAVGRAPH_LOG_ERROR("Cannot load route facts: {}", facts.error());
    emitFailure(failureDocument("INPUT", "configuration", facts.error()));
    return static_cast<int>(ExitCode::AnalysisFailed);
  }
  m_configManager.applyDeclarations(facts.value().entryPoints, facts.value().allowedTerminals);

  analysis::AnalysisRequest request;

  if (!options.journeysPath.empty()) {
    auto registry = io::JourneyRegistryLoader::loadFromFile(options.journeysPath);
    if (registry.isError()) {
      NAVGRAPH_LOG_ERROR("Cannot load journey registry: {}", registry.error());
      emitFailure(failureDocument("INPUT", "configuration", registry.error()));
      return static_cast<int>(ExitCode::AnalysisFailed);
    }
    m_configManager.applyDeclarations(registry.value().entryPoints,
                                      registry.value().allowedTerminals);
    request.journeys = std::move(registry.value().journeys);
  }

  applyCommandLineOverrides(options);
  const AnalysisConfig& config = m_configManager.getConfig();

  request.routes = std::move(facts.value().routes);
  request.links = std::move(facts.value().links);
  request.entryPoints = config.navigation.entryPoints;
  request.allowedTerminals = config.navigation.allowedTerminals;

  analysis::NavigationAnalyzer analyzer;
  analyzer.setJourneyWorkers(config.execution.journeyWorkers);
  analyzer.setTimeout(std::chrono::milliseconds(config.execution.timeoutMs));

  auto outcome = analyzer.run(request);
  if (outcome.isError()) {
    const graph::GraphError& error = outcome.error();
    NAVGRAPH_LOG_ERROR("{}", error.format());
    nlohmann::ordered_json doc;
    doc["error"] = io::ResultSerializer::toJson(error);
    emitFailure(doc.dump(2));
    return static_cast<int>(ExitCode::AnalysisFailed);
  }

  auto emitted = emitResult(outcome.value());
  if (emitted.isError()) {
    NAVGRAPH_LOG_ERROR("Cannot write analysis result: {}", emitted.error());
    return static_cast<int>(ExitCode::AnalysisFailed);
  }

  const analysis::AnalysisResult& result = outcome.value();
  for (const auto& orphan : result.orphans()) {
    NAVGRAPH_LOG_WARN("Orphaned route: {}", orphan);
  }
  for (const auto& deadEnd : result.deadEnds()) {
    NAVGRAPH_LOG_INFO("Dead end: {}", deadEnd);
  }
  for (const auto& journey : result.journeyResults()) {
    if (!journey.isComplete() && !journey.missingLinks.empty()) {
      const auto& gap = journey.missingLinks.front();
      NAVGRAPH_LOG_WARN("Journey '{}' breaks at '{}' -> '{}' ({})", journey.name, gap.from,
                        gap.to, analysis::missingLinkReasonToString(gap.reason));
    }
  }

  return static_cast<int>(exitCodeFor(result));
}

Result<void> NavCheckLauncher::loadConfiguration(const CheckOptions& options) {
  m_configManager.resetToDefaults();

  if (!options.configPath.empty()) {
    auto result = m_configManager.loadFromFile(options.configPath);
    if (result.isError()) {
      return result;
    }
  } else {
    fs::path implicitConfig = fs::path(m_workingDirectory) / ConfigManager::kDefaultConfigFile;
    std::error_code ec;
    if (fs::exists(implicitConfig, ec)) {
      auto result = m_configManager.loadFromFile(implicitConfig.string());
      if (result.isError()) {
        return result;
      }
    }
  }

  AnalysisConfig& config = m_configManager.getConfigMutable();
  if (options.verbose) {
    config.logging.logLevel = "debug";
  } else if (options.quiet) {
    config.logging.logLevel = "error";
  }
  if (!options.outputPath.empty()) {
    config.output.path = options.outputPath;
  }

  return m_configManager.applyLogging();
}

void NavCheckLauncher::applyCommandLineOverrides(const CheckOptions& options) {
  AnalysisConfig& config = m_configManager.getConfigMutable();

  if (!options.entryPoints.empty()) {
    config.navigation.entryPoints =
        analysis::EntryPointSet(options.entryPoints.begin(), options.entryPoints.end());
  }
  if (!options.terminals.empty()) {
    config.navigation.allowedTerminals =
        analysis::AllowedTerminalSet(options.terminals.begin(), options.terminals.end());
  }
  if (options.workers) {
    config.execution.journeyWorkers = *options.workers;
  }
  if (options.timeoutMs) {
    config.execution.timeoutMs = *options.timeoutMs;
  }
}

Result<void> NavCheckLauncher::emitResult(const analysis::AnalysisResult& result) {
  const OutputSettings& output = m_configManager.getConfig().output;
  if (!output.path.empty()) {
    return io::ResultSerializer::writeToFile(result, output.path, output.indent);
  }
  this->out() << io::ResultSerializer::toString(result, output.indent) << "\n";
  return Result<void>::ok();
}

void NavCheckLauncher::emitFailure(const std::string& serializedError) {
  const std::string& path = m_configManager.getConfig().output.path;
  if (!path.empty()) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (file.is_open()) {
      file << serializedError << "\n";
      return;
    }
    NAVGRAPH_LOG_WARN("Cannot write error report to {}", path);
  }
  out() << serializedError << "\n";
}

void NavCheckLauncher::setOutputStream(std::ostream* stream) {
  m_out = stream;
}

std::ostream& NavCheckLauncher::out() const {
  return m_out != nullptr ? *m_out : std::cout;
}

ExitCode NavCheckLauncher::exitCodeFor(const analysis::AnalysisResult& result) {
  if (result.hasOrphans() || !result.allJourneysComplete()) {
    return ExitCode::FindingsPresent;
  }
  return ExitCode::Clean;
}

void NavCheckLauncher::printHelp(std::ostream& out, const char* programName) {
  out << "NavGraph navigation checker " << NAVGRAPH_VERSION << "\n\n";
  out << "Usage: " << programName << " --routes <file> [options]\n\n";
  out << "Options:\n";
  out << "  --routes <file>       Route/link facts (JSON), required\n";
  out << "  --journeys <file>     Journey registry (JSON)\n";
  out << "  --config <file>       Configuration file (default: ./navgraph.json if present)\n";
  out << "  --entry <path>        Entry point route; repeatable, replaces configured set\n";
  out << "  --terminal <path>     Allowed terminal route; repeatable, replaces configured set\n";
  out << "  --output <file>       Write the JSON result to a file instead of stdout\n";
  out << "  --workers <n>         Threads used for journey validation\n";
  out << "  --timeout-ms <n>      Abort the analysis after n milliseconds (0 = no limit)\n";
  out << "  -v, --verbose         Debug logging\n";
  out << "  -q, --quiet           Errors only\n";
  out << "  -h, --help            Show this help\n";
  out << "  --version             Show version\n\n";
  out << "Exit codes:\n";
  out << "  0  no orphans and every journey complete\n";
  out << "  1  orphaned routes or partial journeys found\n";
  out << "  2  invalid input, configuration error or analysis failure\n";
}

} // namespace NavGraph::runtime
