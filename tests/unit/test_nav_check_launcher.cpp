/**
 * @file test_nav_check_launcher.cpp
 * @brief Unit tests for navgraph_check argument parsing and exit codes
 */

#include "NavGraph/analysis/navigation_analyzer.hpp"
#include "NavGraph/core/logger.hpp"
#include "NavGraph/runtime/nav_check_launcher.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace NavGraph;
using namespace NavGraph::runtime;
using NavGraph::test::TestDirectory;

namespace {

// Owns mutable copies of the arguments for argv-style calls
class ArgList {
public:
  ArgList(std::initializer_list<std::string> args) : m_storage(args) {
    m_storage.insert(m_storage.begin(), "navgraph_check");
    for (auto& arg : m_storage) {
      m_argv.push_back(arg.data());
    }
    m_argv.push_back(nullptr);
  }

  [[nodiscard]] int argc() const { return static_cast<int>(m_storage.size()); }
  [[nodiscard]] char** argv() { return m_argv.data(); }

private:
  std::vector<std::string> m_storage;
  std::vector<char*> m_argv;
};

Result<CheckOptions> parse(std::initializer_list<std::string> args) {
  ArgList list(args);
  return NavCheckLauncher::parseArgs(list.argc(), list.argv());
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

constexpr const char* kLoginFacts = R"({
  "routes": [
    { "path": "/", "sourceRef": "app/page.tsx" },
    { "path": "/login", "sourceRef": "app/login/page.tsx" },
    { "path": "/dashboard", "sourceRef": "app/dashboard/page.tsx" }
  ],
  "links": [
    { "from": "/", "to": "/login" },
    { "from": "/login", "to": "/dashboard", "kind": "programmatic" }
  ]
})";

// Runs the launcher against files in a scratch directory, capturing stdout
class LauncherFixture {
public:
  explicit LauncherFixture(const std::string& name)
      : m_dir(name), m_previousLevel(core::Logger::instance().getLevel()) {
    m_launcher.setOutputStream(&m_out);
    m_launcher.setWorkingDirectory(m_dir.path());
  }

  ~LauncherFixture() { core::Logger::instance().setLevel(m_previousLevel); }

  TestDirectory& dir() { return m_dir; }
  NavCheckLauncher& launcher() { return m_launcher; }

  int run(std::initializer_list<std::string> args) {
    ArgList list(args);
    return m_launcher.run(list.argc(), list.argv());
  }

  [[nodiscard]] std::string output() const { return m_out.str(); }

  [[nodiscard]] nlohmann::json outputJson() const { return nlohmann::json::parse(m_out.str()); }

private:
  TestDirectory m_dir;
  core::LogLevel m_previousLevel;
  NavCheckLauncher m_launcher;
  std::ostringstream m_out;
};

} // namespace

// ===========================================================================
// Argument parsing
// ===========================================================================

TEST_CASE("NavCheckLauncher - parseArgs", "[launcher]") {
  SECTION("Full option set") {
    auto result = parse({"--routes", "r.json", "--journeys", "j.json", "--config", "c.json",
                         "--output", "o.json", "--entry", "/", "--entry", "/landing",
                         "--terminal", "/bye", "--workers", "4", "--timeout-ms", "250", "-v"});
    REQUIRE(result.isOk());
    const CheckOptions& opts = result.value();
    CHECK(opts.routesPath == "r.json");
    CHECK(opts.journeysPath == "j.json");
    CHECK(opts.configPath == "c.json");
    CHECK(opts.outputPath == "o.json");
    CHECK(opts.entryPoints == std::vector<std::string>{"/", "/landing"});
    CHECK(opts.terminals == std::vector<std::string>{"/bye"});
    REQUIRE(opts.workers.has_value());
    CHECK(*opts.workers == 4);
    REQUIRE(opts.timeoutMs.has_value());
    CHECK(*opts.timeoutMs == 250);
    CHECK(opts.verbose);
    CHECK_FALSE(opts.quiet);
  }

  SECTION("No arguments") {
    auto result = parse({});
    REQUIRE(result.isOk());
    CHECK(result.value().routesPath.empty());
    CHECK_FALSE(result.value().workers.has_value());
  }

  SECTION("Help and version flags") {
    CHECK(parse({"-h"}).value().help);
    CHECK(parse({"--help"}).value().help);
    CHECK(parse({"--version"}).value().version);
    CHECK(parse({"-q"}).value().quiet);
  }
}

TEST_CASE("NavCheckLauncher - parseArgs rejects bad input", "[launcher][errors]") {
  SECTION("Unknown option") {
    auto result = parse({"--frobnicate"});
    REQUIRE(result.isError());
    CHECK(result.error() == "Unknown option: --frobnicate");
  }

  SECTION("Missing value") {
    auto result = parse({"--routes"});
    REQUIRE(result.isError());
    CHECK(result.error() == "Option --routes requires a value");
  }

  SECTION("Invalid worker counts") {
    CHECK(parse({"--workers", "0"}).isError());
    CHECK(parse({"--workers", "-2"}).isError());
    CHECK(parse({"--workers", "four"}).isError());
    CHECK(parse({"--workers", "4x"}).isError());
  }

  SECTION("Invalid timeout") {
    CHECK(parse({"--timeout-ms", "-1"}).isError());
    CHECK(parse({"--timeout-ms", ""}).isError());
    CHECK(parse({"--timeout-ms", "0"}).isOk());
  }

  SECTION("Verbose and quiet conflict") {
    CHECK(parse({"--verbose", "--quiet"}).isError());
  }
}

// ===========================================================================
// Runs and exit codes
// ===========================================================================

TEST_CASE("NavCheckLauncher - exit code 0 for a clean graph", "[launcher]") {
  LauncherFixture fixture("launcher_clean");
  const std::string routes = fixture.dir().writeFile("routes.json", kLoginFacts);

  // Dead ends are reported but do not fail the check
  CHECK(fixture.run({"--routes", routes, "-q"}) == 0);

  const nlohmann::json doc = fixture.outputJson();
  CHECK(doc["orphans"].empty());
  CHECK(doc["deadEnds"].get<std::vector<std::string>>() == std::vector<std::string>{"/dashboard"});
  CHECK(doc["averageJourneyCoverage"].is_null());
}

TEST_CASE("NavCheckLauncher - exit code 1 for findings", "[launcher]") {
  LauncherFixture fixture("launcher_findings");
  const std::string routes = fixture.dir().writeFile("routes.json", kLoginFacts);

  SECTION("Orphaned route") {
    const std::string withLegacy = fixture.dir().writeFile("legacy.json", R"({
      "routes": [ { "path": "/" }, { "path": "/legacy" } ]
    })");
    CHECK(fixture.run({"--routes", withLegacy, "-q"}) == 1);
    CHECK(fixture.outputJson()["orphans"][0].get<std::string>() == "/legacy");
  }

  SECTION("Partial journey") {
    const std::string journeys = fixture.dir().writeFile(
        "journeys.json", R"({"journeys": {"backtrack": ["/dashboard", "/login"]}})");
    CHECK(fixture.run({"--routes", routes, "--journeys", journeys, "-q"}) == 1);

    const nlohmann::json doc = fixture.outputJson();
    CHECK(doc["journeys"][0]["status"].get<std::string>() == "partial");
    CHECK(doc["averageJourneyCoverage"].get<double>() == 0.0);
  }

  SECTION("Complete journey keeps the run clean") {
    const std::string journeys = fixture.dir().writeFile(
        "journeys.json", R"({"journeys": [{"name": "auth", "steps": ["/", "/login", "/dashboard"]}]})");
    CHECK(fixture.run({"--routes", routes, "--journeys", journeys, "-q"}) == 0);
  }
}

TEST_CASE("NavCheckLauncher - exit code 2 for failures", "[launcher][errors]") {
  LauncherFixture fixture("launcher_failures");
  const std::string routes = fixture.dir().writeFile("routes.json", kLoginFacts);

  SECTION("Unknown entry point reports the error code") {
    CHECK(fixture.run({"--routes", routes, "--entry", "/logn", "-q"}) == 2);
    const nlohmann::json doc = fixture.outputJson();
    CHECK(doc["error"]["code"].get<std::string>() == "E103");
    CHECK(doc["error"]["subject"].get<std::string>() == "/logn");
    CHECK(doc["error"]["suggestions"][0].get<std::string>() == "/login");
  }

  SECTION("Dangling link") {
    const std::string dangling = fixture.dir().writeFile("dangling.json", R"({
      "routes": [ { "path": "/" } ],
      "links": [ { "from": "/", "to": "/gone" } ]
    })");
    CHECK(fixture.run({"--routes", dangling, "-q"}) == 2);
    CHECK(fixture.outputJson()["error"]["code"].get<std::string>() == "E102");
  }

  SECTION("Missing --routes") {
    CHECK(fixture.run({"-q"}) == 2);
    CHECK(fixture.outputJson()["error"]["code"].get<std::string>() == "USAGE");
  }

  SECTION("Unreadable route facts") {
    CHECK(fixture.run({"--routes", fixture.dir().file("absent.json"), "-q"}) == 2);
    CHECK(fixture.outputJson()["error"]["code"].get<std::string>() == "INPUT");
  }

  SECTION("Invalid journey registry") {
    const std::string journeys =
        fixture.dir().writeFile("journeys.json", R"({"journeys": {"solo": ["/"]}})");
    CHECK(fixture.run({"--routes", routes, "--journeys", journeys, "-q"}) == 2);
    CHECK(fixture.outputJson()["error"]["code"].get<std::string>() == "INPUT");
  }

  SECTION("Invalid configuration file") {
    const std::string config =
        fixture.dir().writeFile("bad.json", R"({"execution": {"journeyWorkers": 0}})");
    CHECK(fixture.run({"--routes", routes, "--config", config, "-q"}) == 2);
    CHECK(fixture.outputJson()["error"]["code"].get<std::string>() == "CONFIG");
  }

  SECTION("Argument errors") {
    CHECK(fixture.run({"--routes"}) == 2);
    CHECK(fixture.output().empty());
  }
}

TEST_CASE("NavCheckLauncher - configuration layering", "[launcher][config]") {
  LauncherFixture fixture("launcher_layering");
  const std::string facts = fixture.dir().writeFile("routes.json", R"({
    "routes": [ { "path": "/start" }, { "path": "/next" }, { "path": "/" } ],
    "links": [ { "from": "/start", "to": "/next" }, { "from": "/next", "to": "/" } ]
  })");

  SECTION("Implicit navgraph.json in the working directory") {
    fixture.dir().writeFile("navgraph.json", R"({"entryPoints": ["/start"]})");
    CHECK(fixture.run({"--routes", facts, "-q"}) == 0);
    CHECK(fixture.launcher().configManager().getConfig().navigation.entryPoints ==
          analysis::EntryPointSet{"/start"});
  }

  SECTION("Without a config file the default entry orphans the rest") {
    CHECK(fixture.run({"--routes", facts, "-q"}) == 1);
  }

  SECTION("Registry declarations override the config file") {
    fixture.dir().writeFile("navgraph.json", R"({"entryPoints": ["/"]})");
    const std::string journeys =
        fixture.dir().writeFile("journeys.json", R"({"journeys": [], "entryPoints": ["/start"]})");
    CHECK(fixture.run({"--routes", facts, "--journeys", journeys, "-q"}) == 0);
  }

  SECTION("Command line overrides everything") {
    fixture.dir().writeFile("navgraph.json", R"({"entryPoints": ["/start"]})");
    CHECK(fixture.run({"--routes", facts, "--entry", "/next", "-q"}) == 1);
    CHECK(fixture.outputJson()["orphans"].get<std::vector<std::string>>() ==
          std::vector<std::string>{"/start"});
  }

  SECTION("--workers and --timeout-ms reach the configuration") {
    fixture.dir().writeFile("navgraph.json", R"({"entryPoints": ["/start"]})");
    CHECK(fixture.run({"--routes", facts, "--workers", "3", "--timeout-ms", "60000", "-q"}) == 0);
    const AnalysisConfig& config = fixture.launcher().configManager().getConfig();
    CHECK(config.execution.journeyWorkers == 3);
    CHECK(config.execution.timeoutMs == 60000);
  }
}

TEST_CASE("NavCheckLauncher - huge timeouts mean no limit", "[launcher][config]") {
  LauncherFixture fixture("launcher_huge_timeout");
  const std::string routes = fixture.dir().writeFile("routes.json", kLoginFacts);

  SECTION("Command line") {
    CHECK(fixture.run({"--routes", routes, "--timeout-ms", "9223372036854775807", "-q"}) == 0);
  }

  SECTION("Config file") {
    const std::string config = fixture.dir().writeFile(
        "navgraph.json", R"({"execution": {"timeoutMs": 10000000000000}})");
    CHECK(fixture.run({"--routes", routes, "--config", config, "-q"}) == 0);
  }
}

TEST_CASE("NavCheckLauncher - output file", "[launcher]") {
  LauncherFixture fixture("launcher_output");
  const std::string routes = fixture.dir().writeFile("routes.json", kLoginFacts);
  const std::string target = fixture.dir().file("out/result.json");

  CHECK(fixture.run({"--routes", routes, "--output", target, "-q"}) == 0);
  CHECK(fixture.output().empty());

  const nlohmann::json doc = nlohmann::json::parse(fixture.dir().readFile("out/result.json"));
  CHECK(doc["reachable"].get<std::vector<std::string>>() ==
        std::vector<std::string>{"/", "/login"});
}

TEST_CASE("NavCheckLauncher - help and version", "[launcher]") {
  LauncherFixture fixture("launcher_help");

  CHECK(fixture.run({"--help"}) == 0);
  CHECK(contains(fixture.output(), "Usage:"));
  CHECK(contains(fixture.output(), "--routes <file>"));

  std::ostringstream version;
  fixture.launcher().setOutputStream(&version);
  CHECK(fixture.run({"--version"}) == 0);
  CHECK(version.str() == std::string("navgraph_check ") + NAVGRAPH_VERSION + "\n");
}

TEST_CASE("NavCheckLauncher - exitCodeFor", "[launcher]") {
  analysis::AnalysisRequest request;
  request.routes = {{"/", "", graph::RouteKind::Static}, {"/a", "", graph::RouteKind::Static}};
  request.links = {{"/", "/a", graph::LinkKind::Navigational}};
  request.entryPoints = {"/"};

  analysis::NavigationAnalyzer analyzer;

  SECTION("Dead ends alone are clean") {
    auto outcome = analyzer.run(request);
    REQUIRE(outcome.isOk());
    CHECK(NavCheckLauncher::exitCodeFor(outcome.value()) == ExitCode::Clean);
  }

  SECTION("Orphans are findings") {
    request.routes.push_back({"/b", "", graph::RouteKind::Static});
    auto outcome = analyzer.run(request);
    REQUIRE(outcome.isOk());
    CHECK(NavCheckLauncher::exitCodeFor(outcome.value()) == ExitCode::FindingsPresent);
  }

  SECTION("Partial journeys are findings") {
    request.journeys = std::vector<analysis::Journey>{{"back", {"/a", "/"}}};
    auto outcome = analyzer.run(request);
    REQUIRE(outcome.isOk());
    CHECK(NavCheckLauncher::exitCodeFor(outcome.value()) == ExitCode::FindingsPresent);
  }
}
