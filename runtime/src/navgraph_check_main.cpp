/**
 * @file navgraph_check_main.cpp
 * @brief navgraph_check - Main Entry Point
 *
 * Validates a site's navigation graph: orphaned routes, dead ends and
 * declared user journeys, with a 0-10 health score for CI gating.
 *
 * Usage:
 *   navgraph_check --routes routes.json
 *   navgraph_check --routes routes.json --journeys journeys.json
 *   navgraph_check --routes routes.json --entry / --entry /admin --output report.json
 */

#include "NavGraph/runtime/nav_check_launcher.hpp"

int main(int argc, char* argv[]) {
  NavGraph::runtime::NavCheckLauncher launcher;
  return launcher.run(argc, argv);
}
