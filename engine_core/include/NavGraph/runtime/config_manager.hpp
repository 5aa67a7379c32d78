#pragma once

/**
 * @file config_manager.hpp
 * @brief Configuration Manager - layered analysis configuration
 *
 * Layers, lowest precedence first:
 * 1. Built-in defaults (AnalysisConfig)
 * 2. navgraph.json config file
 * 3. Entry point / terminal declarations from route facts or the journey
 *    registry
 * 4. Command-line overrides (applied by the launcher)
 */

#include "NavGraph/core/result.hpp"
#include "NavGraph/runtime/analysis_config.hpp"
#include <optional>
#include <string>

namespace NavGraph::runtime {

class ConfigManager {
public:
  static constexpr const char* kDefaultConfigFile = "navgraph.json";

  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  /**
   * @brief Load and merge a config file over the current configuration
   * @return Success or error message naming the offending key
   */
  Result<void> loadFromFile(const std::string& path);

  /**
   * @brief Merge a JSON config document over the current configuration
   */
  Result<void> parseJson(const std::string& json);

  /**
   * @brief Override entry points / terminals declared alongside the facts
   *
   * nullopt leaves the current value untouched.
   */
  void applyDeclarations(const std::optional<analysis::EntryPointSet>& entryPoints,
                         const std::optional<analysis::AllowedTerminalSet>& terminals);

  /**
   * @brief Configure the global logger from the logging section
   */
  Result<void> applyLogging() const;

  [[nodiscard]] const AnalysisConfig& getConfig() const { return m_config; }
  AnalysisConfig& getConfigMutable() { return m_config; }

  void resetToDefaults();

private:
  AnalysisConfig m_config;
};

} // namespace NavGraph::runtime
