/**
 * @file config_manager.cpp
 * @brief Configuration Manager implementation
 */

#include "NavGraph/runtime/config_manager.hpp"
#include "NavGraph/core/logger.hpp"
#include "../io/json_detail.hpp"

#include <nlohmann/json.hpp>

namespace NavGraph::runtime {

namespace {

Result<void> readInteger(const nlohmann::json& section, const char* key, const std::string& path,
                         i64 minValue, i64& out) {
  auto it = section.find(key);
  if (it == section.end() || it->is_null()) {
    return Result<void>::ok();
  }
  if (!it->is_number_integer()) {
    return Result<void>::error("'" + path + "." + key + "' must be an integer");
  }
  i64 value = it->get<i64>();
  if (value < minValue) {
    return Result<void>::error("'" + path + "." + key + "' must be >= " +
                               std::to_string(minValue));
  }
  out = value;
  return Result<void>::ok();
}

Result<void> readBool(const nlohmann::json& section, const char* key, const std::string& path,
                      bool& out) {
  auto it = section.find(key);
  if (it == section.end() || it->is_null()) {
    return Result<void>::ok();
  }
  if (!it->is_boolean()) {
    return Result<void>::error("'" + path + "." + key + "' must be a boolean");
  }
  out = it->get<bool>();
  return Result<void>::ok();
}

Result<const nlohmann::json*> findSection(const nlohmann::json& doc, const char* name) {
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null()) {
    return Result<const nlohmann::json*>::ok(nullptr);
  }
  if (!it->is_object()) {
    return Result<const nlohmann::json*>::error(std::string("'") + name +
                                                "' must be an object");
  }
  return Result<const nlohmann::json*>::ok(&*it);
}

} // namespace

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::loadFromFile(const std::string& path) {
  auto content = io::detail::readFileToString(path);
  if (content.isError()) {
    return Result<void>::error(content.error());
  }
  auto result = parseJson(content.value());
  if (result.isError()) {
    return Result<void>::error(path + ": " + result.error());
  }
  NAVGRAPH_LOG_DEBUG("Configuration loaded from {}", path);
  return Result<void>::ok();
}

Result<void> ConfigManager::parseJson(const std::string& json) {
  auto docResult = io::detail::parseDocument(json);
  if (docResult.isError()) {
    return Result<void>::error(docResult.error());
  }
  const nlohmann::json& doc = docResult.value();

  // Parse into a copy so a bad file leaves the current configuration intact
  AnalysisConfig config = m_config;

  auto entryPoints = io::detail::optionalPathSet(doc, "entryPoints");
  if (entryPoints.isError()) {
    return Result<void>::error(entryPoints.error());
  }
  if (entryPoints.value()) {
    config.navigation.entryPoints = *entryPoints.value();
  }

  auto terminals = io::detail::optionalPathSet(doc, "allowedTerminals");
  if (terminals.isError()) {
    return Result<void>::error(terminals.error());
  }
  if (terminals.value()) {
    config.navigation.allowedTerminals = *terminals.value();
  }

  auto execution = findSection(doc, "execution");
  if (execution.isError()) {
    return Result<void>::error(execution.error());
  }
  if (const nlohmann::json* section = execution.value()) {
    i64 workers = config.execution.journeyWorkers;
    auto workersResult = readInteger(*section, "journeyWorkers", "execution", 1, workers);
    if (workersResult.isError()) {
      return workersResult;
    }
    config.execution.journeyWorkers = static_cast<u32>(workers);

    auto timeoutResult =
        readInteger(*section, "timeoutMs", "execution", 0, config.execution.timeoutMs);
    if (timeoutResult.isError()) {
      return timeoutResult;
    }
  }

  auto logging = findSection(doc, "logging");
  if (logging.isError()) {
    return Result<void>::error(logging.error());
  }
  if (const nlohmann::json* section = logging.value()) {
    auto level = io::detail::optionalString(*section, "level", "logging",
                                            config.logging.logLevel);
    if (level.isError()) {
      return Result<void>::error(level.error());
    }
    if (!core::parseLogLevel(level.value())) {
      return Result<void>::error("'logging.level' has unknown value '" + level.value() + "'");
    }
    config.logging.logLevel = level.value();

    auto file = io::detail::optionalString(*section, "file", "logging", config.logging.logFile);
    if (file.isError()) {
      return Result<void>::error(file.error());
    }
    config.logging.logFile = file.value();

    auto colorsResult = readBool(*section, "colors", "logging", config.logging.colors);
    if (colorsResult.isError()) {
      return colorsResult;
    }
  }

  auto output = findSection(doc, "output");
  if (output.isError()) {
    return Result<void>::error(output.error());
  }
  if (const nlohmann::json* section = output.value()) {
    auto path = io::detail::optionalString(*section, "path", "output", config.output.path);
    if (path.isError()) {
      return Result<void>::error(path.error());
    }
    config.output.path = path.value();

    i64 indent = config.output.indent;
    auto indentResult = readInteger(*section, "indent", "output", -1, indent);
    if (indentResult.isError()) {
      return indentResult;
    }
    config.output.indent = static_cast<i32>(indent);
  }

  m_config = std::move(config);
  return Result<void>::ok();
}

void ConfigManager::applyDeclarations(
    const std::optional<analysis::EntryPointSet>& entryPoints,
    const std::optional<analysis::AllowedTerminalSet>& terminals) {
  if (entryPoints) {
    m_config.navigation.entryPoints = *entryPoints;
  }
  if (terminals) {
    m_config.navigation.allowedTerminals = *terminals;
  }
}

Result<void> ConfigManager::applyLogging() const {
  auto level = core::parseLogLevel(m_config.logging.logLevel);
  if (!level) {
    return Result<void>::error("Unknown log level '" + m_config.logging.logLevel + "'");
  }

  auto& logger = core::Logger::instance();
  logger.setLevel(*level);
  logger.setUseColors(m_config.logging.colors);

  if (!m_config.logging.logFile.empty()) {
    if (!logger.setOutputFile(m_config.logging.logFile)) {
      return Result<void>::error("Cannot open log file: " + m_config.logging.logFile);
    }
  }
  return Result<void>::ok();
}

void ConfigManager::resetToDefaults() {
  m_config = AnalysisConfig();
}

} // namespace NavGraph::runtime
