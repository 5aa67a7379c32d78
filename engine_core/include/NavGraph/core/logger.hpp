#pragma once

#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace NavGraph::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 * "fatal", "off"); "warn" is accepted as an alias
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  void setUseColors(bool useColors);

  /**
   * @brief Mirror log output into a file (appends)
   * @return false if the file could not be opened
   */
  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  void addLogCallback(LogCallback callback);
  void clearLogCallbacks();

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

  // Template overloads for format strings with variadic arguments
  template <typename... Args> void trace(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Trace)) {
      trace(std::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args> void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Debug)) {
      debug(std::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args> void info(std::format_string<Args...> fmt, Args&&... args) {
    info(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void warning(std::format_string<Args...> fmt, Args&&... args) {
    warning(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void error(std::format_string<Args...> fmt, Args&&... args) {
    error(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void fatal(std::format_string<Args...> fmt, Args&&... args) {
    fatal(std::format(fmt, std::forward<Args>(args)...));
  }

private:
  Logger();
  ~Logger();

  void log(LogLevel level, std::string_view message);

  [[nodiscard]] bool isEnabled(LogLevel level) const;
  [[nodiscard]] const char* levelToString(LogLevel level) const;
  [[nodiscard]] const char* levelToColor(LogLevel level) const;
  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  std::vector<LogCallback> m_callbacks;
};

} // namespace NavGraph::core

#define NAVGRAPH_LOG_TRACE(...) ::NavGraph::core::Logger::instance().trace(__VA_ARGS__)
#define NAVGRAPH_LOG_DEBUG(...) ::NavGraph::core::Logger::instance().debug(__VA_ARGS__)
#define NAVGRAPH_LOG_INFO(...) ::NavGraph::core::Logger::instance().info(__VA_ARGS__)
#define NAVGRAPH_LOG_WARN(...) ::NavGraph::core::Logger::instance().warning(__VA_ARGS__)
#define NAVGRAPH_LOG_ERROR(...) ::NavGraph::core::Logger::instance().error(__VA_ARGS__)
#define NAVGRAPH_LOG_FATAL(...) ::NavGraph::core::Logger::instance().fatal(__VA_ARGS__)
