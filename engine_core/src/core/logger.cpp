#include "NavGraph/core/logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#if defined(_WIN32)
#include <io.h>
#define NAVGRAPH_ISATTY _isatty
#define NAVGRAPH_FILENO _fileno
#else
#include <unistd.h>
#define NAVGRAPH_ISATTY isatty
#define NAVGRAPH_FILENO fileno
#endif

namespace NavGraph::core {

std::optional<LogLevel> parseLogLevel(std::string_view name) {
  if (name == "trace")
    return LogLevel::Trace;
  if (name == "debug")
    return LogLevel::Debug;
  if (name == "info")
    return LogLevel::Info;
  if (name == "warning" || name == "warn")
    return LogLevel::Warning;
  if (name == "error")
    return LogLevel::Error;
  if (name == "fatal")
    return LogLevel::Fatal;
  if (name == "off")
    return LogLevel::Off;
  return std::nullopt;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger()
    : m_level(LogLevel::Info), m_useColors(NAVGRAPH_ISATTY(NAVGRAPH_FILENO(stderr)) != 0) {}

Logger::~Logger() {
  closeOutputFile();
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

void Logger::setUseColors(bool useColors) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_useColors = useColors && NAVGRAPH_ISATTY(NAVGRAPH_FILENO(stderr)) != 0;
}

bool Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  return m_fileStream.is_open();
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.flush();
    m_fileStream.close();
  }
}

void Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.push_back(std::move(callback));
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

bool Logger::isEnabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return level != LogLevel::Off && level >= m_level;
}

void Logger::log(LogLevel level, std::string_view message) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (level == LogLevel::Off || level < m_level) {
    return;
  }

  std::string line = getCurrentTimestamp() + " [" + levelToString(level) + "] ";
  line.append(message);

  // Diagnostics go to stderr so stdout stays free for the JSON result
  if (m_useColors) {
    std::cerr << levelToColor(level) << line << "\033[0m" << '\n';
  } else {
    std::cerr << line << '\n';
  }

  if (m_fileStream.is_open()) {
    m_fileStream << line << '\n';
    if (level >= LogLevel::Error) {
      m_fileStream.flush();
    }
  }

  if (!m_callbacks.empty()) {
    std::string text(message);
    for (const auto& callback : m_callbacks) {
      callback(level, text);
    }
  }
}

void Logger::trace(std::string_view message) {
  log(LogLevel::Trace, message);
}

void Logger::debug(std::string_view message) {
  log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
  log(LogLevel::Info, message);
}

void Logger::warning(std::string_view message) {
  log(LogLevel::Warning, message);
}

void Logger::error(std::string_view message) {
  log(LogLevel::Error, message);
}

void Logger::fatal(std::string_view message) {
  log(LogLevel::Fatal, message);
}

const char* Logger::levelToString(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

const char* Logger::levelToColor(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
    return "\033[31m";
  case LogLevel::Fatal:
    return "\033[1;31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  std::ostringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

} // namespace NavGraph::core
