#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide logger for the Novelist editor
 */

#include <cstdio>
#include <format>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace Novelist::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;
  [[nodiscard]] bool isEnabled(LogLevel level) const;

  /**
   * @brief Mirror all records into a file (appending)
   * @return false if the file could not be opened
   */
  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  /// Suppress stderr output; callbacks and the log file still receive records
  void setConsoleEnabled(bool enabled);

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  void addLogCallback(LogCallback callback);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

  // Format-string overloads; the message is only built when the level is enabled
  template <typename... Args> void trace(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Trace)) {
      trace(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
    }
  }

  template <typename... Args> void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Debug)) {
      debug(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
    }
  }

  template <typename... Args> void info(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Info)) {
      info(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
    }
  }

  template <typename... Args> void warning(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Warning)) {
      warning(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
    }
  }

  template <typename... Args> void error(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Error)) {
      error(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
    }
  }

  template <typename... Args> void fatal(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Fatal)) {
      fatal(std::string_view(std::format(fmt, std::forward<Args>(args)...)));
    }
  }

  [[nodiscard]] static const char* levelToString(LogLevel level);

private:
  Logger();
  ~Logger();

  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  bool m_consoleEnabled = true;
  std::vector<LogCallback> m_callbacks;
};

} // namespace Novelist::core

#define NOVELIST_LOG_TRACE(...) ::Novelist::core::Logger::instance().trace(__VA_ARGS__)
#define NOVELIST_LOG_DEBUG(...) ::Novelist::core::Logger::instance().debug(__VA_ARGS__)
#define NOVELIST_LOG_INFO(...) ::Novelist::core::Logger::instance().info(__VA_ARGS__)
#define NOVELIST_LOG_WARN(...) ::Novelist::core::Logger::instance().warning(__VA_ARGS__)
#define NOVELIST_LOG_ERROR(...) ::Novelist::core::Logger::instance().error(__VA_ARGS__)
#define NOVELIST_LOG_FATAL(...) ::Novelist::core::Logger::instance().fatal(__VA_ARGS__)
