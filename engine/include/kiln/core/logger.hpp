#pragma once

/**
 * @file logger.hpp
 * @brief Centralized logging facade using spdlog
 */

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <cpptrace/basic.hpp>

namespace kiln::core {

// Named channel (Asset, Scene, Render, RHI) sharing the console sink
class LogCategory {
public:
  explicit LogCategory(const char *name) : m_name(name) {}

  const std::string &name() const { return m_name; }

  template <typename... Args>
  void trace(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->trace(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->error(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->critical(fmt, std::forward<Args>(args)...);
  }

private:
  friend class Logger;

  std::string m_name;
  std::shared_ptr<spdlog::logger> m_logger;
};

class Logger {
public:
  // Static-only interface
  Logger() = delete;
  ~Logger() = delete;
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Initialize logger (call once on startup)
  static void init(const std::string &pattern = "[%H:%M:%S] [%n] [%l] %v");
  static void shutdown();

  static void setLevel(spdlog::level::level_enum level);

  static LogCategory Asset;
  static LogCategory Scene;
  static LogCategory Render;
  static LogCategory RHI;

  // Logging interface (C++20 format strings)
  template <typename... Args>
  static void trace(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->trace(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger) {
      sLogger->error(fmt, std::forward<Args>(args)...);
    }
  }

  template <typename... Args>
  static void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger) {
      sLogger->critical(fmt, std::forward<Args>(args)...);
    }
  }

  template <typename... Args>
  static void fatal(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger) {
      sLogger->critical(fmt, std::forward<Args>(args)...);
      sLogger->critical("Stack Trace:\n{}",
                        cpptrace::generate_trace().to_string());
    }
  }

private:
  static std::shared_ptr<spdlog::logger> sLogger;
};

} // namespace kiln::core
