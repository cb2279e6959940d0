#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,
  METRICS,

  // IO sub-components
  IO_COLLECTOR,
  IO_DISPATCH,
  IO_DATABASE,
  IO_WEB,
  IO_LOCATION,

  // Detection sub-components
  DETECTION_WINDOW,
  DETECTION_EVAL,

  // Alerting sub-components
  ALERT_DEDUP,
  ALERT_DISPATCH,

  // Scheduler sub-components
  SCHEDULER_TASK,
  SCHEDULER_LIFECYCLE,

  SIMULATION
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    log_levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return level >= LogLevel::WARN;

    return level >= it->second;
  }

private:
  LogManager() = default;
  mutable std::shared_mutex mutex_;
  std::map<LogComponent, LogLevel> log_levels_;
};

// --- The Core Logging Macro ---
// A macro so that when `should_log` returns false the message expression is
// never evaluated.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::tm utc_tm{};                                                        \
      gmtime_r(&time_t_now, &utc_tm);                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S") << '.'                \
          << std::setw(3) << std::setfill('0') << ms.count() << "Z ";          \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      oss << '\n';                                                             \
      std::cout << oss.str() << std::flush;                                    \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::METRICS:
    return "METRICS";
  case LogComponent::IO_COLLECTOR:
    return "IO.COLLECTOR";
  case LogComponent::IO_DISPATCH:
    return "IO.DISPATCH";
  case LogComponent::IO_DATABASE:
    return "IO.DATABASE";
  case LogComponent::IO_WEB:
    return "IO.WEB";
  case LogComponent::IO_LOCATION:
    return "IO.LOCATION";
  case LogComponent::DETECTION_WINDOW:
    return "DETECTION.WINDOW";
  case LogComponent::DETECTION_EVAL:
    return "DETECTION.EVAL";
  case LogComponent::ALERT_DEDUP:
    return "ALERT.DEDUP";
  case LogComponent::ALERT_DISPATCH:
    return "ALERT.DISPATCH";
  case LogComponent::SCHEDULER_TASK:
    return "SCHEDULER.TASK";
  case LogComponent::SCHEDULER_LIFECYCLE:
    return "SCHEDULER.LIFECYCLE";
  case LogComponent::SIMULATION:
    return "SIMULATION";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
