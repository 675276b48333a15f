// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace bridgerelay {
namespace util {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/**
 * Logging factory around spdlog
 *
 * Creates one logger per component ("default", "sync", "bridge",
 * "network", "app") sharing the same sinks. Components never look loggers up
 * themselves: the application obtains them here and hands them to each
 * component's constructor.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, also log to a rotating file
   * @param log_file_path Path to log file (if log_to_file is true)
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Flush and drop all loggers
   * Loggers already handed out stay valid but are no longer registered.
   */
  static void Shutdown();

  /**
   * Get logger for a component
   * Auto-initializes with defaults. Unknown components get the default
   * logger. Never returns nullptr.
   */
  static LoggerPtr GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

// Logger that discards everything (for components constructed without one)
LoggerPtr NullLogger();

// Returns `logger` or NullLogger() when it is empty
inline LoggerPtr OrNullLogger(LoggerPtr logger) {
  return logger ? std::move(logger) : NullLogger();
}

} // namespace util
} // namespace bridgerelay
