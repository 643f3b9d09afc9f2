// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace lansync {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "lansync.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "service", "server")
   *
   * Auto-initializes if not initialized. Unknown names return the default
   * logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (default, app, network, service, server,
   * client, connection)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);

  // True if the component has a dedicated logger
  static bool IsKnownComponent(const std::string &component);
};

} // namespace util
} // namespace lansync

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  lansync::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  lansync::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  lansync::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  lansync::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  lansync::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  lansync::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  lansync::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  lansync::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  lansync::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  lansync::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_SERVICE_DEBUG(...)                                                 \
  lansync::util::LogManager::GetLogger("service")->debug(__VA_ARGS__)
#define LOG_SERVICE_INFO(...)                                                  \
  lansync::util::LogManager::GetLogger("service")->info(__VA_ARGS__)
#define LOG_SERVICE_WARN(...)                                                  \
  lansync::util::LogManager::GetLogger("service")->warn(__VA_ARGS__)
#define LOG_SERVICE_ERROR(...)                                                 \
  lansync::util::LogManager::GetLogger("service")->error(__VA_ARGS__)

#define LOG_SERVER_DEBUG(...)                                                  \
  lansync::util::LogManager::GetLogger("server")->debug(__VA_ARGS__)
#define LOG_SERVER_INFO(...)                                                   \
  lansync::util::LogManager::GetLogger("server")->info(__VA_ARGS__)
#define LOG_SERVER_ERROR(...)                                                  \
  lansync::util::LogManager::GetLogger("server")->error(__VA_ARGS__)

#define LOG_CLIENT_DEBUG(...)                                                  \
  lansync::util::LogManager::GetLogger("client")->debug(__VA_ARGS__)
#define LOG_CLIENT_INFO(...)                                                   \
  lansync::util::LogManager::GetLogger("client")->info(__VA_ARGS__)
#define LOG_CLIENT_ERROR(...)                                                  \
  lansync::util::LogManager::GetLogger("client")->error(__VA_ARGS__)

#define LOG_CONN_DEBUG(...)                                                    \
  lansync::util::LogManager::GetLogger("connection")->debug(__VA_ARGS__)
#define LOG_CONN_INFO(...)                                                     \
  lansync::util::LogManager::GetLogger("connection")->info(__VA_ARGS__)
#define LOG_CONN_ERROR(...)                                                    \
  lansync::util::LogManager::GetLogger("connection")->error(__VA_ARGS__)
