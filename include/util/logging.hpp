// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace devicelink {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * ("default", "device", "store", "stats", "app").
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
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "devicelink.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown fall back to a silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "device", "store", "stats")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace devicelink

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  devicelink::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  devicelink::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  devicelink::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  devicelink::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  devicelink::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_DEV_TRACE(...)                                                     \
  devicelink::util::LogManager::GetLogger("device")->trace(__VA_ARGS__)
#define LOG_DEV_DEBUG(...)                                                     \
  devicelink::util::LogManager::GetLogger("device")->debug(__VA_ARGS__)
#define LOG_DEV_INFO(...)                                                      \
  devicelink::util::LogManager::GetLogger("device")->info(__VA_ARGS__)
#define LOG_DEV_WARN(...)                                                      \
  devicelink::util::LogManager::GetLogger("device")->warn(__VA_ARGS__)
#define LOG_DEV_ERROR(...)                                                     \
  devicelink::util::LogManager::GetLogger("device")->error(__VA_ARGS__)

#define LOG_STORE_TRACE(...)                                                   \
  devicelink::util::LogManager::GetLogger("store")->trace(__VA_ARGS__)
#define LOG_STORE_DEBUG(...)                                                   \
  devicelink::util::LogManager::GetLogger("store")->debug(__VA_ARGS__)
#define LOG_STORE_INFO(...)                                                    \
  devicelink::util::LogManager::GetLogger("store")->info(__VA_ARGS__)
#define LOG_STORE_WARN(...)                                                    \
  devicelink::util::LogManager::GetLogger("store")->warn(__VA_ARGS__)
#define LOG_STORE_ERROR(...)                                                   \
  devicelink::util::LogManager::GetLogger("store")->error(__VA_ARGS__)

#define LOG_STATS_DEBUG(...)                                                   \
  devicelink::util::LogManager::GetLogger("stats")->debug(__VA_ARGS__)
#define LOG_STATS_INFO(...)                                                    \
  devicelink::util::LogManager::GetLogger("stats")->info(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  devicelink::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  devicelink::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  devicelink::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
