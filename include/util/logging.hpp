// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace draftops {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * (protocol, draft, network, resolver, app).
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
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "protocol", "draft", "network")
   *
   * Auto-initializes if not initialized. Unknown components get the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (protocol, draft, network, resolver, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace draftops

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  draftops::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  draftops::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  draftops::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  draftops::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  draftops::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_PROTO_TRACE(...)                                                   \
  draftops::util::LogManager::GetLogger("protocol")->trace(__VA_ARGS__)
#define LOG_PROTO_DEBUG(...)                                                   \
  draftops::util::LogManager::GetLogger("protocol")->debug(__VA_ARGS__)
#define LOG_PROTO_INFO(...)                                                    \
  draftops::util::LogManager::GetLogger("protocol")->info(__VA_ARGS__)
#define LOG_PROTO_WARN(...)                                                    \
  draftops::util::LogManager::GetLogger("protocol")->warn(__VA_ARGS__)
#define LOG_PROTO_ERROR(...)                                                   \
  draftops::util::LogManager::GetLogger("protocol")->error(__VA_ARGS__)

#define LOG_DRAFT_TRACE(...)                                                   \
  draftops::util::LogManager::GetLogger("draft")->trace(__VA_ARGS__)
#define LOG_DRAFT_DEBUG(...)                                                   \
  draftops::util::LogManager::GetLogger("draft")->debug(__VA_ARGS__)
#define LOG_DRAFT_INFO(...)                                                    \
  draftops::util::LogManager::GetLogger("draft")->info(__VA_ARGS__)
#define LOG_DRAFT_WARN(...)                                                    \
  draftops::util::LogManager::GetLogger("draft")->warn(__VA_ARGS__)
#define LOG_DRAFT_ERROR(...)                                                   \
  draftops::util::LogManager::GetLogger("draft")->error(__VA_ARGS__)

#define LOG_NET_TRACE(...)                                                     \
  draftops::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  draftops::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  draftops::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  draftops::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  draftops::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_RESOLVER_DEBUG(...)                                                \
  draftops::util::LogManager::GetLogger("resolver")->debug(__VA_ARGS__)
#define LOG_RESOLVER_INFO(...)                                                 \
  draftops::util::LogManager::GetLogger("resolver")->info(__VA_ARGS__)
#define LOG_RESOLVER_WARN(...)                                                 \
  draftops::util::LogManager::GetLogger("resolver")->warn(__VA_ARGS__)
#define LOG_RESOLVER_ERROR(...)                                                \
  draftops::util::LogManager::GetLogger("resolver")->error(__VA_ARGS__)
