// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace blockdag {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component, all sharing the same sinks:
 *   default  - application level messages
 *   network  - message dispatch
 *   sync     - peer-facing sync flows (anticone, pruning point)
 *   chain    - DAG index, stores, virtual state and pruning
 *   pipeline - header/body stages, dependency manager, throughput monitor
 *   app      - simulator and tools
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
   * @param log_to_file If true, log to a rotating file instead of stdout
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
   * @param name Component name (e.g., "network", "sync", "chain")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);

  /**
   * Names of all component loggers
   */
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace blockdag

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  blockdag::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  blockdag::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  blockdag::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  blockdag::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  blockdag::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  blockdag::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  blockdag::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  blockdag::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  blockdag::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  blockdag::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_SYNC_TRACE(...)                                                    \
  blockdag::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...)                                                    \
  blockdag::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...)                                                     \
  blockdag::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...)                                                     \
  blockdag::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...)                                                    \
  blockdag::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  blockdag::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  blockdag::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  blockdag::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  blockdag::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  blockdag::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_PIPE_TRACE(...)                                                    \
  blockdag::util::LogManager::GetLogger("pipeline")->trace(__VA_ARGS__)
#define LOG_PIPE_DEBUG(...)                                                    \
  blockdag::util::LogManager::GetLogger("pipeline")->debug(__VA_ARGS__)
#define LOG_PIPE_INFO(...)                                                     \
  blockdag::util::LogManager::GetLogger("pipeline")->info(__VA_ARGS__)
#define LOG_PIPE_WARN(...)                                                     \
  blockdag::util::LogManager::GetLogger("pipeline")->warn(__VA_ARGS__)
#define LOG_PIPE_ERROR(...)                                                    \
  blockdag::util::LogManager::GetLogger("pipeline")->error(__VA_ARGS__)
