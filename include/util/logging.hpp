// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace blockledger {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One named logger per component (default, chain, store, rpc, app), all
 * sharing the same sinks. Components are addressed by name so that the
 * daemon can raise a single component to trace with --debug=<component>.
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
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  // Flush and drop all loggers
  static void Shutdown();

  /**
   * Get logger for specific component
   * Auto-initializes with defaults if Initialize() was never called.
   * Unknown components resolve to the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for one component; returns false for unknown components
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace blockledger

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  blockledger::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  blockledger::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  blockledger::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  blockledger::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  blockledger::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  blockledger::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  blockledger::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  blockledger::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  blockledger::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  blockledger::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_STORE_DEBUG(...)                                                   \
  blockledger::util::LogManager::GetLogger("store")->debug(__VA_ARGS__)
#define LOG_STORE_INFO(...)                                                    \
  blockledger::util::LogManager::GetLogger("store")->info(__VA_ARGS__)
#define LOG_STORE_WARN(...)                                                    \
  blockledger::util::LogManager::GetLogger("store")->warn(__VA_ARGS__)
#define LOG_STORE_ERROR(...)                                                   \
  blockledger::util::LogManager::GetLogger("store")->error(__VA_ARGS__)

#define LOG_RPC_DEBUG(...)                                                     \
  blockledger::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...)                                                      \
  blockledger::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  blockledger::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  blockledger::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)
