// Copyright (c) 2025 The Equirelay Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace equirelay {
namespace util {

/**
 * Logging wrapper around spdlog
 *
 * One named logger per component, all sharing the same sinks. Components:
 * default, chain, crypto, verify, app.
 *
 * Initialization happens exactly once (std::call_once); GetLogger()
 * auto-initializes with console output at "info" if nobody called
 * Initialize() first.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Flush and drop all loggers
   */
  static void Shutdown();

  /**
   * Get logger for a component. Unknown names fall back to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a single component
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);

  /**
   * Names of all known components
   */
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace equirelay

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  equirelay::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  equirelay::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  equirelay::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  equirelay::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  equirelay::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  equirelay::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  equirelay::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  equirelay::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  equirelay::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  equirelay::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_CRYPTO_TRACE(...)                                                  \
  equirelay::util::LogManager::GetLogger("crypto")->trace(__VA_ARGS__)
#define LOG_CRYPTO_DEBUG(...)                                                  \
  equirelay::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)

#define LOG_VERIFY_TRACE(...)                                                  \
  equirelay::util::LogManager::GetLogger("verify")->trace(__VA_ARGS__)
#define LOG_VERIFY_DEBUG(...)                                                  \
  equirelay::util::LogManager::GetLogger("verify")->debug(__VA_ARGS__)
#define LOG_VERIFY_INFO(...)                                                   \
  equirelay::util::LogManager::GetLogger("verify")->info(__VA_ARGS__)
#define LOG_VERIFY_WARN(...)                                                   \
  equirelay::util::LogManager::GetLogger("verify")->warn(__VA_ARGS__)
#define LOG_VERIFY_ERROR(...)                                                  \
  equirelay::util::LogManager::GetLogger("verify")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  equirelay::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  equirelay::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  equirelay::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
