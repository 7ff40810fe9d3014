// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace hive {
namespace util {

/**
 * LogManager - process-wide spdlog configuration
 *
 * Owns one sink set shared by a fixed list of component loggers
 * ("default", "network", "topology", "app"). Unknown component names
 * resolve to the default logger.
 *
 * Thread-safety: every method takes the registry mutex.
 */
class LogManager {
public:
  // Initialize logging with the given minimum level ("trace" .. "off").
  // Only the first call after startup or Shutdown() has an effect.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Flush and drop all loggers. A later Initialize() applies its settings again;
  // a GetLogger() without one recreates the loggers at "off".
  static void Shutdown();

  // Cached logger for a component ("network", "topology", "app", "default").
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set level for every component.
  static void SetLogLevel(const std::string& level);

  // Set level for one component. Returns false for an unknown component.
  static bool SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace hive

#define LOG_TRACE(...) hive::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) hive::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) hive::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) hive::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) hive::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_NET_TRACE(...) hive::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) hive::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) hive::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) hive::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) hive::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_TOPO_TRACE(...) hive::util::LogManager::GetLogger("topology")->trace(__VA_ARGS__)
#define LOG_TOPO_DEBUG(...) hive::util::LogManager::GetLogger("topology")->debug(__VA_ARGS__)
#define LOG_TOPO_INFO(...) hive::util::LogManager::GetLogger("topology")->info(__VA_ARGS__)
#define LOG_TOPO_WARN(...) hive::util::LogManager::GetLogger("topology")->warn(__VA_ARGS__)
#define LOG_TOPO_ERROR(...) hive::util::LogManager::GetLogger("topology")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...) hive::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...) hive::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) hive::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) hive::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING
// ============================================================================
// A peer that keeps failing dials or sending garbage greetings must not be able
// to flood the log. Each call site gets its own token bucket: 200 messages per
// hour, refilled continuously.

#include "util/rate_limiter.hpp"

#define HIVE_CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define HIVE_LOG_RL_(component, level, ...)                                                                          \
  do {                                                                                                                 \
    if (hive::util::RateLimiter::instance().should_log(HIVE_CALLSITE_KEY_, 200, 3600)) {                              \
      hive::util::LogManager::GetLogger(component)->level(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)

#define LOG_WARN_RL(...) HIVE_LOG_RL_("default", warn, __VA_ARGS__)
#define LOG_NET_WARN_RL(...) HIVE_LOG_RL_("network", warn, __VA_ARGS__)
#define LOG_NET_ERROR_RL(...) HIVE_LOG_RL_("network", error, __VA_ARGS__)
#define LOG_TOPO_DEBUG_RL(...) HIVE_LOG_RL_("topology", debug, __VA_ARGS__)
#define LOG_TOPO_WARN_RL(...) HIVE_LOG_RL_("topology", warn, __VA_ARGS__)
