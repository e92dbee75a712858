// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace algoprobe {
namespace util {

/**
 * Logging facade over spdlog
 *
 * One named logger per probe component:
 *   default    - process-wide messages
 *   network    - transport, connections, synthetic nodes
 *   codec      - tag/payload/topic/websocket decode failures
 *   handshake  - HTTP upgrade exchange
 *   app        - CLI driver
 *
 * All methods are thread-safe. Initialize() runs once (std::call_once);
 * GetLogger() lazily initializes with defaults when nothing was configured.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum level (trace, debug, info, warn, error, critical, off)
   * @param log_to_file Log to a rotating file instead of the console
   * @param log_file_path Path of the log file when log_to_file is set
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "algoprobe.log");

  // Flush and drop all loggers.
  static void Shutdown();

  /**
   * Get logger for a component. Unknown names resolve to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for one component (default, network, codec, handshake, app)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);

  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace algoprobe

#define LOG_TRACE(...)                                                         \
  algoprobe::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  algoprobe::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  algoprobe::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  algoprobe::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  algoprobe::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  algoprobe::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  algoprobe::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  algoprobe::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  algoprobe::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  algoprobe::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_CODEC_TRACE(...)                                                   \
  algoprobe::util::LogManager::GetLogger("codec")->trace(__VA_ARGS__)
#define LOG_CODEC_DEBUG(...)                                                   \
  algoprobe::util::LogManager::GetLogger("codec")->debug(__VA_ARGS__)
#define LOG_CODEC_WARN(...)                                                    \
  algoprobe::util::LogManager::GetLogger("codec")->warn(__VA_ARGS__)

#define LOG_HS_TRACE(...)                                                      \
  algoprobe::util::LogManager::GetLogger("handshake")->trace(__VA_ARGS__)
#define LOG_HS_DEBUG(...)                                                      \
  algoprobe::util::LogManager::GetLogger("handshake")->debug(__VA_ARGS__)
#define LOG_HS_WARN(...)                                                       \
  algoprobe::util::LogManager::GetLogger("handshake")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  algoprobe::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  algoprobe::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  algoprobe::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
