/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Server configuration.
 */

#ifndef PROBELINK_CONFIG_HPP_
#define PROBELINK_CONFIG_HPP_

#include "frame_codec.hpp"
#include "log.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <string>

#include <sys/un.h>
#include <unistd.h>

namespace probelink {

// ============================================================================
// ServerConfig
// ============================================================================

struct ServerConfig {
  // Socket path is <socket_dir>/<socket_prefix><pid> unless socket_name is set.
  std::string socket_dir = "/tmp";
  std::string socket_prefix = "probelink_pid";
  std::string socket_name;

  uint32_t protocol_version = wire::kProtocolVersion;

  std::chrono::microseconds tick_period{1000000 / 60};  // 60 ticks per second
  std::chrono::milliseconds heartbeat_interval{2000};
  std::chrono::milliseconds heartbeat_timeout{5000};   // must exceed the interval
  std::chrono::milliseconds handshake_timeout{5000};
  std::chrono::milliseconds accept_retry{100};

  Logger::Level log_level = Logger::Level::kInfo;

  std::string socket_path() const {
    std::string name = socket_name.empty() ? socket_prefix + std::to_string(::getpid()) : socket_name;
    if (socket_dir.empty()) {
      return name;
    }
    return socket_dir.back() == '/' ? socket_dir + name : socket_dir + "/" + name;
  }

  Status validate() const {
    if (tick_period.count() <= 0 || accept_retry.count() <= 0 || heartbeat_interval.count() <= 0 ||
        handshake_timeout.count() <= 0) {
      return Status::error(ErrorCode::kInvalidConfig);
    }
    if (heartbeat_timeout <= heartbeat_interval) {
      return Status::error(ErrorCode::kInvalidConfig);
    }
    if (socket_name.empty() && socket_prefix.empty()) {
      return Status::error(ErrorCode::kInvalidConfig);
    }
    if (socket_path().size() >= sizeof(sockaddr_un{}.sun_path)) {
      return Status::error(ErrorCode::kInvalidConfig);
    }
    return Status::success();
  }
};

}  // namespace probelink

#endif  // PROBELINK_CONFIG_HPP_
