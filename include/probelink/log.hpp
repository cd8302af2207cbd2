/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for probelink (loghelper-compatible interface).
 * Provides PROBELINK_LOG_DEBUG, PROBELINK_LOG_INFO, PROBELINK_LOG_WARN and
 * PROBELINK_LOG_ERROR macros.
 */

#ifndef PROBELINK_LOG_HPP_
#define PROBELINK_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace probelink {

class Logger {
 public:
  enum class Level : int { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3, kOff = 4 };

  static void set_level(Level level) { threshold().store(static_cast<int>(level), std::memory_order_relaxed); }

  static Level level() { return static_cast<Level>(threshold().load(std::memory_order_relaxed)); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= threshold().load(std::memory_order_relaxed);
  }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level)) {
      return;
    }
    static const char* const kPrefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    // Control thread and worker thread both log; keep lines whole.
    std::lock_guard<std::mutex> lock(sink_mutex());
    std::cerr << "[probelink] " << kPrefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<int>& threshold() {
    static std::atomic<int> value{static_cast<int>(Level::kInfo)};
    return value;
  }

  static std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
  }
};

// Message expressions are only evaluated when the level is enabled.
#define PROBELINK_LOG_AT(lvl, msg)                     \
  do {                                                 \
    if (::probelink::Logger::enabled(lvl)) {           \
      ::probelink::Logger::log(lvl, msg);              \
    }                                                  \
  } while (0)

#define PROBELINK_LOG_DEBUG(msg) PROBELINK_LOG_AT(::probelink::Logger::Level::kDebug, msg)
#define PROBELINK_LOG_INFO(msg) PROBELINK_LOG_AT(::probelink::Logger::Level::kInfo, msg)
#define PROBELINK_LOG_WARN(msg) PROBELINK_LOG_AT(::probelink::Logger::Level::kWarn, msg)
#define PROBELINK_LOG_ERROR(msg) PROBELINK_LOG_AT(::probelink::Logger::Level::kError, msg)

}  // namespace probelink

#endif  // PROBELINK_LOG_HPP_
