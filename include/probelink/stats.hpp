/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Atomic server counters, written by the worker and readable from any thread.
 */

#ifndef PROBELINK_STATS_HPP_
#define PROBELINK_STATS_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>

namespace probelink {

struct alignas(kCacheLine) ServerStats {
  std::atomic<uint64_t> connections_accepted{0};
  std::atomic<uint64_t> handshakes_accepted{0};
  std::atomic<uint64_t> handshakes_rejected{0};
  std::atomic<uint64_t> frames_in{0};
  std::atomic<uint64_t> bytes_in{0};
  std::atomic<uint64_t> bytes_out{0};
  std::atomic<uint64_t> pings_sent{0};
  std::atomic<uint64_t> pongs_received{0};
  std::atomic<uint64_t> heartbeat_timeouts{0};
  std::atomic<uint64_t> component_failures{0};
  std::atomic<uint64_t> reconnects{0};
  std::atomic<uint64_t> last_tick_us{0};
  std::atomic<uint64_t> max_tick_us{0};

  void reset() {
    connections_accepted = 0;
    handshakes_accepted = 0;
    handshakes_rejected = 0;
    frames_in = 0;
    bytes_in = 0;
    bytes_out = 0;
    pings_sent = 0;
    pongs_received = 0;
    heartbeat_timeouts = 0;
    component_failures = 0;
    reconnects = 0;
    last_tick_us = 0;
    max_tick_us = 0;
  }

  void add(std::atomic<uint64_t>& counter, uint64_t n = 1) { counter.fetch_add(n, std::memory_order_relaxed); }
};

}  // namespace probelink

#endif  // PROBELINK_STATS_HPP_
