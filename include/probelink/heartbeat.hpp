/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Ping/pong liveness state for one connection.
 */

#ifndef PROBELINK_HEARTBEAT_HPP_
#define PROBELINK_HEARTBEAT_HPP_

#include <cstdint>

#include <chrono>

namespace probelink {

enum class HeartbeatAction : uint8_t {
  kIdle,      // nothing to do this tick
  kSendPing,  // emit a ping carrying HeartbeatMonitor::ping_id()
  kTimedOut   // outstanding ping not acknowledged in time
};

class HeartbeatMonitor {
 public:
  using Clock = std::chrono::steady_clock;

  HeartbeatMonitor(Clock::duration interval, Clock::duration timeout) : interval_(interval), timeout_(timeout) {}

  void set_timing(Clock::duration interval, Clock::duration timeout) {
    interval_ = interval;
    timeout_ = timeout;
  }

  // New connection: sequence restarts at 0, heartbeating off until the
  // handshake is accepted.
  void reset(Clock::time_point now);

  void enable() { enabled_ = true; }
  bool enabled() const { return enabled_; }

  // Any inbound frame proves the client is alive.
  void on_activity(Clock::time_point now) { last_activity_ = now; }

  // Acknowledgment of a ping. Returns true if it cleared the outstanding one.
  bool on_pong(uint16_t id);

  HeartbeatAction poll(Clock::time_point now);

  bool ping_in_flight() const { return sequence_ != outstanding_; }

  // True once an outstanding ping has gone unanswered past the timeout.
  bool timed_out(Clock::time_point now) const {
    return enabled_ && ping_in_flight() && now - last_activity_ > timeout_;
  }

  // Id of the ping requested by the last kSendPing.
  uint16_t ping_id() const { return ping_id_; }

  uint16_t sequence() const { return sequence_; }
  uint16_t outstanding() const { return outstanding_; }
  Clock::time_point last_activity() const { return last_activity_; }

 private:
  Clock::duration interval_;
  Clock::duration timeout_;

  Clock::time_point last_activity_{};
  uint16_t sequence_ = 0;     // next ping id
  uint16_t outstanding_ = 0;  // == sequence_ when no ping is in flight
  uint16_t ping_id_ = 0;
  bool enabled_ = false;
};

}  // namespace probelink

#endif  // PROBELINK_HEARTBEAT_HPP_
