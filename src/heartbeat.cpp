#include "probelink/heartbeat.hpp"

namespace probelink {

void HeartbeatMonitor::reset(Clock::time_point now) {
  sequence_ = 0;
  outstanding_ = 0;
  ping_id_ = 0;
  last_activity_ = now;
  enabled_ = false;
}

bool HeartbeatMonitor::on_pong(uint16_t id) {
  if (!ping_in_flight() || id != outstanding_) {
    return false;
  }
  outstanding_ = sequence_;
  return true;
}

HeartbeatAction HeartbeatMonitor::poll(Clock::time_point now) {
  if (!enabled_) {
    return HeartbeatAction::kIdle;
  }

  auto elapsed = now - last_activity_;

  if (!ping_in_flight()) {
    if (elapsed > interval_) {
      ping_id_ = sequence_;
      last_activity_ = now;
      ++sequence_;
      return HeartbeatAction::kSendPing;
    }
    return HeartbeatAction::kIdle;
  }

  if (timed_out(now)) {
    return HeartbeatAction::kTimedOut;
  }
  return HeartbeatAction::kIdle;
}

}  // namespace probelink
