/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * The server's own component (id 0): ping/pong, enable-bits, heartbeat.
 */

#ifndef PROBELINK_CONTROL_COMPONENT_HPP_
#define PROBELINK_CONTROL_COMPONENT_HPP_

#include "component.hpp"
#include "dispatcher.hpp"
#include "heartbeat.hpp"
#include "stats.hpp"

namespace probelink {

class ControlComponent : public Component {
 public:
  ControlComponent(const ComponentDispatcher& registry, HeartbeatMonitor& heartbeat, ServerStats* stats = nullptr)
      : registry_(registry), heartbeat_(heartbeat), stats_(stats) {}

  uint8_t id() const override { return wire::kServerComponentId; }

  Status handle_message(Clock::time_point frame_start, const Frame& frame, ByteBuffer& output) override;

  // Emits a ping when the link has been quiet for the heartbeat interval;
  // kFatalReconnect once an outstanding ping times out.
  UpdateResult update(Clock::time_point frame_start, ByteBuffer& output) override;

 private:
  Status handle_ping(const Frame& frame, ByteBuffer& output);
  Status handle_enable_bits(const Frame& frame, ByteBuffer& output);

  const ComponentDispatcher& registry_;
  HeartbeatMonitor& heartbeat_;
  ServerStats* stats_;
};

}  // namespace probelink

#endif  // PROBELINK_CONTROL_COMPONENT_HPP_
