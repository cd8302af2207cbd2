#include "probelink/control_component.hpp"

#include "probelink/log.hpp"

#include <string>

namespace probelink {

Status ControlComponent::handle_message(Clock::time_point /* frame_start */, const Frame& frame,
                                        ByteBuffer& output) {
  if (frame.header.component_type != wire::kServerComponentId) {
    return Status::success();
  }

  switch (frame.header.sub_type) {
    case wire::kSubtypePing:
      return handle_ping(frame, output);
    case wire::kSubtypeEnableBits:
      return handle_enable_bits(frame, output);
    case wire::kSubtypeHandshake:
      PROBELINK_LOG_WARN("Ignoring handshake on an established connection");
      return Status::success();
    case wire::kSubtypeReserved:
      PROBELINK_LOG_WARN("Ignoring reserved server message");
      return Status::success();
    default:
      PROBELINK_LOG_DEBUG("Ignoring server message subtype " + std::to_string(frame.header.sub_type));
      return Status::success();
  }
}

Status ControlComponent::handle_ping(const Frame& frame, ByteBuffer& output) {
  if (!frame.header.is_response()) {
    if (!wire::write_header(output, frame.header.response())) {
      return Status::error(ErrorCode::kBufferOverflow);
    }
    PROBELINK_LOG_DEBUG("Pong");
    return Status::success();
  }

  if (heartbeat_.on_pong(frame.header.id) && stats_ != nullptr) {
    stats_->add(stats_->pongs_received);
  }
  return Status::success();
}

Status ControlComponent::handle_enable_bits(const Frame& frame, ByteBuffer& output) {
  if (frame.payload_size < 2) {
    PROBELINK_LOG_WARN("Enable-bits request without target/flags payload");
    return Status::success();
  }
  uint8_t target = frame.payload[0];
  uint8_t flags = frame.payload[1];

  optional<StatusString> result;
  Component* component = registry_.find(target);
  if (component != nullptr) {
    result = component->configure(flags);
  }

  if (result.has_value() && result.value().empty()) {
    PROBELINK_LOG_ERROR("Empty result returned by component ID: " + std::to_string(target));
    if (stats_ != nullptr) {
      stats_->add(stats_->component_failures);
    }
    result.reset();
  }

  bool written = false;
  if (result.has_value()) {
    const StatusString& text = result.value();
    written = wire::write_frame(output, frame.header.response(), reinterpret_cast<const uint8_t*>(text.c_str()),
                                text.size());
  } else {
    const uint8_t terminator = wire::kStringTerminator;
    written = wire::write_frame(output, frame.header.response(), &terminator, 1);
  }

  if (!written) {
    PROBELINK_LOG_ERROR("Enable-bits reply does not fit the output buffer");
    return Status::error(ErrorCode::kBufferOverflow);
  }
  return Status::success();
}

UpdateResult ControlComponent::update(Clock::time_point frame_start, ByteBuffer& output) {
  // A ping that cannot be written must not count as sent.
  if (output.remaining() < wire::kHeaderSize && !heartbeat_.ping_in_flight()) {
    return UpdateResult::kDone;
  }

  switch (heartbeat_.poll(frame_start)) {
    case HeartbeatAction::kSendPing: {
      MessageHeader ping;
      ping.id = heartbeat_.ping_id();
      ping.length = wire::kHeaderSize;
      ping.flags = wire::kRequestFlags;
      ping.component_type = wire::kServerComponentId;
      ping.sub_type = wire::kSubtypePing;
      if (!wire::write_header(output, ping)) {
        PROBELINK_LOG_ERROR("Ping did not fit the output buffer");
        return UpdateResult::kFatalReconnect;
      }
      if (stats_ != nullptr) {
        stats_->add(stats_->pings_sent);
      }
      PROBELINK_LOG_DEBUG("Ping " + std::to_string(ping.id));
      return UpdateResult::kDone;
    }
    case HeartbeatAction::kTimedOut:
      PROBELINK_LOG_INFO("Connection timed out");
      if (stats_ != nullptr) {
        stats_->add(stats_->heartbeat_timeouts);
      }
      return UpdateResult::kFatalReconnect;
    case HeartbeatAction::kIdle:
      break;
  }
  return UpdateResult::kDone;
}

}  // namespace probelink
