#include "probelink/handshake.hpp"

#include "probelink/log.hpp"

#include <string>

namespace probelink {

namespace {

bool write_status(ByteBuffer& output, const MessageHeader& request, uint8_t status) {
  MessageHeader reply = request;
  reply.flags = wire::kResponseFlag;
  return wire::write_frame(output, reply, &status, 1);
}

}  // namespace

HandshakeState HandshakeNegotiator::evaluate(ByteBuffer& input, ByteBuffer& output) {
  if (state_ != HandshakeState::kAwaiting) {
    return state_;
  }
  if (input.remaining() < wire::kHandshakeFrameSize) {
    return state_;
  }

  Cursor frame_start = input.cursor();
  auto header = wire::try_parse_header(input);
  if (!header) {
    input.restore(frame_start);
    return state_;
  }
  const MessageHeader& request = header.value();

  if (request.component_type != wire::kServerComponentId || request.sub_type != wire::kSubtypeHandshake) {
    PROBELINK_LOG_WARN("Client did not send a handshake as first message");
    input.restore(frame_start);
    input.skip(wire::kHandshakeFrameSize);
    return reject(output, request, ErrorCode::kHandshakeFailed);
  }

  if (request.length != wire::kHandshakeFrameSize) {
    PROBELINK_LOG_ERROR("Invalid handshake message, length " + std::to_string(request.length));
    input.restore(frame_start);
    input.skip(wire::kHandshakeFrameSize);
    return reject(output, request, ErrorCode::kHandshakeFailed);
  }

  auto client_version = input.get_u32();
  if (!client_version || client_version.value() != version_) {
    PROBELINK_LOG_ERROR("Incompatible client version " + std::to_string(client_version.value_or(0)) +
                        ", server speaks " + std::to_string(version_));
    return reject(output, request, ErrorCode::kHandshakeFailed);
  }

  if (!write_status(output, request, wire::kStatusOk)) {
    return reject(output, request, ErrorCode::kBufferOverflow);
  }

  PROBELINK_LOG_DEBUG("Handshake done");
  state_ = HandshakeState::kAccepted;
  failure_ = ErrorCode::kOk;
  return state_;
}

HandshakeState HandshakeNegotiator::reject(ByteBuffer& output, const MessageHeader& request, ErrorCode why) {
  if (!write_status(output, request, wire::kStatusError)) {
    PROBELINK_LOG_WARN("No room for handshake error reply");
  }
  state_ = HandshakeState::kRejected;
  failure_ = why;
  return state_;
}

}  // namespace probelink
