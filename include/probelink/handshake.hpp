/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Version handshake gating a new connection.
 */

#ifndef PROBELINK_HANDSHAKE_HPP_
#define PROBELINK_HANDSHAKE_HPP_

#include "byte_buffer.hpp"
#include "frame_codec.hpp"
#include "vocabulary.hpp"

#include <cstdint>

namespace probelink {

enum class HandshakeState : uint8_t {
  kAwaiting,  // fewer than kHandshakeFrameSize bytes seen
  kAccepted,  // OK reply written
  kRejected   // ERROR reply written (best effort)
};

class HandshakeNegotiator {
 public:
  explicit HandshakeNegotiator(uint32_t version = wire::kProtocolVersion) : version_(version) {}

  void set_version(uint32_t version) { version_ = version; }
  uint32_t version() const { return version_; }

  void reset() {
    state_ = HandshakeState::kAwaiting;
    failure_ = ErrorCode::kOk;
  }

  HandshakeState state() const { return state_; }

  // Why the last handshake was rejected.
  ErrorCode failure() const { return failure_; }

  // |input| is in read mode. Once kHandshakeFrameSize bytes are readable the
  // frame is consumed, a RESPONSE-flagged status reply is appended to
  // |output| and the state becomes final. Further calls return that state.
  HandshakeState evaluate(ByteBuffer& input, ByteBuffer& output);

 private:
  HandshakeState reject(ByteBuffer& output, const MessageHeader& request, ErrorCode why);

  uint32_t version_;
  HandshakeState state_ = HandshakeState::kAwaiting;
  ErrorCode failure_ = ErrorCode::kOk;
};

}  // namespace probelink

#endif  // PROBELINK_HANDSHAKE_HPP_
