/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Wire format: 7-byte little-endian message header followed by the payload.
 */

#ifndef PROBELINK_FRAME_CODEC_HPP_
#define PROBELINK_FRAME_CODEC_HPP_

#include "byte_buffer.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

namespace probelink {

// ============================================================================
// Protocol constants
// ============================================================================

namespace wire {

// id(u16) + length(u16) + flags(u8) + componentType(u8) + subType(u8)
static constexpr size_t kHeaderSize = 7;

static constexpr uint8_t kResponseFlag = 0x01;
static constexpr uint8_t kRequestFlags = 0x00;

static constexpr uint8_t kServerComponentId = 0;

// Subtypes of the server component.
static constexpr uint8_t kSubtypeHandshake = 0;
static constexpr uint8_t kSubtypePing = 1;
static constexpr uint8_t kSubtypeReserved = 2;
static constexpr uint8_t kSubtypeEnableBits = 3;

static constexpr uint32_t kProtocolVersion = 1;
static constexpr size_t kHandshakeFrameSize = kHeaderSize + sizeof(uint32_t);

static constexpr uint8_t kStatusOk = 0;
static constexpr uint8_t kStatusError = 1;
static constexpr uint8_t kStringTerminator = 0;

}  // namespace wire

// ============================================================================
// MessageHeader / Frame
// ============================================================================

struct MessageHeader {
  uint16_t id = 0;
  uint16_t length = 0;  // total frame length, header included
  uint8_t flags = 0;
  uint8_t component_type = 0;
  uint8_t sub_type = 0;

  bool is_response() const { return (flags & wire::kResponseFlag) != 0; }

  size_t payload_size() const { return length > wire::kHeaderSize ? length - wire::kHeaderSize : 0; }

  // Header for the reply to this message: same id/type/subtype, RESPONSE set.
  MessageHeader response(size_t payload_len = 0) const {
    MessageHeader out = *this;
    out.flags = static_cast<uint8_t>(flags | wire::kResponseFlag);
    out.length = static_cast<uint16_t>(wire::kHeaderSize + payload_len);
    return out;
  }

  bool operator==(const MessageHeader& other) const {
    return id == other.id && length == other.length && flags == other.flags &&
           component_type == other.component_type && sub_type == other.sub_type;
  }
  bool operator!=(const MessageHeader& other) const { return !(*this == other); }
};

// A complete frame inside the input buffer. payload points into the buffer
// and stays valid until the buffer is compacted.
struct Frame {
  MessageHeader header;
  const uint8_t* payload = nullptr;
  size_t payload_size = 0;
};

// ============================================================================
// Codec
// ============================================================================

namespace wire {

inline uint16_t load_le16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }

inline uint32_t load_le32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

inline void store_le16(uint8_t* p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

inline void store_le32(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

// Decode a header from the buffer's readable range and advance past it.
// error(kNeedMoreData) if fewer than kHeaderSize bytes remain; the cursor is
// left untouched in that case.
expected<MessageHeader, ErrorCode> try_parse_header(ByteBuffer& buf);

// Bounds of a decoded header against a buffer capacity.
// kFrameParseError if length < kHeaderSize, kFrameTooLarge if length > capacity.
Status validate_length(const MessageHeader& header, size_t capacity);

// True if the payload of |header| is fully present after the cursor, which
// must sit right after the header.
bool has_complete_frame(const ByteBuffer& buf, const MessageHeader& header);

// Append the header. Fails without writing if fewer than kHeaderSize bytes
// of space are left.
bool write_header(ByteBuffer& buf, const MessageHeader& header);

// Append header + payload as a unit; header.length is set from payload_len.
bool write_frame(ByteBuffer& buf, MessageHeader header, const uint8_t* payload, size_t payload_len);

// Pull the next complete frame out of the buffer's readable range.
//  - success: cursor advanced past header and payload, Frame points into buf
//  - kNeedMoreData: cursor restored, partial bytes stay buffered
//  - kFrameParseError / kFrameTooLarge: connection-fatal protocol violation
expected<Frame, ErrorCode> extract_frame(ByteBuffer& buf);

}  // namespace wire

}  // namespace probelink

#endif  // PROBELINK_FRAME_CODEC_HPP_
