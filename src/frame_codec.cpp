#include "probelink/frame_codec.hpp"

namespace probelink {
namespace wire {

expected<MessageHeader, ErrorCode> try_parse_header(ByteBuffer& buf) {
  if (buf.remaining() < kHeaderSize) {
    return expected<MessageHeader, ErrorCode>::error(ErrorCode::kNeedMoreData);
  }

  const uint8_t* p = buf.cursor_ptr();
  MessageHeader header;
  header.id = load_le16(p);
  header.length = load_le16(p + 2);
  header.flags = p[4];
  header.component_type = p[5];
  header.sub_type = p[6];

  buf.skip(kHeaderSize);
  return expected<MessageHeader, ErrorCode>::success(header);
}

Status validate_length(const MessageHeader& header, size_t capacity) {
  if (header.length < kHeaderSize) {
    return Status::error(ErrorCode::kFrameParseError);
  }
  if (header.length > capacity) {
    return Status::error(ErrorCode::kFrameTooLarge);
  }
  return Status::success();
}

bool has_complete_frame(const ByteBuffer& buf, const MessageHeader& header) {
  return buf.remaining() >= header.payload_size();
}

bool write_header(ByteBuffer& buf, const MessageHeader& header) {
  if (buf.remaining() < kHeaderSize) {
    return false;
  }
  uint8_t raw[kHeaderSize];
  store_le16(raw, header.id);
  store_le16(raw + 2, header.length);
  raw[4] = header.flags;
  raw[5] = header.component_type;
  raw[6] = header.sub_type;
  return buf.put(raw, kHeaderSize);
}

bool write_frame(ByteBuffer& buf, MessageHeader header, const uint8_t* payload, size_t payload_len) {
  size_t total = kHeaderSize + payload_len;
  if (total > 0xFFFF || buf.remaining() < total) {
    return false;
  }
  header.length = static_cast<uint16_t>(total);
  if (!write_header(buf, header)) {
    return false;
  }
  return buf.put(payload, payload_len);
}

expected<Frame, ErrorCode> extract_frame(ByteBuffer& buf) {
  Cursor mark = buf.cursor();

  auto header = try_parse_header(buf);
  if (!header) {
    return expected<Frame, ErrorCode>::error(header.get_error());
  }

  auto bounds = validate_length(header.value(), buf.capacity());
  if (!bounds) {
    buf.restore(mark);
    return expected<Frame, ErrorCode>::error(bounds.get_error());
  }

  if (!has_complete_frame(buf, header.value())) {
    // Keep the header bytes too, so the frame is decoded once it is whole.
    buf.restore(mark);
    return expected<Frame, ErrorCode>::error(ErrorCode::kNeedMoreData);
  }

  Frame frame;
  frame.header = header.value();
  frame.payload = buf.cursor_ptr();
  frame.payload_size = frame.header.payload_size();

  buf.restore(mark);
  buf.skip(frame.header.length);
  return expected<Frame, ErrorCode>::success(frame);
}

}  // namespace wire
}  // namespace probelink
