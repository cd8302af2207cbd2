/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Fixed-capacity byte buffers with an explicit (position, limit) cursor.
 */

#ifndef PROBELINK_BYTE_BUFFER_HPP_
#define PROBELINK_BYTE_BUFFER_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace probelink {

// ============================================================================
// Cursor (saved read/write position of a ByteBuffer)
// ============================================================================

struct Cursor {
  size_t position = 0;
  size_t limit = 0;
};

// ============================================================================
// ByteBuffer (non-owning view over fixed storage)
// ============================================================================

/**
 * Bytes live in [0, capacity). Writes go to [position, limit) and advance
 * position; flip() turns the written range into a readable range, compact()
 * moves unread bytes to the front and switches back to writing.
 *
 * The storage is never reallocated. Writes that do not fit fail without
 * touching the buffer.
 */
class ByteBuffer {
 public:
  ByteBuffer(uint8_t* storage, size_t capacity) : data_(storage), capacity_(capacity), limit_(capacity) {}

  ByteBuffer(const ByteBuffer&) = delete;
  ByteBuffer& operator=(const ByteBuffer&) = delete;

  // --- Cursor ---

  Cursor cursor() const { return Cursor{position_, limit_}; }

  void restore(const Cursor& saved) {
    limit_ = saved.limit <= capacity_ ? saved.limit : capacity_;
    position_ = saved.position <= limit_ ? saved.position : limit_;
  }

  size_t position() const { return position_; }
  size_t limit() const { return limit_; }
  size_t capacity() const { return capacity_; }
  size_t remaining() const { return limit_ - position_; }
  bool has_remaining() const { return position_ < limit_; }

  // Move position forward, clamped to limit.
  void skip(size_t len) { position_ = (len > remaining()) ? limit_ : position_ + len; }

  // --- Mode switches ---

  void clear() {
    position_ = 0;
    limit_ = capacity_;
  }

  void flip() {
    limit_ = position_;
    position_ = 0;
  }

  void compact() {
    size_t left = remaining();
    if (left > 0 && position_ > 0) {
      std::memmove(data_, data_ + position_, left);
    }
    position_ = left;
    limit_ = capacity_;
  }

  // --- Raw access ---

  uint8_t* data() { return data_; }
  const uint8_t* data() const { return data_; }

  // Current position pointer, for bulk reads from a socket into the buffer.
  uint8_t* cursor_ptr() { return data_ + position_; }
  const uint8_t* cursor_ptr() const { return data_ + position_; }

  // --- Writers ---

  bool put(const uint8_t* src, size_t len) {
    if (remaining() < len) {
      return false;
    }
    if (len > 0) {
      std::memcpy(data_ + position_, src, len);
    }
    position_ += len;
    return true;
  }

  bool put_u8(uint8_t value) { return put(&value, 1); }

  bool put_u16(uint16_t value) {
    uint8_t bytes[2] = {static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>((value >> 8) & 0xFF)};
    return put(bytes, sizeof(bytes));
  }

  bool put_u32(uint32_t value) {
    uint8_t bytes[4] = {static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>((value >> 8) & 0xFF),
                        static_cast<uint8_t>((value >> 16) & 0xFF), static_cast<uint8_t>((value >> 24) & 0xFF)};
    return put(bytes, sizeof(bytes));
  }

  // --- Readers (little-endian) ---

  expected<uint8_t, ErrorCode> get_u8() {
    if (remaining() < 1) {
      return expected<uint8_t, ErrorCode>::error(ErrorCode::kNeedMoreData);
    }
    return expected<uint8_t, ErrorCode>::success(data_[position_++]);
  }

  expected<uint16_t, ErrorCode> get_u16() {
    if (remaining() < 2) {
      return expected<uint16_t, ErrorCode>::error(ErrorCode::kNeedMoreData);
    }
    uint16_t value = static_cast<uint16_t>(data_[position_] | (data_[position_ + 1] << 8));
    position_ += 2;
    return expected<uint16_t, ErrorCode>::success(value);
  }

  expected<uint32_t, ErrorCode> get_u32() {
    if (remaining() < 4) {
      return expected<uint32_t, ErrorCode>::error(ErrorCode::kNeedMoreData);
    }
    uint32_t value = static_cast<uint32_t>(data_[position_]) | (static_cast<uint32_t>(data_[position_ + 1]) << 8) |
                     (static_cast<uint32_t>(data_[position_ + 2]) << 16) |
                     (static_cast<uint32_t>(data_[position_ + 3]) << 24);
    position_ += 4;
    return expected<uint32_t, ErrorCode>::success(value);
  }

 private:
  uint8_t* data_;
  size_t capacity_;
  size_t position_ = 0;
  size_t limit_;
};

// ============================================================================
// StaticByteBuffer (ByteBuffer owning its storage)
// ============================================================================

template <size_t Size>
class alignas(kCacheLine) StaticByteBuffer : public ByteBuffer {
 public:
  static constexpr size_t kCapacity = Size;

  StaticByteBuffer() : ByteBuffer(storage_, Size) {}

 private:
  alignas(kCacheLine) uint8_t storage_[Size] = {};
};

}  // namespace probelink

#endif  // PROBELINK_BYTE_BUFFER_HPP_
