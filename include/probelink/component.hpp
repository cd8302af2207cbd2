/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Capability provider contract.
 */

#ifndef PROBELINK_COMPONENT_HPP_
#define PROBELINK_COMPONENT_HPP_

#include "byte_buffer.hpp"
#include "frame_codec.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>

namespace probelink {

using Clock = std::chrono::steady_clock;

// Maximum length of a configure() status string.
static constexpr uint32_t kStatusStringCapacity = 64;
using StatusString = FixedString<kStatusStringCapacity>;

// Valid component ids are [0, kMaxComponents).
static constexpr uint32_t kMaxComponents = 32;

// ============================================================================
// Results
// ============================================================================

enum class UpdateResult : uint8_t {
  kDone,             // nothing left for this tick
  kMoreDataPending,  // run another update pass right away
  kFatalReconnect    // drop the connection
};

// ============================================================================
// FrameSink (where accumulated output goes)
// ============================================================================

class FrameSink {
 public:
  virtual ~FrameSink() = default;

  // Write the readable range of |output| (after flip) and clear it.
  // Returns success() with nothing written if |output| is empty.
  virtual Status flush(ByteBuffer& output) = 0;
};

// ============================================================================
// Component
// ============================================================================

/**
 * Every inbound frame is offered to every registered component in ascending
 * id order; a component compares frame.header.component_type to its own id
 * to decide whether to act. Handlers write at most one reply into |output|
 * per frame; the server flushes after each component. An error() from
 * handle_message() is logged and counted, except kBufferOverflow, which
 * drops the connection.
 *
 * All methods run on the server worker thread.
 */
class Component {
 public:
  virtual ~Component() = default;

  virtual uint8_t id() const = 0;

  // Called once from Server::initialize(), before start().
  virtual void initialize() {}

  // Handle an enable-bits request addressed to this component. Returning a
  // value sends it back as ASCII status; nothing sends a bare terminator.
  virtual optional<StatusString> configure(uint8_t /* flags */) { return optional<StatusString>(); }

  // After a successful handshake. May write frames into |output|.
  virtual void on_client_connected(ByteBuffer& /* output */) {}

  // Exactly once per connection that reached on_client_connected().
  virtual void on_client_disconnected() {}

  virtual Status handle_message(Clock::time_point frame_start, const Frame& frame, ByteBuffer& output) = 0;

  virtual UpdateResult update(Clock::time_point frame_start, ByteBuffer& output) = 0;
};

}  // namespace probelink

#endif  // PROBELINK_COMPONENT_HPP_
