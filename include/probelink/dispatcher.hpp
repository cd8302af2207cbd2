/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Ordered component registry, frame dispatch and update drain.
 */

#ifndef PROBELINK_DISPATCHER_HPP_
#define PROBELINK_DISPATCHER_HPP_

#include "byte_buffer.hpp"
#include "component.hpp"
#include "frame_codec.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>

namespace probelink {

class ComponentDispatcher {
 public:
  using ComponentPtr = std::shared_ptr<Component>;

  explicit ComponentDispatcher(ServerStats* stats = nullptr) : stats_(stats) {}

  ComponentDispatcher(const ComponentDispatcher&) = delete;
  ComponentDispatcher& operator=(const ComponentDispatcher&) = delete;

  // Rejects null, ids >= kMaxComponents, duplicate ids and a full registry.
  // The registry stays sorted by id.
  Status register_component(ComponentPtr component);

  Component* find(uint8_t id) const;

  uint32_t size() const { return components_.size(); }

  // Visit components in dispatch order.
  template <typename Fn>
  void for_each(Fn&& fn) const {
    for (const auto& component : components_) {
      fn(*component);
    }
  }

  void initialize_all();

  // on_client_connected() on each component, flushing after each one.
  Status connect_all(ByteBuffer& output, FrameSink& sink);

  // Offer |frame| to every component in id order, flushing after each one.
  // Handler errors are logged and counted; the frame still reaches the
  // remaining components. error() only for kBufferOverflow from a handler
  // or a failed flush.
  Status dispatch(Clock::time_point frame_start, const Frame& frame, ByteBuffer& output, FrameSink& sink);

  // Run update() on every component, repeating the whole pass while any
  // component reports kMoreDataPending. Returns the number of passes.
  expected<uint32_t, ErrorCode> update_all(Clock::time_point frame_start, ByteBuffer& output, FrameSink& sink);

  void disconnect_all();

 private:
  void note_failure(const Component& component, const char* where, const char* what);

  FixedVector<ComponentPtr, kMaxComponents> components_;
  ServerStats* stats_;
};

}  // namespace probelink

#endif  // PROBELINK_DISPATCHER_HPP_
