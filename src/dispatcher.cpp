#include "probelink/dispatcher.hpp"

#include "probelink/log.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace probelink {

Status ComponentDispatcher::register_component(ComponentPtr component) {
  if (!component) {
    return Status::error(ErrorCode::kInvalidComponent);
  }

  uint8_t id = component->id();
  if (id >= kMaxComponents) {
    PROBELINK_LOG_ERROR("Component with ID " + std::to_string(id) + " is invalid");
    return Status::error(ErrorCode::kInvalidComponentId);
  }
  if (find(id) != nullptr) {
    PROBELINK_LOG_ERROR("Component with ID " + std::to_string(id) + " has already been registered");
    return Status::error(ErrorCode::kDuplicateComponent);
  }
  if (!components_.push_back(std::move(component))) {
    return Status::error(ErrorCode::kRegistryFull);
  }

  std::sort(components_.begin(), components_.end(),
            [](const ComponentPtr& a, const ComponentPtr& b) { return a->id() < b->id(); });
  return Status::success();
}

Component* ComponentDispatcher::find(uint8_t id) const {
  for (const auto& component : components_) {
    if (component->id() == id) {
      return component.get();
    }
  }
  return nullptr;
}

void ComponentDispatcher::initialize_all() {
  for (auto& component : components_) {
    try {
      component->initialize();
    } catch (const std::exception& e) {
      note_failure(*component, "initialize", e.what());
    }
  }
}

Status ComponentDispatcher::connect_all(ByteBuffer& output, FrameSink& sink) {
  for (auto& component : components_) {
    try {
      component->on_client_connected(output);
    } catch (const std::exception& e) {
      note_failure(*component, "on_client_connected", e.what());
    }
    auto flushed = sink.flush(output);
    if (!flushed) {
      return flushed;
    }
  }
  return Status::success();
}

Status ComponentDispatcher::dispatch(Clock::time_point frame_start, const Frame& frame, ByteBuffer& output,
                                     FrameSink& sink) {
  if (stats_ != nullptr) {
    stats_->add(stats_->frames_in);
  }

  for (auto& component : components_) {
    Status result = Status::success();
    try {
      result = component->handle_message(frame_start, frame, output);
    } catch (const std::exception& e) {
      note_failure(*component, "handle_message", e.what());
    }

    auto flushed = sink.flush(output);
    if (!flushed) {
      return flushed;
    }

    if (!result) {
      if (result.get_error() == ErrorCode::kBufferOverflow) {
        PROBELINK_LOG_ERROR("Component " + std::to_string(component->id()) + " overflowed the output buffer");
        return result;
      }
      note_failure(*component, "handle_message", error_string(result.get_error()));
    }
  }
  return Status::success();
}

expected<uint32_t, ErrorCode> ComponentDispatcher::update_all(Clock::time_point frame_start, ByteBuffer& output,
                                                              FrameSink& sink) {
  uint32_t passes = 0;
  uint32_t pending = 0;
  do {
    pending = 0;
    ++passes;

    for (auto& component : components_) {
      UpdateResult result = UpdateResult::kDone;
      try {
        result = component->update(frame_start, output);
      } catch (const std::exception& e) {
        note_failure(*component, "update", e.what());
      }

      auto flushed = sink.flush(output);
      if (!flushed) {
        return expected<uint32_t, ErrorCode>::error(flushed.get_error());
      }

      if (result == UpdateResult::kFatalReconnect) {
        PROBELINK_LOG_ERROR("Error encountered when updating component with ID " + std::to_string(component->id()));
        return expected<uint32_t, ErrorCode>::error(ErrorCode::kComponentFailure);
      }
      if (result == UpdateResult::kMoreDataPending) {
        ++pending;
      }
    }
  } while (pending > 0);

  return expected<uint32_t, ErrorCode>::success(passes);
}

void ComponentDispatcher::disconnect_all() {
  for (auto& component : components_) {
    try {
      component->on_client_disconnected();
    } catch (const std::exception& e) {
      note_failure(*component, "on_client_disconnected", e.what());
    }
  }
}

void ComponentDispatcher::note_failure(const Component& component, const char* where, const char* what) {
  if (stats_ != nullptr) {
    stats_->add(stats_->component_failures);
  }
  PROBELINK_LOG_ERROR("Component " + std::to_string(component.id()) + " failed in " + where + ": " + what);
}

}  // namespace probelink
