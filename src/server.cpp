#include "probelink/server.hpp"

#include "probelink/log.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace probelink {

const char* state_name(ServerState state) {
  switch (state) {
    case ServerState::kIdle:
      return "idle";
    case ServerState::kListening:
      return "listening";
    case ServerState::kHandshaking:
      return "handshaking";
    case ServerState::kActive:
      return "active";
    case ServerState::kClosing:
      return "closing";
  }
  return "unknown";
}

Server::Server(const ServerConfig& config)
    : config_(config),
      heartbeat_(config.heartbeat_interval, config.heartbeat_timeout),
      handshake_(config.protocol_version),
      dispatcher_(&stats_) {
  control_ = std::make_shared<ControlComponent>(dispatcher_, heartbeat_, &stats_);
  auto registered = dispatcher_.register_component(control_);
  if (!registered) {
    PROBELINK_LOG_ERROR(std::string("Failed to register server component: ") +
                        error_string(registered.get_error()));
  }
}

Server::~Server() { stop(); }

Status Server::register_component(ComponentPtr component) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (is_running()) {
    PROBELINK_LOG_ERROR("Components must be registered before the server starts");
    return Status::error(ErrorCode::kInvalidState);
  }
  return dispatcher_.register_component(std::move(component));
}

Status Server::initialize() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (is_running()) {
    return Status::error(ErrorCode::kInvalidState);
  }
  dispatcher_.initialize_all();
  return Status::success();
}

Status Server::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (is_running()) {
    return Status::success();
  }

  auto valid = config_.validate();
  if (!valid) {
    PROBELINK_LOG_ERROR("Invalid server configuration");
    return valid;
  }
  Logger::set_level(config_.log_level);

  heartbeat_.set_timing(config_.heartbeat_interval, config_.heartbeat_timeout);
  handshake_.set_version(config_.protocol_version);

  auto opened = listener_.open(config_.socket_path());
  if (!opened) {
    return opened;
  }

  cancel_.reset();
  {
    std::lock_guard<std::mutex> started(started_mutex_);
    worker_started_ = false;
  }

  try {
    worker_ = std::thread(&Server::run, this);
  } catch (const std::system_error& e) {
    PROBELINK_LOG_ERROR(std::string("Failed to spawn server thread: ") + e.what());
    listener_.close();
    return Status::error(ErrorCode::kInternalError);
  }

  {
    std::unique_lock<std::mutex> started(started_mutex_);
    started_cv_.wait(started, [this] { return worker_started_; });
  }
  running_.store(true, std::memory_order_release);
  PROBELINK_LOG_INFO("Server started");
  return Status::success();
}

void Server::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!is_running()) {
    return;
  }

  PROBELINK_LOG_INFO("Stopping server");
  cancel_.cancel();
  if (worker_.joinable()) {
    worker_.join();
  }
  listener_.close();

  state_.store(ServerState::kIdle, std::memory_order_release);
  running_.store(false, std::memory_order_release);
  PROBELINK_LOG_INFO("Server stopped");
}

bool Server::configurable(const char* what) const {
  if (is_running()) {
    PROBELINK_LOG_WARN(std::string("Ignoring ") + what + " change while running");
    return false;
  }
  return true;
}

Server& Server::set_tick_period(std::chrono::microseconds period) {
  if (configurable("tick period")) {
    config_.tick_period = period;
  }
  return *this;
}

Server& Server::set_heartbeat(std::chrono::milliseconds interval, std::chrono::milliseconds timeout) {
  if (configurable("heartbeat")) {
    config_.heartbeat_interval = interval;
    config_.heartbeat_timeout = timeout;
  }
  return *this;
}

Server& Server::set_handshake_timeout(std::chrono::milliseconds timeout) {
  if (configurable("handshake timeout")) {
    config_.handshake_timeout = timeout;
  }
  return *this;
}

Server& Server::set_accept_retry(std::chrono::milliseconds retry) {
  if (configurable("accept retry")) {
    config_.accept_retry = retry;
  }
  return *this;
}

Server& Server::set_socket_name(const std::string& name) {
  if (configurable("socket name")) {
    config_.socket_name = name;
  }
  return *this;
}

// ============================================================================
// Worker thread
// ============================================================================

void Server::run() {
  {
    std::lock_guard<std::mutex> started(started_mutex_);
    worker_started_ = true;
  }
  started_cv_.notify_all();

  while (!cancel_.is_cancelled()) {
    state_.store(ServerState::kListening, std::memory_order_release);

    sockpp::unix_socket sock;
    auto accepted = listener_.accept_for(config_.accept_retry, sock);
    if (!accepted) {
      PROBELINK_LOG_ERROR("Could not accept socket, server thread exiting");
      break;
    }
    if (!accepted.value()) {
      continue;
    }

    stats_.add(stats_.connections_accepted);
    PROBELINK_LOG_INFO("Client connected");

    auto result = serve(std::move(sock));
    stats_.add(stats_.reconnects);
    if (!result && disposition(result.get_error()) == Disposition::kFatal) {
      PROBELINK_LOG_ERROR(std::string("Server thread exiting: ") + error_string(result.get_error()));
      break;
    }
    if (!cancel_.is_cancelled()) {
      PROBELINK_LOG_INFO("Reinitializing server");
    }
  }

  state_.store(ServerState::kIdle, std::memory_order_release);
}

Status Server::serve(sockpp::unix_socket&& sock) {
  Connection conn(std::move(sock), cancel_, config_.heartbeat_timeout, &stats_);

  input_.clear();
  output_.clear();
  auto accepted_at = Clock::now();
  heartbeat_.reset(accepted_at);
  handshake_.reset();

  state_.store(ServerState::kHandshaking, std::memory_order_release);
  auto negotiated = negotiate(conn, accepted_at);
  if (!negotiated) {
    // Components never saw this client; nothing to disconnect.
    state_.store(ServerState::kClosing, std::memory_order_release);
    conn.close();
    return negotiated;
  }

  stats_.add(stats_.handshakes_accepted);
  heartbeat_.enable();
  state_.store(ServerState::kActive, std::memory_order_release);

  Status result = dispatcher_.connect_all(output_, conn);
  while (result && !cancel_.is_cancelled()) {
    auto frame_start = Clock::now();

    result = process_messages(frame_start, conn);
    if (!result) {
      break;
    }

    auto updated = dispatcher_.update_all(frame_start, output_, conn);
    if (!updated) {
      result = Status::error(heartbeat_.timed_out(frame_start) ? ErrorCode::kHeartbeatTimeout : updated.get_error());
      break;
    }

    finish_tick(frame_start);
  }

  if (!result) {
    PROBELINK_LOG_INFO(std::string("Dropping client: ") + error_string(result.get_error()));
  }
  last_drop_reason_.store(result ? ErrorCode::kOk : result.get_error(), std::memory_order_release);

  state_.store(ServerState::kClosing, std::memory_order_release);
  dispatcher_.disconnect_all();
  conn.close();
  PROBELINK_LOG_INFO("Client disconnected");
  return result;
}

Status Server::negotiate(Connection& conn, Clock::time_point accepted_at) {
  auto read = conn.read_exact(input_, wire::kHandshakeFrameSize, accepted_at + config_.handshake_timeout,
                              config_.tick_period);
  if (!read) {
    if (read.get_error() == ErrorCode::kTimeout) {
      PROBELINK_LOG_WARN("Client sent no handshake in time");
    } else if (read.get_error() != ErrorCode::kCancelled) {
      PROBELINK_LOG_WARN(std::string("Handshake read failed: ") + error_string(read.get_error()));
    }
    return read;
  }

  input_.flip();
  auto verdict = handshake_.evaluate(input_, output_);
  input_.compact();
  auto flushed = conn.flush(output_);

  if (verdict != HandshakeState::kAccepted) {
    stats_.add(stats_.handshakes_rejected);
    return Status::error(handshake_.failure());
  }
  if (!flushed) {
    return flushed;
  }
  PROBELINK_LOG_INFO("Handshake accepted");
  return Status::success();
}

Status Server::process_messages(Clock::time_point frame_start, Connection& conn) {
  auto read = conn.read_available(input_);
  if (!read) {
    return Status::error(read.get_error());
  }
  if (read.value() == 0) {
    return Status::success();
  }

  input_.flip();
  Status result = Status::success();
  while (true) {
    auto frame = wire::extract_frame(input_);
    if (!frame) {
      if (frame.get_error() != ErrorCode::kNeedMoreData) {
        PROBELINK_LOG_ERROR(std::string("Invalid length in message: ") + error_string(frame.get_error()));
        result = Status::error(frame.get_error());
      }
      break;
    }

    heartbeat_.on_activity(frame_start);
    result = dispatcher_.dispatch(frame_start, frame.value(), output_, conn);
    if (!result) {
      break;
    }
  }
  input_.compact();
  return result;
}

void Server::finish_tick(Clock::time_point frame_start) {
  auto elapsed = Clock::now() - frame_start;
  auto tick_us = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
  stats_.last_tick_us.store(tick_us, std::memory_order_relaxed);
  if (tick_us > stats_.max_tick_us.load(std::memory_order_relaxed)) {
    stats_.max_tick_us.store(tick_us, std::memory_order_relaxed);
  }

  if (elapsed < config_.tick_period) {
    cancel_.wait_for(config_.tick_period - elapsed);
  }
}

}  // namespace probelink
