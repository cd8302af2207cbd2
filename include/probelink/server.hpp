#ifndef PROBELINK_SERVER_HPP_
#define PROBELINK_SERVER_HPP_

#include "byte_buffer.hpp"
#include "cancellation.hpp"
#include "component.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "control_component.hpp"
#include "dispatcher.hpp"
#include "handshake.hpp"
#include "heartbeat.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace probelink {

// ============================================================================
// Server state
// ============================================================================

enum class ServerState : uint8_t {
  kIdle,         // not started, or stopped
  kListening,    // waiting for a client
  kHandshaking,  // client connected, waiting for the version handshake
  kActive,       // ticking
  kClosing       // notifying components, closing the client socket
};

const char* state_name(ServerState state);

// ============================================================================
// Server (single client, single worker thread)
// ============================================================================

/**
 * Owns the listening socket, the input/output buffers and the component
 * registry. start() spawns one worker thread that runs accept, handshake and
 * the fixed-rate tick loop; stop() cancels and joins it. Both are reentrant.
 *
 * Components must be registered before start(). The server component (id 0)
 * is registered by the constructor.
 */
class Server {
 public:
  using ComponentPtr = std::shared_ptr<Component>;

  static constexpr size_t kInputBufferSize = 1024;
  static constexpr size_t kOutputBufferSize = 64 * 1024;

  explicit Server(const ServerConfig& config = ServerConfig());
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // error(kInvalidState) while running, otherwise see
  // ComponentDispatcher::register_component().
  Status register_component(ComponentPtr component);

  // Calls initialize() on every registered component. Not while running.
  Status initialize();

  // Opens the listening socket and spawns the worker. No-op while running.
  Status start();

  // Cancels, joins the worker and closes the listening socket. No-op if not
  // running.
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }
  ServerState state() const { return state_.load(std::memory_order_acquire); }

  // Error that ended the last active session; kOk before the first one and
  // when stop() ended it.
  ErrorCode last_drop_reason() const { return last_drop_reason_.load(std::memory_order_acquire); }

  // Only meaningful once start() succeeded.
  std::string socket_path() const { return config_.socket_path(); }

  // Configuration (ignored while running)
  Server& set_tick_period(std::chrono::microseconds period);
  Server& set_heartbeat(std::chrono::milliseconds interval, std::chrono::milliseconds timeout);
  Server& set_handshake_timeout(std::chrono::milliseconds timeout);
  Server& set_accept_retry(std::chrono::milliseconds retry);
  Server& set_socket_name(const std::string& name);

  const ServerConfig& config() const { return config_; }

  // Performance monitoring
  const ServerStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  void run();
  Status serve(sockpp::unix_socket&& sock);
  Status negotiate(Connection& conn, Clock::time_point accepted_at);
  Status process_messages(Clock::time_point frame_start, Connection& conn);
  void finish_tick(Clock::time_point frame_start);
  bool configurable(const char* what) const;

  ServerConfig config_;
  ServerStats stats_;

  std::atomic<ServerState> state_{ServerState::kIdle};
  std::atomic<bool> running_{false};
  std::atomic<ErrorCode> last_drop_reason_{ErrorCode::kOk};
  std::mutex lifecycle_mutex_;  // serializes start()/stop()/registration
  std::thread worker_;

  std::mutex started_mutex_;
  std::condition_variable started_cv_;
  bool worker_started_ = false;

  CancellationToken cancel_;
  Listener listener_;

  // Worker-thread state
  HeartbeatMonitor heartbeat_;
  HandshakeNegotiator handshake_;
  ComponentDispatcher dispatcher_;
  std::shared_ptr<ControlComponent> control_;
  StaticByteBuffer<kInputBufferSize> input_;
  StaticByteBuffer<kOutputBufferSize> output_;
};

}  // namespace probelink

#endif  // PROBELINK_SERVER_HPP_
