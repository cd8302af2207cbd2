#include "probelink.hpp"

#include <cerrno>
#include <cstring>

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace probelink;
using std::chrono::milliseconds;

// ============================================================================
// Minimal profiler test client (raw POSIX unix socket)
// ============================================================================

struct RawFrame {
  MessageHeader header;
  std::vector<uint8_t> payload;
};

class ProbeTestClient {
 public:
  ProbeTestClient() = default;
  ~ProbeTestClient() { disconnect(); }

  bool connect(const std::string& path) {
    fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0)
      return false;

    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      ::close(fd_);
      fd_ = -1;
      return false;
    }
    return true;
  }

  void disconnect() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  bool send_raw(const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
      ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
      if (n <= 0)
        return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  std::vector<uint8_t> encode(uint16_t id, uint8_t flags, uint8_t type, uint8_t sub,
                              const std::vector<uint8_t>& payload = {}) {
    std::vector<uint8_t> bytes(wire::kHeaderSize + payload.size());
    wire::store_le16(bytes.data(), id);
    wire::store_le16(bytes.data() + 2, static_cast<uint16_t>(bytes.size()));
    bytes[4] = flags;
    bytes[5] = type;
    bytes[6] = sub;
    if (!payload.empty()) {
      std::memcpy(bytes.data() + wire::kHeaderSize, payload.data(), payload.size());
    }
    return bytes;
  }

  bool send_frame(uint16_t id, uint8_t flags, uint8_t type, uint8_t sub, const std::vector<uint8_t>& payload = {}) {
    auto bytes = encode(id, flags, type, sub, payload);
    return send_raw(bytes.data(), bytes.size());
  }

  bool send_handshake(uint32_t version, uint16_t id = 0) {
    std::vector<uint8_t> version_bytes(4);
    wire::store_le32(version_bytes.data(), version);
    return send_frame(id, wire::kRequestFlags, wire::kServerComponentId, wire::kSubtypeHandshake, version_bytes);
  }

  bool recv_frame(RawFrame& out, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + milliseconds(timeout_ms);
    uint8_t raw[wire::kHeaderSize];
    if (!recv_exact(raw, sizeof(raw), deadline))
      return false;
    out.header.id = wire::load_le16(raw);
    out.header.length = wire::load_le16(raw + 2);
    out.header.flags = raw[4];
    out.header.component_type = raw[5];
    out.header.sub_type = raw[6];
    out.payload.assign(out.header.payload_size(), 0);
    if (out.payload.empty())
      return true;
    return recv_exact(out.payload.data(), out.payload.size(), deadline);
  }

  // Skip server pings until a frame that is not one arrives.
  bool recv_reply(RawFrame& out, int timeout_ms = 2000) {
    while (recv_frame(out, timeout_ms)) {
      bool server_ping = out.header.component_type == wire::kServerComponentId &&
                         out.header.sub_type == wire::kSubtypePing && !out.header.is_response();
      if (!server_ping)
        return true;
    }
    return false;
  }

  // True once the server has closed its end.
  bool wait_closed(int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + milliseconds(timeout_ms);
    uint8_t scratch[256];
    while (true) {
      int left = remaining_ms(deadline);
      if (left <= 0)
        return false;
      pollfd pfd{fd_, POLLIN, 0};
      int r = ::poll(&pfd, 1, left);
      if (r < 0 && errno == EINTR)
        continue;
      if (r <= 0)
        return false;
      ssize_t n = ::recv(fd_, scratch, sizeof(scratch), 0);
      if (n <= 0)
        return true;
    }
  }

  bool handshake(uint32_t version = wire::kProtocolVersion) {
    RawFrame reply;
    return send_handshake(version, 1) && recv_frame(reply) && reply.payload.size() == 1 &&
           reply.payload[0] == wire::kStatusOk;
  }

 private:
  static int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
  }

  bool recv_exact(uint8_t* dst, size_t len, std::chrono::steady_clock::time_point deadline) {
    size_t got = 0;
    while (got < len) {
      int left = remaining_ms(deadline);
      if (left <= 0)
        return false;
      pollfd pfd{fd_, POLLIN, 0};
      int r = ::poll(&pfd, 1, left);
      if (r < 0 && errno == EINTR)
        continue;
      if (r <= 0)
        return false;
      ssize_t n = ::recv(fd_, dst + got, len - got, 0);
      if (n <= 0)
        return false;
      got += static_cast<size_t>(n);
    }
    return true;
  }

  int fd_ = -1;
};

// ============================================================================
// Test component (counters read from the test thread)
// ============================================================================

class EchoComponent : public Component {
 public:
  explicit EchoComponent(uint8_t id) : id_(id) {}

  uint8_t id() const override { return id_; }

  optional<StatusString> configure(uint8_t flags) override {
    flags_.store(flags);
    return StatusString("echo configured");
  }

  void on_client_connected(ByteBuffer&) override { connected.fetch_add(1); }
  void on_client_disconnected() override { disconnected.fetch_add(1); }

  Status handle_message(Clock::time_point, const Frame& frame, ByteBuffer& output) override {
    if (frame.header.component_type != id_) {
      return Status::success();
    }
    handled.fetch_add(1);
    if (fail) {
      return Status::error(ErrorCode::kComponentFailure);
    }
    if (!wire::write_frame(output, frame.header.response(), frame.payload, frame.payload_size)) {
      return Status::error(ErrorCode::kBufferOverflow);
    }
    return Status::success();
  }

  UpdateResult update(Clock::time_point, ByteBuffer&) override {
    updates.fetch_add(1);
    return UpdateResult::kDone;
  }

  std::atomic<int> connected{0};
  std::atomic<int> disconnected{0};
  std::atomic<int> handled{0};
  std::atomic<int> updates{0};
  bool fail = false;

 private:
  uint8_t id_;
  std::atomic<uint8_t> flags_{0};
};

// ============================================================================
// Helpers
// ============================================================================

namespace {

ServerConfig test_config() {
  static std::atomic<int> counter{0};
  ServerConfig config;
  config.socket_dir = "/tmp";
  config.socket_name = "probelink_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1));
  config.tick_period = std::chrono::microseconds(1000);
  config.accept_retry = milliseconds(20);
  config.log_level = Logger::Level::kWarn;
  return config;
}

template <typename Pred>
bool wait_until(Pred pred, int timeout_ms = 2000) {
  auto deadline = std::chrono::steady_clock::now() + milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(milliseconds(2));
  }
  return pred();
}

bool socket_file_exists(const std::string& path) { return ::access(path.c_str(), F_OK) == 0; }

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("Integration - start and stop are reentrant", "[integration]") {
  Server server(test_config());
  REQUIRE(server.state() == ServerState::kIdle);

  REQUIRE(server.start().has_value());
  REQUIRE(server.start().has_value());
  REQUIRE(server.is_running());
  REQUIRE(socket_file_exists(server.socket_path()));
  REQUIRE(wait_until([&] { return server.state() == ServerState::kListening; }));

  server.stop();
  server.stop();
  REQUIRE(!server.is_running());
  REQUIRE(server.state() == ServerState::kIdle);
  REQUIRE(!socket_file_exists(server.socket_path()));
}

TEST_CASE("Integration - server can be restarted", "[integration]") {
  Server server(test_config());
  REQUIRE(server.start().has_value());
  server.stop();
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());
  server.stop();
}

TEST_CASE("Integration - invalid configuration does not start", "[integration]") {
  ServerConfig config = test_config();
  config.heartbeat_timeout = config.heartbeat_interval;
  Server server(config);
  auto started = server.start();
  REQUIRE(!started);
  REQUIRE(started.get_error() == ErrorCode::kInvalidConfig);
  REQUIRE(!server.is_running());
}

TEST_CASE("Integration - components cannot be added while running", "[integration]") {
  Server server(test_config());
  REQUIRE(server.register_component(std::make_shared<EchoComponent>(1)).has_value());
  REQUIRE(server.start().has_value());
  REQUIRE(server.register_component(std::make_shared<EchoComponent>(2)).get_error() == ErrorCode::kInvalidState);
  REQUIRE(server.initialize().get_error() == ErrorCode::kInvalidState);
  server.stop();
}

TEST_CASE("Integration - server component id is taken", "[integration]") {
  Server server(test_config());
  REQUIRE(server.register_component(std::make_shared<EchoComponent>(wire::kServerComponentId)).get_error() ==
          ErrorCode::kDuplicateComponent);
}

// ============================================================================
// Handshake
// ============================================================================

TEST_CASE("Integration - matching handshake activates the link", "[integration]") {
  Server server(test_config());
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.send_handshake(wire::kProtocolVersion, 99));

  RawFrame reply;
  REQUIRE(client.recv_frame(reply));
  REQUIRE(reply.header.id == 99);
  REQUIRE(reply.header.is_response());
  REQUIRE(reply.header.sub_type == wire::kSubtypeHandshake);
  REQUIRE(reply.payload.size() == 1);
  REQUIRE(reply.payload[0] == wire::kStatusOk);

  REQUIRE(wait_until([&] { return server.state() == ServerState::kActive; }));
  REQUIRE(wait_until([&] { return echo->connected.load() == 1; }));
  REQUIRE(server.stats().handshakes_accepted.load() == 1);
  server.stop();
}

TEST_CASE("Integration - wrong version is rejected and the next client is served", "[integration]") {
  Server server(test_config());
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  {
    ProbeTestClient client;
    REQUIRE(client.connect(server.socket_path()));
    REQUIRE(client.send_handshake(wire::kProtocolVersion + 7));
    RawFrame reply;
    REQUIRE(client.recv_frame(reply));
    REQUIRE(reply.payload.size() == 1);
    REQUIRE(reply.payload[0] == wire::kStatusError);
    REQUIRE(client.wait_closed());
  }
  REQUIRE(wait_until([&] { return server.stats().handshakes_rejected.load() == 1; }));
  REQUIRE(echo->connected.load() == 0);
  REQUIRE(echo->disconnected.load() == 0);

  ProbeTestClient second;
  REQUIRE(second.connect(server.socket_path()));
  REQUIRE(second.handshake());
  REQUIRE(wait_until([&] { return echo->connected.load() == 1; }));
  server.stop();
}

TEST_CASE("Integration - silent client is dropped after the handshake timeout", "[integration]") {
  Server server(test_config());
  server.set_handshake_timeout(milliseconds(100));
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.wait_closed(2000));
  server.stop();
}

// ============================================================================
// Message flow
// ============================================================================

TEST_CASE("Integration - frames reach their component", "[integration]") {
  Server server(test_config());
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());

  REQUIRE(client.send_frame(10, wire::kRequestFlags, 3, 4, {1, 2, 3}));
  RawFrame reply;
  REQUIRE(client.recv_reply(reply));
  REQUIRE(reply.header.id == 10);
  REQUIRE(reply.header.is_response());
  REQUIRE(reply.header.component_type == 3);
  REQUIRE(reply.payload == std::vector<uint8_t>{1, 2, 3});
  REQUIRE(echo->handled.load() == 1);
  REQUIRE(echo->updates.load() > 0);
  server.stop();
}

TEST_CASE("Integration - several frames in one write are all handled", "[integration]") {
  Server server(test_config());
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());

  std::vector<uint8_t> burst;
  for (uint16_t id = 1; id <= 5; ++id) {
    auto frame = client.encode(id, wire::kRequestFlags, 3, 0, {static_cast<uint8_t>(id)});
    burst.insert(burst.end(), frame.begin(), frame.end());
  }
  REQUIRE(client.send_raw(burst.data(), burst.size()));

  for (uint16_t id = 1; id <= 5; ++id) {
    RawFrame reply;
    REQUIRE(client.recv_reply(reply));
    REQUIRE(reply.header.id == id);
  }
  REQUIRE(echo->handled.load() == 5);
  server.stop();
}

TEST_CASE("Integration - frame split across writes is dispatched once", "[integration]") {
  Server server(test_config());
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());

  auto frame = client.encode(21, wire::kRequestFlags, 3, 0, {9, 8, 7, 6, 5});
  REQUIRE(client.send_raw(frame.data(), 4));
  std::this_thread::sleep_for(milliseconds(30));
  REQUIRE(echo->handled.load() == 0);
  REQUIRE(client.send_raw(frame.data() + 4, frame.size() - 4));

  RawFrame reply;
  REQUIRE(client.recv_reply(reply));
  REQUIRE(reply.header.id == 21);
  REQUIRE(reply.payload.size() == 5);
  std::this_thread::sleep_for(milliseconds(30));
  REQUIRE(echo->handled.load() == 1);
  server.stop();
}

TEST_CASE("Integration - client ping is answered", "[integration]") {
  Server server(test_config());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());
  REQUIRE(client.send_frame(77, wire::kRequestFlags, wire::kServerComponentId, wire::kSubtypePing));

  RawFrame pong;
  REQUIRE(client.recv_reply(pong));
  REQUIRE(pong.header.id == 77);
  REQUIRE(pong.header.is_response());
  REQUIRE(pong.header.sub_type == wire::kSubtypePing);
  server.stop();
}

TEST_CASE("Integration - enable bits reaches the target component", "[integration]") {
  Server server(test_config());
  auto echo = std::make_shared<EchoComponent>(5);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());
  REQUIRE(client.send_frame(30, wire::kRequestFlags, wire::kServerComponentId, wire::kSubtypeEnableBits, {5, 1}));

  RawFrame reply;
  REQUIRE(client.recv_reply(reply));
  REQUIRE(reply.header.id == 30);
  REQUIRE(reply.header.is_response());
  REQUIRE(std::string(reply.payload.begin(), reply.payload.end()) == "echo configured");
  server.stop();
}

TEST_CASE("Integration - oversized length drops the client", "[integration]") {
  Server server(test_config());
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());

  uint8_t header[wire::kHeaderSize];
  wire::store_le16(header, 1);
  wire::store_le16(header + 2, static_cast<uint16_t>(Server::kInputBufferSize + 1));
  header[4] = 0;
  header[5] = 3;
  header[6] = 0;
  REQUIRE(client.send_raw(header, sizeof(header)));
  REQUIRE(client.wait_closed());
  REQUIRE(wait_until([&] { return echo->disconnected.load() == 1; }));
  server.stop();
}

TEST_CASE("Integration - second handshake is ignored", "[integration]") {
  Server server(test_config());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());
  REQUIRE(client.send_handshake(wire::kProtocolVersion, 2));

  REQUIRE(client.send_frame(21, wire::kRequestFlags, wire::kServerComponentId, wire::kSubtypePing, {}));
  RawFrame pong;
  REQUIRE(client.recv_reply(pong));
  REQUIRE(pong.header.id == 21);
  REQUIRE(server.stats().reconnects.load() == 0);
  REQUIRE(server.state() == ServerState::kActive);
  server.stop();
}

TEST_CASE("Integration - failing component keeps the link open", "[integration]") {
  Server server(test_config());
  auto failing = std::make_shared<EchoComponent>(2);
  failing->fail = true;
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(failing).has_value());
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());

  REQUIRE(client.send_frame(30, wire::kRequestFlags, 2, 0, {9}));
  REQUIRE(client.send_frame(31, wire::kRequestFlags, 3, 0, {8}));
  RawFrame reply;
  REQUIRE(client.recv_reply(reply));
  REQUIRE(reply.header.id == 31);
  REQUIRE(reply.payload == std::vector<uint8_t>{8});
  REQUIRE(failing->handled.load() == 1);
  REQUIRE(server.stats().component_failures.load() == 1);
  REQUIRE(failing->disconnected.load() == 0);
  server.stop();
}

// ============================================================================
// Disconnect handling
// ============================================================================

TEST_CASE("Integration - client disconnect notifies components exactly once", "[integration]") {
  Server server(test_config());
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  {
    ProbeTestClient client;
    REQUIRE(client.connect(server.socket_path()));
    REQUIRE(client.handshake());
    REQUIRE(wait_until([&] { return echo->connected.load() == 1; }));
  }

  REQUIRE(wait_until([&] { return echo->disconnected.load() == 1; }));
  REQUIRE(wait_until([&] { return server.state() == ServerState::kListening; }));
  std::this_thread::sleep_for(milliseconds(50));
  REQUIRE(echo->disconnected.load() == 1);
  REQUIRE(server.stats().reconnects.load() == 1);

  server.stop();
  REQUIRE(echo->disconnected.load() == 1);
}

TEST_CASE("Integration - stop with a client attached disconnects it", "[integration]") {
  Server server(test_config());
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());
  REQUIRE(wait_until([&] { return echo->connected.load() == 1; }));

  server.stop();
  REQUIRE(echo->disconnected.load() == 1);
  REQUIRE(client.wait_closed());
}

// ============================================================================
// Heartbeat
// ============================================================================

TEST_CASE("Integration - unanswered pings time the client out", "[integration]") {
  Server server(test_config());
  server.set_heartbeat(milliseconds(50), milliseconds(150));
  auto echo = std::make_shared<EchoComponent>(3);
  REQUIRE(server.register_component(echo).has_value());
  REQUIRE(server.start().has_value());

  {
    ProbeTestClient client;
    REQUIRE(client.connect(server.socket_path()));
    REQUIRE(client.handshake());

    RawFrame ping;
    REQUIRE(client.recv_frame(ping, 1000));
    REQUIRE(ping.header.component_type == wire::kServerComponentId);
    REQUIRE(ping.header.sub_type == wire::kSubtypePing);
    REQUIRE(!ping.header.is_response());
    REQUIRE(ping.header.id == 0);

    REQUIRE(client.wait_closed(2000));
  }

  REQUIRE(wait_until([&] { return server.stats().heartbeat_timeouts.load() == 1; }));
  REQUIRE(server.stats().pings_sent.load() == 1);
  REQUIRE(wait_until([&] { return echo->disconnected.load() == 1; }));
  REQUIRE(wait_until([&] { return server.last_drop_reason() == ErrorCode::kHeartbeatTimeout; }));

  ProbeTestClient next;
  REQUIRE(next.connect(server.socket_path()));
  REQUIRE(next.handshake());
  server.stop();
}

TEST_CASE("Integration - answered pings keep the link open", "[integration]") {
  Server server(test_config());
  server.set_heartbeat(milliseconds(30), milliseconds(500));
  REQUIRE(server.start().has_value());

  ProbeTestClient client;
  REQUIRE(client.connect(server.socket_path()));
  REQUIRE(client.handshake());

  for (uint16_t expected_id = 0; expected_id < 3; ++expected_id) {
    RawFrame ping;
    REQUIRE(client.recv_frame(ping, 1000));
    REQUIRE(ping.header.sub_type == wire::kSubtypePing);
    REQUIRE(ping.header.id == expected_id);
    REQUIRE(client.send_frame(ping.header.id, wire::kResponseFlag, wire::kServerComponentId, wire::kSubtypePing));
  }

  REQUIRE(wait_until([&] { return server.stats().pongs_received.load() == 3; }));
  REQUIRE(server.stats().heartbeat_timeouts.load() == 0);
  REQUIRE(server.state() == ServerState::kActive);
  server.stop();
}
