#include "probelink.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_quit{false};

void on_signal(int) { g_quit.store(true); }

// Streams a frame counter once per tick while enabled by the client.
class FrameCounterComponent : public probelink::Component {
 public:
  static constexpr uint8_t kId = 1;
  static constexpr uint8_t kSubtypeSample = 0;
  static constexpr uint8_t kSubtypeReset = 1;

  uint8_t id() const override { return kId; }

  probelink::optional<probelink::StatusString> configure(uint8_t flags) override {
    enabled_ = (flags & 0x01) != 0;
    if (enabled_) {
      return probelink::StatusString("frame counter on");
    }
    return probelink::StatusString("frame counter off");
  }

  void on_client_connected(probelink::ByteBuffer&) override {
    std::cout << "Profiler attached" << std::endl;
  }

  void on_client_disconnected() override {
    enabled_ = false;
    std::cout << "Profiler detached" << std::endl;
  }

  probelink::Status handle_message(probelink::Clock::time_point, const probelink::Frame& frame,
                                   probelink::ByteBuffer& output) override {
    if (frame.header.component_type != kId || frame.header.sub_type != kSubtypeReset) {
      return probelink::Status::success();
    }
    count_ = 0;
    if (!probelink::wire::write_header(output, frame.header.response())) {
      return probelink::Status::error(probelink::ErrorCode::kBufferOverflow);
    }
    return probelink::Status::success();
  }

  probelink::UpdateResult update(probelink::Clock::time_point, probelink::ByteBuffer& output) override {
    ++count_;
    if (!enabled_) {
      return probelink::UpdateResult::kDone;
    }

    uint8_t payload[4];
    probelink::wire::store_le32(payload, count_);
    probelink::MessageHeader header;
    header.id = sample_id_++;
    header.component_type = kId;
    header.sub_type = kSubtypeSample;
    if (!probelink::wire::write_frame(output, header, payload, sizeof(payload))) {
      PROBELINK_LOG_DEBUG("Output full, sample skipped");
      return probelink::UpdateResult::kDone;
    }
    return probelink::UpdateResult::kDone;
  }

 private:
  bool enabled_ = false;
  uint32_t count_ = 0;
  uint16_t sample_id_ = 0;
};

}  // namespace

int main(int argc, char* argv[]) {
  probelink::ServerConfig config;
  if (argc > 1) {
    config.socket_dir = argv[1];
  }
  if (argc > 2 && std::string(argv[2]) == "-v") {
    config.log_level = probelink::Logger::Level::kDebug;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  probelink::Server server(config);

  auto registered = server.register_component(std::make_shared<FrameCounterComponent>());
  if (!registered) {
    std::cerr << "Error: " << probelink::error_string(registered.get_error()) << std::endl;
    return 1;
  }
  auto initialized = server.initialize();
  if (!initialized) {
    std::cerr << "Error: " << probelink::error_string(initialized.get_error()) << std::endl;
    return 1;
  }

  auto started = server.start();
  if (!started) {
    std::cerr << "Error: " << probelink::error_string(started.get_error()) << std::endl;
    return 1;
  }
  std::cout << "Listening on " << server.socket_path() << std::endl;

  while (!g_quit.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  server.stop();

  const auto& stats = server.stats();
  std::cout << "Connections: " << stats.connections_accepted.load() << ", frames in: " << stats.frames_in.load()
            << ", bytes out: " << stats.bytes_out.load() << std::endl;
  return 0;
}
