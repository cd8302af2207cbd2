#ifndef PROBELINK_CONNECTION_HPP_
#define PROBELINK_CONNECTION_HPP_

#include "byte_buffer.hpp"
#include "cancellation.hpp"
#include "component.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <sockpp/unix_acceptor.h>
#include <sockpp/unix_stream_socket.h>
#include <string>

namespace probelink {

// ============================================================================
// Listener (unix-domain listening endpoint)
// ============================================================================

class Listener {
 public:
  Listener() = default;
  ~Listener() { close(); }

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  // Removes a stale socket file at |path| before binding.
  Status open(const std::string& path);

  // Wait up to |timeout| for a client.
  // success(true) with |out| connected, success(false) if none arrived,
  // error(kSocketError) if the listener itself failed.
  expected<bool, ErrorCode> accept_for(std::chrono::milliseconds timeout, sockpp::unix_socket& out);

  // Closes the socket and removes the socket file.
  void close();

  bool is_open() const { return acceptor_.is_open(); }
  const std::string& path() const { return path_; }

 private:
  sockpp::unix_acceptor acceptor_;
  std::string path_;
};

// ============================================================================
// Connection (the single client link)
// ============================================================================

class Connection : public FrameSink {
 public:
  // |write_timeout| bounds how long flush() waits on a full socket.
  Connection(sockpp::unix_socket&& sock, CancellationToken& token, std::chrono::milliseconds write_timeout,
             ServerStats* stats = nullptr);
  ~Connection() override;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Read whatever is available without blocking, bounded by the free space
  // of |input| (write mode). success(0) if nothing is pending,
  // error(kConnectionClosed) on peer close, error(kSocketError) on failure,
  // error(kBufferOverflow) if |input| has no free space.
  expected<size_t, ErrorCode> read_available(ByteBuffer& input);

  // Read exactly |want| bytes into |input| (write mode), waiting in slices of
  // |slice| until |deadline|. error(kTimeout) past the deadline,
  // error(kCancelled) if the token fires first.
  Status read_exact(ByteBuffer& input, size_t want, Clock::time_point deadline, std::chrono::microseconds slice);

  Status flush(ByteBuffer& output) override;

  void close();

  bool is_open() const { return socket_.is_open(); }
  int get_fd() const { return socket_.handle(); }

 private:
  // poll() the socket for |events|. success(true) if ready.
  expected<bool, ErrorCode> wait_ready(short events, std::chrono::microseconds timeout);

  sockpp::unix_socket socket_;
  CancellationToken& token_;
  std::chrono::milliseconds write_timeout_;
  ServerStats* stats_;
};

}  // namespace probelink

#endif  // PROBELINK_CONNECTION_HPP_
