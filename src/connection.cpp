#include "probelink/connection.hpp"

#include "probelink/log.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <poll.h>
#include <sockpp/unix_address.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace probelink {

namespace {

int to_poll_ms(std::chrono::microseconds timeout) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
  if (ms <= 0) {
    return timeout.count() > 0 ? 1 : 0;
  }
  return static_cast<int>(ms);
}

bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK; }

}  // namespace

// ============================================================================
// Listener
// ============================================================================

Status Listener::open(const std::string& path) {
  close();

  // A previous process with the same pid may have left its socket file.
  ::unlink(path.c_str());

  if (!acceptor_.open(sockpp::unix_address(path))) {
    PROBELINK_LOG_ERROR("Failed to listen on " + path + ": " + acceptor_.last_error_str());
    return Status::error(ErrorCode::kListenFailed);
  }
  if (!acceptor_.set_non_blocking(true)) {
    PROBELINK_LOG_ERROR("Failed to make listener non-blocking: " + acceptor_.last_error_str());
    acceptor_.close();
    ::unlink(path.c_str());
    return Status::error(ErrorCode::kListenFailed);
  }

  path_ = path;
  PROBELINK_LOG_INFO("Listening on " + path_);
  return Status::success();
}

expected<bool, ErrorCode> Listener::accept_for(std::chrono::milliseconds timeout, sockpp::unix_socket& out) {
  if (!acceptor_.is_open()) {
    return expected<bool, ErrorCode>::error(ErrorCode::kSocketError);
  }

  pollfd pfd{acceptor_.handle(), POLLIN, 0};
  int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ret < 0) {
    if (errno == EINTR) {
      return expected<bool, ErrorCode>::success(false);
    }
    PROBELINK_LOG_ERROR(std::string("Poll on listener failed: ") + strerror(errno));
    return expected<bool, ErrorCode>::error(ErrorCode::kSocketError);
  }
  if (ret == 0) {
    return expected<bool, ErrorCode>::success(false);
  }
  if (pfd.revents & (POLLERR | POLLNVAL)) {
    return expected<bool, ErrorCode>::error(ErrorCode::kSocketError);
  }

  sockpp::unix_socket sock = acceptor_.accept();
  if (!sock) {
    int err = acceptor_.last_error();
    if (would_block(err) || err == EINTR || err == ECONNABORTED) {
      return expected<bool, ErrorCode>::success(false);
    }
    PROBELINK_LOG_ERROR("Accept error: " + acceptor_.last_error_str());
    return expected<bool, ErrorCode>::error(ErrorCode::kSocketError);
  }

  out = std::move(sock);
  return expected<bool, ErrorCode>::success(true);
}

void Listener::close() {
  if (acceptor_.is_open()) {
    acceptor_.close();
  }
  if (!path_.empty()) {
    ::unlink(path_.c_str());
    path_.clear();
  }
}

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(sockpp::unix_socket&& sock, CancellationToken& token, std::chrono::milliseconds write_timeout,
                       ServerStats* stats)
    : socket_(std::move(sock)), token_(token), write_timeout_(write_timeout), stats_(stats) {
  if (!socket_.set_non_blocking(true)) {
    // Reads would then block the tick; drop the client instead.
    PROBELINK_LOG_ERROR("Failed to make client socket non-blocking: " + socket_.last_error_str());
    socket_.close();
  }
}

Connection::~Connection() { close(); }

void Connection::close() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

expected<bool, ErrorCode> Connection::wait_ready(short events, std::chrono::microseconds timeout) {
  pollfd pfd{socket_.handle(), events, 0};
  int ret = ::poll(&pfd, 1, to_poll_ms(timeout));
  if (ret < 0) {
    if (errno == EINTR) {
      return expected<bool, ErrorCode>::success(false);
    }
    return expected<bool, ErrorCode>::error(ErrorCode::kSocketError);
  }
  if (ret == 0) {
    return expected<bool, ErrorCode>::success(false);
  }
  // POLLHUP/POLLERR still report ready; the following read/write sees the
  // actual condition.
  return expected<bool, ErrorCode>::success(true);
}

expected<size_t, ErrorCode> Connection::read_available(ByteBuffer& input) {
  size_t space = input.remaining();
  if (space == 0) {
    PROBELINK_LOG_ERROR("Input buffer full");
    return expected<size_t, ErrorCode>::error(ErrorCode::kBufferOverflow);
  }

  ssize_t n = socket_.read(input.cursor_ptr(), space);
  if (n > 0) {
    input.skip(static_cast<size_t>(n));
    if (stats_ != nullptr) {
      stats_->add(stats_->bytes_in, static_cast<uint64_t>(n));
    }
    return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
  }
  if (n == 0) {
    PROBELINK_LOG_INFO("Client closed the connection");
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  int err = socket_.last_error();
  if (would_block(err) || err == EINTR) {
    return expected<size_t, ErrorCode>::success(0);
  }
  PROBELINK_LOG_ERROR("Read error: " + socket_.last_error_str());
  return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
}

Status Connection::read_exact(ByteBuffer& input, size_t want, Clock::time_point deadline,
                              std::chrono::microseconds slice) {
  if (!socket_.is_open()) {
    return Status::error(ErrorCode::kSocketError);
  }
  if (input.remaining() < want) {
    return Status::error(ErrorCode::kBufferOverflow);
  }

  size_t got = 0;
  while (got < want) {
    if (token_.is_cancelled()) {
      return Status::error(ErrorCode::kCancelled);
    }
    auto now = Clock::now();
    if (now >= deadline) {
      return Status::error(ErrorCode::kTimeout);
    }

    auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);
    auto ready = wait_ready(POLLIN, std::min(left, slice));
    if (!ready) {
      return Status::error(ready.get_error());
    }
    if (!ready.value()) {
      continue;
    }

    ssize_t n = socket_.read(input.cursor_ptr(), want - got);
    if (n > 0) {
      input.skip(static_cast<size_t>(n));
      got += static_cast<size_t>(n);
      if (stats_ != nullptr) {
        stats_->add(stats_->bytes_in, static_cast<uint64_t>(n));
      }
      continue;
    }
    if (n == 0) {
      return Status::error(ErrorCode::kConnectionClosed);
    }
    int err = socket_.last_error();
    if (!would_block(err) && err != EINTR) {
      PROBELINK_LOG_ERROR("Read error: " + socket_.last_error_str());
      return Status::error(ErrorCode::kSocketError);
    }
  }
  return Status::success();
}

Status Connection::flush(ByteBuffer& output) {
  output.flip();
  if (!output.has_remaining()) {
    output.clear();
    return Status::success();
  }

  size_t total = output.remaining();
  auto waited = std::chrono::microseconds::zero();
  const auto slice = std::chrono::microseconds(std::chrono::milliseconds(10));

  while (output.has_remaining()) {
    // MSG_NOSIGNAL: a vanished client must not raise SIGPIPE in the host.
    ssize_t n = ::send(socket_.handle(), output.cursor_ptr(), output.remaining(), MSG_NOSIGNAL);
    if (n > 0) {
      output.skip(static_cast<size_t>(n));
      continue;
    }

    if (n == 0) {
      output.clear();
      return Status::error(ErrorCode::kConnectionClosed);
    }
    int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (would_block(err)) {
      if (token_.is_cancelled()) {
        output.clear();
        return Status::error(ErrorCode::kCancelled);
      }
      if (waited >= write_timeout_) {
        PROBELINK_LOG_ERROR("Client stopped reading, write timed out");
        output.clear();
        return Status::error(ErrorCode::kTimeout);
      }
      auto ready = wait_ready(POLLOUT, slice);
      if (!ready) {
        output.clear();
        return Status::error(ready.get_error());
      }
      waited += slice;
      continue;
    }

    PROBELINK_LOG_ERROR(std::string("Write error: ") + strerror(err));
    output.clear();
    return Status::error(ErrorCode::kSocketError);
  }

  if (stats_ != nullptr) {
    stats_->add(stats_->bytes_out, total);
  }
  PROBELINK_LOG_DEBUG("Wrote " + std::to_string(total) + " bytes");
  output.clear();
  return Status::success();
}

}  // namespace probelink
