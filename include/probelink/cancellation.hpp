/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Cooperative cancellation shared between the control thread and the worker.
 */

#ifndef PROBELINK_CANCELLATION_HPP_
#define PROBELINK_CANCELLATION_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace probelink {

class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(false, std::memory_order_release);
  }

  bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Sleep for |timeout| unless cancelled first. Returns true if cancelled.
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(std::memory_order_acquire); });
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace probelink

#endif  // PROBELINK_CANCELLATION_HPP_
