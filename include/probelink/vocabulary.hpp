/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vocabulary.hpp
 * @brief Vocabulary types for probelink: ErrorCode, expected, optional,
 *        FixedVector, FixedString.
 *
 * All types are stack-allocated with zero heap overhead so the server keeps
 * a bounded memory footprint inside the monitored process.
 */

#ifndef PROBELINK_VOCABULARY_HPP_
#define PROBELINK_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

#ifndef PROBELINK_ASSERT
#define PROBELINK_ASSERT(cond) ((void)(cond))
#endif

namespace probelink {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kNeedMoreData = 1,
  kBufferOverflow = 2,
  kFrameParseError = 3,
  kFrameTooLarge = 4,
  kHandshakeFailed = 5,
  kHeartbeatTimeout = 7,
  kConnectionClosed = 8,
  kSocketError = 9,
  kTimeout = 10,
  kCancelled = 11,
  kComponentFailure = 12,
  kInvalidComponent = 13,
  kInvalidComponentId = 14,
  kDuplicateComponent = 15,
  kRegistryFull = 16,
  kInvalidState = 17,
  kInvalidConfig = 18,
  kListenFailed = 19,
  kInternalError = 255
};

// How the server loop reacts to an error surfacing from a connection.
enum class Disposition : uint8_t {
  kOk,         // keep going
  kReconnect,  // tear down the connection, return to accept
  kFatal       // end the worker thread
};

inline Disposition disposition(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
    case ErrorCode::kNeedMoreData:
      return Disposition::kOk;
    case ErrorCode::kListenFailed:
    case ErrorCode::kInvalidConfig:
    case ErrorCode::kInternalError:
      return Disposition::kFatal;
    default:
      return Disposition::kReconnect;
  }
}

inline const char* error_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kNeedMoreData: return "need more data";
    case ErrorCode::kBufferOverflow: return "buffer overflow";
    case ErrorCode::kFrameParseError: return "malformed frame";
    case ErrorCode::kFrameTooLarge: return "frame too large";
    case ErrorCode::kHandshakeFailed: return "handshake failed";
    case ErrorCode::kHeartbeatTimeout: return "heartbeat timeout";
    case ErrorCode::kConnectionClosed: return "connection closed";
    case ErrorCode::kSocketError: return "socket error";
    case ErrorCode::kTimeout: return "timeout";
    case ErrorCode::kCancelled: return "cancelled";
    case ErrorCode::kComponentFailure: return "component failure";
    case ErrorCode::kInvalidComponent: return "invalid component";
    case ErrorCode::kInvalidComponentId: return "invalid component id";
    case ErrorCode::kDuplicateComponent: return "duplicate component";
    case ErrorCode::kRegistryFull: return "registry full";
    case ErrorCode::kInvalidState: return "invalid state";
    case ErrorCode::kInvalidConfig: return "invalid config";
    case ErrorCode::kListenFailed: return "listen failed";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) noexcept
      : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept
      : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    PROBELINK_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    PROBELINK_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    PROBELINK_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const noexcept {
    return has_value_ ? value() : default_val;
  }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  void destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    PROBELINK_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

using Status = expected<void, ErrorCode>;

// ============================================================================
// optional<T> - Lightweight nullable value
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) noexcept : has_value_(true) {  // NOLINT
    ::new (&storage_) T(val);
  }

  optional(T&& val) noexcept : has_value_(true) {  // NOLINT
    ::new (&storage_) T(static_cast<T&&>(val));
  }

  optional(const optional& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(other.value());
    }
  }

  optional& operator=(const optional& other) noexcept {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) T(other.value());
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    PROBELINK_ASSERT(has_value_);
    return *reinterpret_cast<T*>(&storage_);
  }

  const T& value() const noexcept {
    PROBELINK_ASSERT(has_value_);
    return *reinterpret_cast<const T*>(&storage_);
  }

  void reset() noexcept {
    if (has_value_) {
      reinterpret_cast<T*>(&storage_)->~T();
      has_value_ = false;
    }
  }

 private:
  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity> - Stack-allocated fixed-capacity string
// ============================================================================

/**
 * @brief Fixed-capacity, null-terminated string.
 *
 * assign() truncates to Capacity characters; size() never exceeds it.
 */
template <uint32_t Capacity>
class FixedString {
  static_assert(Capacity > 0U, "FixedString capacity must be > 0");

 public:
  constexpr FixedString() noexcept : buf_{'\0'}, size_(0U) {}

  template <uint32_t N,
            typename = typename std::enable_if<(N <= Capacity + 1U)>::type>
  FixedString(const char (&str)[N]) noexcept : size_(N - 1U) {  // NOLINT
    static_assert(N > 0U, "String literal must include null terminator");
    std::memcpy(buf_, str, N);
  }

  // Returns false if the input was truncated.
  bool assign(const char* str, uint32_t len) noexcept {
    bool fits = len <= Capacity;
    size_ = fits ? len : Capacity;
    if (size_ > 0U) {
      std::memcpy(buf_, str, size_);
    }
    buf_[size_] = '\0';
    return fits;
  }

  [[nodiscard]] constexpr const char* c_str() const noexcept { return buf_; }
  [[nodiscard]] constexpr uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0U; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

// ============================================================================
// FixedVector<T, Capacity> - Stack-allocated fixed-capacity vector
// ============================================================================

/**
 * @brief Fixed-capacity vector with no heap allocation.
 *
 * Elements are contiguous, so begin()/end() work with <algorithm>.
 */
template <typename T, uint32_t Capacity>
class FixedVector final {
  static_assert(Capacity > 0U, "FixedVector capacity must be > 0");

 public:
  using value_type = T;
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept {}  // NOLINT

  ~FixedVector() noexcept { clear(); }

  FixedVector(const FixedVector&) = delete;
  FixedVector& operator=(const FixedVector&) = delete;

  T& operator[](uint32_t index) noexcept {
    return *reinterpret_cast<T*>(storage_ + index * sizeof(T));
  }

  const T& operator[](uint32_t index) const noexcept {
    return *reinterpret_cast<const T*>(storage_ + index * sizeof(T));
  }

  T* data() noexcept { return reinterpret_cast<T*>(storage_); }
  const T* data() const noexcept { return reinterpret_cast<const T*>(storage_); }

  iterator begin() noexcept { return data(); }
  const_iterator begin() const noexcept { return data(); }
  iterator end() noexcept { return data() + size_; }
  const_iterator end() const noexcept { return data() + size_; }

  [[nodiscard]] bool empty() const noexcept { return size_ == 0U; }
  [[nodiscard]] uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  [[nodiscard]] bool full() const noexcept { return size_ >= Capacity; }

  bool push_back(const T& value) noexcept { return emplace_back(value); }
  bool push_back(T&& value) noexcept { return emplace_back(static_cast<T&&>(value)); }

  template <typename... CtorArgs>
  bool emplace_back(CtorArgs&&... args) noexcept {
    if (size_ >= Capacity) {
      return false;
    }
    ::new (storage_ + size_ * sizeof(T)) T{static_cast<CtorArgs&&>(args)...};
    ++size_;
    return true;
  }

  void clear() noexcept {
    while (size_ > 0U) {
      --size_;
      (*this)[size_].~T();
    }
  }

 private:
  alignas(T) uint8_t storage_[sizeof(T) * Capacity];
  uint32_t size_{0U};
};

}  // namespace probelink

#endif  // PROBELINK_VOCABULARY_HPP_
