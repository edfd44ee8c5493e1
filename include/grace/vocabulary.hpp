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
 * @brief Vocabulary types for GRACE: ErrorCode, Error, expected.
 *
 * Every fallible operation in the library returns expected<V, Error>.
 * Constructors that cannot produce a usable object report through GRACE_THROW.
 */

#ifndef GRACE_VOCABULARY_HPP_
#define GRACE_VOCABULARY_HPP_

#include <cstdint>
#include <cstring>

#include <new>
#include <string>
#include <type_traits>
#include <utility>

// Assertion macro (no-op in release)
#ifndef GRACE_ASSERT
#define GRACE_ASSERT(cond) ((void)(cond))
#endif

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define GRACE_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define GRACE_THROW(ex)           \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace grace {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kSocketError = 1,
  kAcceptFailed = 2,
  kListenerClosed = 3,
  kConnectionClosed = 4,
  kCloseFailed = 5,
  kSocketOptionFailed = 6,
  kClosedAfterShutdown = 7  // Accept failed after an intentional close
};

inline const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kSocketError:
      return "socket error";
    case ErrorCode::kAcceptFailed:
      return "accept failed";
    case ErrorCode::kListenerClosed:
      return "use of closed listener";
    case ErrorCode::kConnectionClosed:
      return "use of closed connection";
    case ErrorCode::kCloseFailed:
      return "close failed";
    case ErrorCode::kSocketOptionFailed:
      return "socket option failed";
    case ErrorCode::kClosedAfterShutdown:
      return "listener closed after shutdown";
  }
  return "unknown error";
}

/**
 * @brief Error value: a code, the code of the error it wraps, and the OS errno.
 *
 * A plain error has cause() == code(). A shutdown-classified error has
 * code() == kClosedAfterShutdown and keeps the original failure in cause()
 * and sys_errno(), so nothing about the underlying failure is lost.
 */
class Error {
 public:
  Error() noexcept = default;

  explicit Error(ErrorCode code, int sys_errno = 0) noexcept
      : code_(code), cause_(code), sys_errno_(sys_errno) {}

  static Error closed_after_shutdown(const Error& cause) noexcept {
    Error e(cause);
    e.code_ = ErrorCode::kClosedAfterShutdown;
    return e;
  }

  ErrorCode code() const noexcept { return code_; }

  // Code of the original failure (equals code() unless this error wraps one).
  ErrorCode cause() const noexcept { return cause_; }

  int sys_errno() const noexcept { return sys_errno_; }

  bool is_closed_after_shutdown() const noexcept {
    return code_ == ErrorCode::kClosedAfterShutdown;
  }

  // Unwraps a shutdown-classified error into the failure it carries.
  Error unwrap() const noexcept { return Error(cause_, sys_errno_); }

  std::string message() const {
    std::string msg;
    if (is_closed_after_shutdown()) {
      msg = to_string(code_);
      msg += ": ";
    }
    msg += to_string(cause_);
    if (sys_errno_ != 0) {
      msg += ": ";
      msg += std::strerror(sys_errno_);
    }
    return msg;
  }

  bool operator==(const Error& other) const noexcept {
    return code_ == other.code_ && cause_ == other.cause_ && sys_errno_ == other.sys_errno_;
  }
  bool operator!=(const Error& other) const noexcept { return !(*this == other); }

 private:
  ErrorCode code_ = ErrorCode::kOk;
  ErrorCode cause_ = ErrorCode::kOk;
  int sys_errno_ = 0;
};

inline bool is_closed_after_shutdown(const Error& err) noexcept {
  return err.is_closed_after_shutdown();
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct. V may be
 * move-only (e.g. std::unique_ptr<Conn>); take the value with
 * std::move(result.value()).
 */
template <typename V, typename E = Error>
class expected final {
 public:
  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected success(const V& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  expected(expected&& other) noexcept : err_(other.err_), has_value_(other.has_value_) {
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

  expected(const expected&) = delete;
  expected& operator=(const expected&) = delete;

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    GRACE_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    GRACE_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  const E& get_error() const noexcept {
    GRACE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

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
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    GRACE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

}  // namespace grace

#endif  // GRACE_VOCABULARY_HPP_
