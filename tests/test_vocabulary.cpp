#include "grace/vocabulary.hpp"

#include <cerrno>

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>

using namespace grace;

// ============================================================================
// Error
// ============================================================================

TEST_CASE("Error - default is ok", "[vocabulary]") {
  Error err;
  REQUIRE(err.code() == ErrorCode::kOk);
  REQUIRE(err.cause() == ErrorCode::kOk);
  REQUIRE(err.sys_errno() == 0);
  REQUIRE(!err.is_closed_after_shutdown());
}

TEST_CASE("Error - plain error is its own cause", "[vocabulary]") {
  Error err(ErrorCode::kAcceptFailed, EMFILE);
  REQUIRE(err.code() == ErrorCode::kAcceptFailed);
  REQUIRE(err.cause() == ErrorCode::kAcceptFailed);
  REQUIRE(err.sys_errno() == EMFILE);
  REQUIRE(!is_closed_after_shutdown(err));
  REQUIRE(err.unwrap() == err);
}

TEST_CASE("Error - closed after shutdown keeps the original failure", "[vocabulary]") {
  Error original(ErrorCode::kListenerClosed, EBADF);
  Error wrapped = Error::closed_after_shutdown(original);

  REQUIRE(wrapped.code() == ErrorCode::kClosedAfterShutdown);
  REQUIRE(wrapped.is_closed_after_shutdown());
  REQUIRE(is_closed_after_shutdown(wrapped));
  REQUIRE(wrapped.cause() == ErrorCode::kListenerClosed);
  REQUIRE(wrapped.sys_errno() == EBADF);
  REQUIRE(wrapped.unwrap() == original);
  REQUIRE(wrapped != original);
}

TEST_CASE("Error - message", "[vocabulary]") {
  Error plain(ErrorCode::kAcceptFailed, 0);
  REQUIRE(plain.message() == "accept failed");

  Error with_errno(ErrorCode::kSocketError, ECONNRESET);
  REQUIRE(with_errno.message().rfind("socket error: ", 0) == 0);

  Error wrapped = Error::closed_after_shutdown(Error(ErrorCode::kListenerClosed));
  REQUIRE(wrapped.message() == "listener closed after shutdown: use of closed listener");
}

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success with value", "[vocabulary]") {
  auto result = expected<size_t>::success(42);
  REQUIRE(result.has_value());
  REQUIRE(result.value() == 42);
}

TEST_CASE("expected - error", "[vocabulary]") {
  auto result = expected<size_t>::error(Error(ErrorCode::kSocketError, EPIPE));
  REQUIRE(!result.has_value());
  REQUIRE(static_cast<bool>(result) == false);
  REQUIRE(result.get_error().code() == ErrorCode::kSocketError);
  REQUIRE(result.get_error().sys_errno() == EPIPE);
}

TEST_CASE("expected - move-only value", "[vocabulary]") {
  auto result = expected<std::unique_ptr<int>>::success(std::make_unique<int>(7));
  REQUIRE(result.has_value());

  auto moved = std::move(result);
  REQUIRE(moved.has_value());
  std::unique_ptr<int> p = std::move(moved.value());
  REQUIRE(p != nullptr);
  REQUIRE(*p == 7);
}

TEST_CASE("expected - move assign replaces value with error", "[vocabulary]") {
  auto a = expected<std::unique_ptr<int>>::success(std::make_unique<int>(1));
  a = expected<std::unique_ptr<int>>::error(Error(ErrorCode::kListenerClosed));
  REQUIRE(!a.has_value());
  REQUIRE(a.get_error().code() == ErrorCode::kListenerClosed);
}

TEST_CASE("expected<void> - success and error", "[vocabulary]") {
  auto ok = expected<void>::success();
  REQUIRE(ok.has_value());

  auto err = expected<void>::error(Error(ErrorCode::kCloseFailed, EIO));
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error().code() == ErrorCode::kCloseFailed);
}
