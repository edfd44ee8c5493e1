#include "fake_listener.hpp"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace grace;

namespace {

struct GracefulFixture {
  ScriptedListener* inner;
  GracefulListener listener;

  GracefulFixture() : GracefulFixture(std::make_unique<ScriptedListener>()) {}

 private:
  explicit GracefulFixture(std::unique_ptr<ScriptedListener> fake)
      : inner(fake.get()), listener(std::move(fake)) {}
};

}  // namespace

// ============================================================================
// Accept
// ============================================================================

TEST_CASE("GracefulListener - starts open", "[graceful]") {
  GracefulFixture f;
  REQUIRE(f.listener.is_open());
  REQUIRE(f.listener.address() == "127.0.0.1:9999");
  REQUIRE(f.inner->close_calls() == 0);
}

TEST_CASE("GracefulListener - accepted connection is tracked and new", "[graceful]") {
  GracefulFixture f;
  f.inner->push_conn(std::make_unique<FakeConn>("c1", "ping"));

  auto result = f.listener.accept_tracked();
  REQUIRE(result.has_value());
  auto& conn = *result.value();
  REQUIRE(conn.last_state() == ConnState::kNew);
  REQUIRE(conn.remote_address() == "c1");

  char buf[8] = {0};
  auto n = conn.read(buf, sizeof(buf));
  REQUIRE(n.has_value());
  REQUIRE(n.value() == 4);
  REQUIRE(std::string(buf, 4) == "ping");

  auto w = conn.write("pong", 4);
  REQUIRE(w.has_value());
  REQUIRE(w.value() == 4);
  REQUIRE(static_cast<FakeConn&>(conn.inner()).outbound() == "pong");
}

TEST_CASE("GracefulListener - accept through Listener interface", "[graceful]") {
  GracefulFixture f;
  f.inner->push_conn(std::make_unique<FakeConn>("c1"));

  Listener& base = f.listener;
  auto result = base.accept();
  REQUIRE(result.has_value());
  auto* tracked = dynamic_cast<TrackedConn*>(result.value().get());
  REQUIRE(tracked != nullptr);
  REQUIRE(tracked->last_state() == ConnState::kNew);
}

TEST_CASE("GracefulListener - failure while open passes through", "[graceful]") {
  GracefulFixture f;
  const Error original(ErrorCode::kAcceptFailed, EMFILE);
  f.inner->fail_next(original);

  auto result = f.listener.accept_tracked();
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == original);
  REQUIRE(!result.get_error().is_closed_after_shutdown());
  REQUIRE(f.listener.is_open());
}

TEST_CASE("GracefulListener - failure after close is classified", "[graceful]") {
  GracefulFixture f;
  REQUIRE(f.listener.close().has_value());
  REQUIRE(!f.listener.is_open());

  auto result = f.listener.accept_tracked();
  REQUIRE(!result.has_value());
  const Error& err = result.get_error();
  REQUIRE(err.is_closed_after_shutdown());
  REQUIRE(is_closed_after_shutdown(err));
  REQUIRE(err.cause() == ErrorCode::kListenerClosed);
  REQUIRE(err.sys_errno() == EBADF);
  REQUIRE(err.unwrap() == ScriptedListener::closed_error());
}

TEST_CASE("GracefulListener - operational error after close is still classified", "[graceful]") {
  GracefulFixture f;
  REQUIRE(f.listener.close().has_value());
  f.inner->fail_next(Error(ErrorCode::kAcceptFailed, ENFILE));

  auto result = f.listener.accept_tracked();
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error().is_closed_after_shutdown());
  REQUIRE(result.get_error().cause() == ErrorCode::kAcceptFailed);
  REQUIRE(result.get_error().sys_errno() == ENFILE);
}

// ============================================================================
// Close
// ============================================================================

TEST_CASE("GracefulListener - close is idempotent", "[graceful]") {
  GracefulFixture f;
  REQUIRE(f.listener.close().has_value());
  REQUIRE(f.listener.close().has_value());
  REQUIRE(f.listener.close().has_value());
  REQUIRE(f.inner->close_calls() == 1);
}

TEST_CASE("GracefulListener - concurrent close invokes inner close once", "[graceful][concurrency]") {
  GracefulFixture f;
  f.inner->set_close_delay(std::chrono::milliseconds(20));

  constexpr int kThreads = 16;
  std::atomic<bool> go{false};
  std::atomic<int> ok_count{0};
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      if (f.listener.close().has_value()) {
        ok_count.fetch_add(1);
      }
    });
  }
  go.store(true);
  for (auto& t : threads) {
    t.join();
  }

  REQUIRE(ok_count.load() == kThreads);
  REQUIRE(f.inner->close_calls() == 1);
  REQUIRE(!f.listener.is_open());
}

TEST_CASE("GracefulListener - close error reaches only the closing caller", "[graceful]") {
  GracefulFixture f;
  const Error close_err(ErrorCode::kCloseFailed, EIO);
  f.inner->set_close_result(close_err);

  auto first = f.listener.close();
  REQUIRE(!first.has_value());
  REQUIRE(first.get_error() == close_err);

  auto second = f.listener.close();
  REQUIRE(second.has_value());
  REQUIRE(f.inner->close_calls() == 1);
  REQUIRE(!f.listener.is_open());
}

TEST_CASE("GracefulListener - close unblocks a pending accept", "[graceful][concurrency]") {
  GracefulFixture f;

  std::atomic<bool> classified{false};
  std::thread acceptor([&]() {
    auto result = f.listener.accept_tracked();
    classified = !result.has_value() && result.get_error().is_closed_after_shutdown();
  });

  bool parked = f.inner->wait_for_acceptor();
  bool closed = f.listener.close().has_value();
  acceptor.join();

  REQUIRE(parked);
  REQUIRE(closed);
  REQUIRE(classified.load());
}

TEST_CASE("GracefulListener - accept, close, drain scenario", "[graceful][concurrency]") {
  GracefulFixture f;
  f.inner->push_conn(std::make_unique<FakeConn>("c1"));
  f.inner->push_conn(std::make_unique<FakeConn>("c2"));

  auto c1 = f.listener.accept_tracked();
  REQUIRE(c1.has_value());
  REQUIRE(c1.value()->remote_address() == "c1");
  REQUIRE(c1.value()->last_state() == ConnState::kNew);
  c1.value()->set_last_state(ConnState::kActive);

  auto c2 = f.listener.accept_tracked();
  REQUIRE(c2.has_value());
  REQUIRE(c2.value()->remote_address() == "c2");

  // Third accept blocks until the listener is closed underneath it.
  Error accept_error;
  bool accepted = false;
  std::thread acceptor([&]() {
    auto next = f.listener.accept_tracked();
    accepted = next.has_value();
    if (!accepted) {
      accept_error = next.get_error();
    }
  });
  bool parked = f.inner->wait_for_acceptor();

  std::atomic<int> close_ok{0};
  std::thread closer([&]() {
    if (f.listener.close().has_value()) {
      close_ok.fetch_add(1);
    }
  });
  closer.join();
  acceptor.join();

  REQUIRE(parked);
  REQUIRE(close_ok.load() == 1);
  REQUIRE(f.inner->close_calls() == 1);
  REQUIRE(!accepted);
  REQUIRE(accept_error.is_closed_after_shutdown());
  REQUIRE(accept_error.unwrap() == ScriptedListener::closed_error());

  std::thread second_closer([&]() {
    if (f.listener.close().has_value()) {
      close_ok.fetch_add(1);
    }
  });
  second_closer.join();
  REQUIRE(close_ok.load() == 2);
  REQUIRE(f.inner->close_calls() == 1);

  // Connections accepted before shutdown keep working.
  auto w = c1.value()->write("bye", 3);
  REQUIRE(w.has_value());
  REQUIRE(c1.value()->last_state() == ConnState::kActive);
  c1.value()->set_last_state(ConnState::kClosed);
  REQUIRE(c1.value()->close().has_value());
  REQUIRE(c2.value()->last_state() == ConnState::kNew);
}
