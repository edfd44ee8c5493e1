#include "grace.hpp"

#include <csignal>

#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

// Line echo server. Ctrl-C stops accepting; open connections run to completion.

static void serve(const std::shared_ptr<grace::TrackedConn>& conn) {
  char buf[512];
  conn->set_last_state(grace::ConnState::kIdle);
  for (;;) {
    auto n = conn->read(buf, sizeof(buf));
    if (!n) {
      GRACE_LOG_WARN("Read from " + conn->remote_address() + " failed: " + n.get_error().message());
      break;
    }
    if (n.value() == 0) {
      break;
    }
    conn->set_last_state(grace::ConnState::kActive);
    auto w = conn->write(buf, n.value());
    if (!w) {
      GRACE_LOG_WARN("Write to " + conn->remote_address() + " failed: " + w.get_error().message());
      break;
    }
    conn->set_last_state(grace::ConnState::kIdle);
  }
  std::string peer = conn->remote_address();
  auto closed = conn->close();
  if (!closed) {
    GRACE_LOG_WARN("Close of " + peer + " failed: " + closed.get_error().message());
  }
  conn->set_last_state(grace::ConnState::kClosed);
  std::cout << "Client " << peer << " done" << std::endl;
}

int main(int argc, char* argv[]) {
  grace::ListenConfig cfg;
  cfg.port = 8080;
  if (argc > 1) {
    cfg.port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  // Signals are taken synchronously by a dedicated thread.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  std::signal(SIGPIPE, SIG_IGN);

  std::unique_ptr<grace::GracefulListener> listener;
  try {
    listener = grace::listen_graceful(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::thread signal_thread([&listener, &signals]() {
    int sig = 0;
    if (sigwait(&signals, &sig) != 0) {
      return;
    }
    GRACE_LOG_INFO("Signal " + std::to_string(sig) + " received, shutting down");
    auto result = listener->close();
    if (!result) {
      GRACE_LOG_ERROR("Shutdown failed: " + result.get_error().message());
    }
  });

  std::vector<std::thread> workers;
  int exit_code = 0;
  for (;;) {
    auto result = listener->accept_tracked();
    if (!result) {
      if (result.get_error().is_closed_after_shutdown()) {
        break;
      }
      GRACE_LOG_ERROR("Accept failed: " + result.get_error().message());
      exit_code = 1;
      break;
    }
    std::shared_ptr<grace::TrackedConn> conn(std::move(result.value()));
    std::cout << "Client " << conn->remote_address() << " connected" << std::endl;
    workers.emplace_back([conn]() { serve(conn); });
  }

  // An accept fault leaves the signal thread waiting; wake it.
  if (exit_code != 0) {
    pthread_kill(signal_thread.native_handle(), SIGTERM);
  }
  signal_thread.join();

  std::cout << "Waiting for " << workers.size() << " connection(s) to finish" << std::endl;
  for (auto& t : workers) {
    t.join();
  }
  return exit_code;
}
