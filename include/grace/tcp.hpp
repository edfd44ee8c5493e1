#ifndef GRACE_TCP_HPP_
#define GRACE_TCP_HPP_

#include "conn.hpp"
#include "listener.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>

namespace grace {

// ============================================================================
// Listen Configuration
// ============================================================================

// Largest keep-alive period the kernel accepts (Linux caps TCP_KEEPIDLE here).
static constexpr std::chrono::seconds kMaxKeepAlivePeriod{32767};

struct ListenConfig {
  std::string bind_addr;   // Empty = INADDR_ANY
  uint16_t port = 0;       // 0 = ephemeral port chosen by the kernel
  int backlog = 128;       // listen() queue length
  bool reuse_addr = true;  // SO_REUSEADDR
};

// ============================================================================
// TcpConn (raw accepted TCP connection)
// ============================================================================

class TcpConn : public Conn {
 public:
  explicit TcpConn(sockpp::tcp_socket&& sock);
  explicit TcpConn(int fd);  // Native socket fd constructor
  ~TcpConn() override;

  expected<size_t> read(void* buf, size_t len) override;
  expected<size_t> write(const void* buf, size_t len) override;
  expected<void> close() override;

  bool is_open() const override { return socket_.is_open(); }
  int handle() const override { return socket_.is_open() ? static_cast<int>(socket_.handle()) : -1; }
  std::string remote_address() const override;

  // --- Keep-alive control ---

  // Toggle SO_KEEPALIVE.
  expected<void> set_keep_alive(bool enable);

  // Idle time before the first keep-alive packet and interval between them.
  // Linux: TCP_KEEPIDLE + TCP_KEEPINTVL. macOS: TCP_KEEPALIVE.
  // Periods under 1 s are raised to 1 s. Periods above kMaxKeepAlivePeriod
  // fail with kSocketOptionFailed (EINVAL) and leave the socket unchanged.
  expected<void> set_keep_alive_period(std::chrono::seconds period);

 private:
  sockpp::tcp_socket socket_;
};

// ============================================================================
// TcpListener (blocking accept on a bound TCP socket)
// ============================================================================

class TcpListener : public Listener {
 public:
  // Creates, binds and listens. Throws std::runtime_error on failure.
  explicit TcpListener(const ListenConfig& config);
  ~TcpListener() override;

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  // Accept returning the concrete TCP connection (keep-alive control exposed).
  expected<std::unique_ptr<TcpConn>> accept_tcp();

  expected<ConnPtr> accept() override;

  // Shut the socket down and wake blocked accepts.
  // Returns error(kListenerClosed) on the second call.
  //
  // On Linux shutdown() stops the kernel admitting connections immediately.
  // BSD and macOS refuse shutdown() on a listening socket (ENOTCONN, ignored
  // here): the backlog keeps completing handshakes until the destructor
  // releases the descriptor, and those peers are reset at that point.
  // Destroy the listener promptly after close() where that matters.
  expected<void> close() override;

  std::string address() const override;

  uint16_t port() const { return port_; }

 private:
  int listen_fd_ = -1;
  int wake_fds_[2] = {-1, -1};  // Self-pipe: written once by close()
  uint16_t port_ = 0;
  std::atomic<bool> closed_{false};
};

}  // namespace grace

#endif  // GRACE_TCP_HPP_
