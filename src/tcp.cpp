#include "grace/tcp.hpp"

#include "grace/log.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace grace {

namespace {

std::string format_address(const struct sockaddr_storage& ss) {
  char host[INET6_ADDRSTRLEN] = {0};
  if (ss.ss_family == AF_INET) {
    const auto* sin = reinterpret_cast<const struct sockaddr_in*>(&ss);
    if (inet_ntop(AF_INET, &sin->sin_addr, host, sizeof(host)) == nullptr) {
      return {};
    }
    return std::string(host) + ":" + std::to_string(ntohs(sin->sin_port));
  }
  if (ss.ss_family == AF_INET6) {
    const auto* sin6 = reinterpret_cast<const struct sockaddr_in6*>(&ss);
    if (inet_ntop(AF_INET6, &sin6->sin6_addr, host, sizeof(host)) == nullptr) {
      return {};
    }
    return "[" + std::string(host) + "]:" + std::to_string(ntohs(sin6->sin6_port));
  }
  return {};
}

}  // namespace

// ============================================================================
// TcpConn
// ============================================================================

TcpConn::TcpConn(sockpp::tcp_socket&& sock) : socket_(std::move(sock)) {}

TcpConn::TcpConn(int fd) : socket_(fd) {}

TcpConn::~TcpConn() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

expected<size_t> TcpConn::read(void* buf, size_t len) {
  if (!socket_.is_open()) {
    return expected<size_t>::error(Error(ErrorCode::kConnectionClosed, EBADF));
  }
  for (;;) {
    ssize_t n = socket_.read(buf, len);
    if (n >= 0) {
      return expected<size_t>::success(static_cast<size_t>(n));
    }
    int err = errno;
    if (err != EINTR) {
      return expected<size_t>::error(Error(ErrorCode::kSocketError, err));
    }
  }
}

expected<size_t> TcpConn::write(const void* buf, size_t len) {
  if (!socket_.is_open()) {
    return expected<size_t>::error(Error(ErrorCode::kConnectionClosed, EBADF));
  }
  for (;;) {
    ssize_t n = socket_.write(buf, len);
    if (n >= 0) {
      return expected<size_t>::success(static_cast<size_t>(n));
    }
    int err = errno;
    if (err != EINTR) {
      return expected<size_t>::error(Error(ErrorCode::kSocketError, err));
    }
  }
}

expected<void> TcpConn::close() {
  if (!socket_.is_open()) {
    return expected<void>::error(Error(ErrorCode::kConnectionClosed, EBADF));
  }
  if (!socket_.close()) {
    return expected<void>::error(Error(ErrorCode::kCloseFailed, errno));
  }
  return expected<void>::success();
}

std::string TcpConn::remote_address() const {
  if (!socket_.is_open()) {
    return {};
  }
  struct sockaddr_storage ss;
  socklen_t len = sizeof(ss);
  std::memset(&ss, 0, sizeof(ss));
  if (::getpeername(socket_.handle(), reinterpret_cast<struct sockaddr*>(&ss), &len) < 0) {
    return {};
  }
  return format_address(ss);
}

expected<void> TcpConn::set_keep_alive(bool enable) {
  int opt = enable ? 1 : 0;
  if (::setsockopt(socket_.handle(), SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt)) < 0) {
    return expected<void>::error(Error(ErrorCode::kSocketOptionFailed, errno));
  }
  return expected<void>::success();
}

expected<void> TcpConn::set_keep_alive_period(std::chrono::seconds period) {
  if (period > kMaxKeepAlivePeriod) {
    return expected<void>::error(Error(ErrorCode::kSocketOptionFailed, EINVAL));
  }
  // The kernel takes whole seconds, minimum 1.
  int secs = period.count() < 1 ? 1 : static_cast<int>(period.count());
  int fd = socket_.handle();

#ifdef TCP_KEEPIDLE
  if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &secs, sizeof(secs)) < 0) {
    return expected<void>::error(Error(ErrorCode::kSocketOptionFailed, errno));
  }
#elif defined(TCP_KEEPALIVE)
  if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPALIVE, &secs, sizeof(secs)) < 0) {
    return expected<void>::error(Error(ErrorCode::kSocketOptionFailed, errno));
  }
#endif
#ifdef TCP_KEEPINTVL
  if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &secs, sizeof(secs)) < 0) {
    return expected<void>::error(Error(ErrorCode::kSocketOptionFailed, errno));
  }
#endif
  (void)fd;
  (void)secs;
  return expected<void>::success();
}

// ============================================================================
// TcpListener
// ============================================================================

TcpListener::TcpListener(const ListenConfig& config) {
  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config.port);
  if (config.bind_addr.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, config.bind_addr.c_str(), &addr.sin_addr) != 1) {
    GRACE_THROW(std::runtime_error("Invalid bind address: " + config.bind_addr));
  }

  listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    GRACE_THROW(std::runtime_error(std::string("Failed to create socket: ") + strerror(errno)));
  }

  if (config.reuse_addr) {
    int reuse = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      GRACE_LOG_WARN(std::string("SO_REUSEADDR failed: ") + strerror(errno));
    }
  }

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(listen_fd_);
    GRACE_THROW(std::runtime_error("Failed to bind port " + std::to_string(config.port) + ": " + strerror(err)));
  }

  if (::listen(listen_fd_, config.backlog) < 0) {
    int err = errno;
    ::close(listen_fd_);
    GRACE_THROW(std::runtime_error(std::string("Failed to listen: ") + strerror(err)));
  }

  // Non-blocking so a connection raced away by another acceptor never blocks us.
  int flags = ::fcntl(listen_fd_, F_GETFL, 0);
  if (flags < 0 || ::fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    int err = errno;
    ::close(listen_fd_);
    GRACE_THROW(std::runtime_error(std::string("Failed to set non-blocking: ") + strerror(err)));
  }

  if (::pipe(wake_fds_) < 0) {
    int err = errno;
    ::close(listen_fd_);
    GRACE_THROW(std::runtime_error(std::string("Failed to create wake pipe: ") + strerror(err)));
  }

  struct sockaddr_in bound;
  socklen_t bound_len = sizeof(bound);
  std::memset(&bound, 0, sizeof(bound));
  if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
    port_ = ntohs(bound.sin_port);
  } else {
    port_ = config.port;
  }

  GRACE_LOG_INFO("Listening on " + address());
}

TcpListener::~TcpListener() {
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
  }
  for (int& fd : wake_fds_) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
}

expected<std::unique_ptr<TcpConn>> TcpListener::accept_tcp() {
  using Result = expected<std::unique_ptr<TcpConn>>;

  for (;;) {
    if (closed_.load(std::memory_order_acquire)) {
      return Result::error(Error(ErrorCode::kListenerClosed, EBADF));
    }

    struct pollfd fds[2] = {{listen_fd_, POLLIN, 0}, {wake_fds_[0], POLLIN, 0}};
    int ret = ::poll(fds, 2, -1);
    if (ret < 0) {
      int err = errno;
      if (err == EINTR) {
        continue;
      }
      return Result::error(Error(ErrorCode::kSocketError, err));
    }

    // The wake pipe is never drained, so every blocked acceptor sees it.
    if (fds[1].revents != 0) {
      return Result::error(Error(ErrorCode::kListenerClosed, EBADF));
    }

    if (fds[0].revents & POLLNVAL) {
      return Result::error(Error(ErrorCode::kSocketError, EBADF));
    }

    struct sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);
    int client_sock = ::accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_addr_len);
    if (client_sock < 0) {
      int err = errno;
      if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR || err == ECONNABORTED) {
        continue;
      }
      if (closed_.load(std::memory_order_acquire)) {
        return Result::error(Error(ErrorCode::kListenerClosed, EBADF));
      }
      return Result::error(Error(ErrorCode::kAcceptFailed, err));
    }

    // Some platforms inherit O_NONBLOCK from the listener; connections block.
    int flags = ::fcntl(client_sock, F_GETFL, 0);
    if (flags >= 0 && (flags & O_NONBLOCK) != 0) {
      if (::fcntl(client_sock, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        int err = errno;
        ::close(client_sock);
        return Result::error(Error(ErrorCode::kSocketError, err));
      }
    }

    return Result::success(std::make_unique<TcpConn>(client_sock));
  }
}

expected<Listener::ConnPtr> TcpListener::accept() {
  auto result = accept_tcp();
  if (!result) {
    return expected<ConnPtr>::error(result.get_error());
  }
  return expected<ConnPtr>::success(ConnPtr(std::move(result.value())));
}

expected<void> TcpListener::close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return expected<void>::error(Error(ErrorCode::kListenerClosed, EBADF));
  }

  // Stops the kernel from completing new handshakes on this port.
  // BSDs report ENOTCONN for a listening socket; the wake below still applies.
  int shutdown_err = 0;
  if (::shutdown(listen_fd_, SHUT_RDWR) < 0 && errno != ENOTCONN) {
    shutdown_err = errno;
  }

  const char byte = 1;
  ssize_t n;
  do {
    n = ::write(wake_fds_[1], &byte, 1);
  } while (n < 0 && errno == EINTR);
  if (n < 0) {
    return expected<void>::error(Error(ErrorCode::kCloseFailed, errno));
  }

  if (shutdown_err != 0) {
    return expected<void>::error(Error(ErrorCode::kCloseFailed, shutdown_err));
  }
  return expected<void>::success();
}

std::string TcpListener::address() const {
  struct sockaddr_storage ss;
  socklen_t len = sizeof(ss);
  std::memset(&ss, 0, sizeof(ss));
  if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&ss), &len) < 0) {
    return {};
  }
  return format_address(ss);
}

}  // namespace grace
