#ifndef GRACE_KEEPALIVE_HPP_
#define GRACE_KEEPALIVE_HPP_

#include "listener.hpp"
#include "tcp.hpp"
#include "vocabulary.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace grace {

// Half-dead peers (e.g. a laptop closed mid-download) are reclaimed after
// roughly this long instead of lingering until shutdown drains them.
static constexpr std::chrono::seconds kDefaultKeepAlivePeriod{180};

// ============================================================================
// Keep-alive Configuration
// ============================================================================

struct KeepAliveConfig {
  bool enabled = true;
  std::chrono::seconds period = kDefaultKeepAlivePeriod;
};

// ============================================================================
// KeepAliveListener (enables TCP keep-alive on every accepted connection)
// ============================================================================

class KeepAliveListener : public Listener {
 public:
  explicit KeepAliveListener(std::unique_ptr<TcpListener> inner,
                             std::chrono::seconds period = kDefaultKeepAlivePeriod);

  // Accept from the inner listener, then turn on keep-alive probing.
  // Accept failures are returned unchanged.
  expected<std::unique_ptr<TcpConn>> accept_tcp();

  expected<ConnPtr> accept() override;
  expected<void> close() override { return inner_->close(); }
  std::string address() const override { return inner_->address(); }

  std::chrono::seconds period() const { return period_; }
  TcpListener& inner() { return *inner_; }

 private:
  std::unique_ptr<TcpListener> inner_;
  std::chrono::seconds period_;
};

}  // namespace grace

#endif  // GRACE_KEEPALIVE_HPP_
