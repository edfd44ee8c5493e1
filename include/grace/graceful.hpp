#ifndef GRACE_GRACEFUL_HPP_
#define GRACE_GRACEFUL_HPP_

#include "keepalive.hpp"
#include "listener.hpp"
#include "tcp.hpp"
#include "tracked_conn.hpp"
#include "vocabulary.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace grace {

// ============================================================================
// GracefulListener (idempotent close + shutdown-aware accept)
// ============================================================================

/**
 * @brief Listener decorator for graceful shutdown.
 *
 * Differs from the wrapped listener in two ways:
 *  - close() is idempotent and thread-safe. One compare-and-swap decides which
 *    caller closes the inner listener; every other caller gets success.
 *  - An accept that fails once the listener has been closed returns
 *    Error::closed_after_shutdown(original), which an accept loop treats as
 *    "stop looping" rather than as a fault.
 *
 * The open flag is read after the inner accept fails, not before it starts, so
 * an accept already blocked when close() runs is classified correctly. A
 * genuine failure that lands in the same instant as close() may still be
 * reported as shutdown; the inner listener gives no way to tell them apart.
 *
 * Usage:
 *   grace::GracefulListener listener(std::make_unique<grace::TcpListener>(cfg));
 *   for (;;) {
 *     auto conn = listener.accept_tracked();
 *     if (!conn) {
 *       if (conn.get_error().is_closed_after_shutdown()) break;
 *       GRACE_LOG_ERROR(conn.get_error().message());
 *       continue;
 *     }
 *     serve(std::move(conn.value()));
 *   }
 */
class GracefulListener : public Listener {
 public:
  explicit GracefulListener(std::unique_ptr<Listener> inner) : inner_(std::move(inner)) {}

  GracefulListener(const GracefulListener&) = delete;
  GracefulListener& operator=(const GracefulListener&) = delete;

  // Blocks until the inner listener yields a connection or fails.
  // Returns a TrackedConn in state kNew, the inner error while open, or
  // error(kClosedAfterShutdown) wrapping the inner error once closed.
  expected<std::unique_ptr<TrackedConn>> accept_tracked();

  // Same as accept_tracked(), typed for the Listener interface.
  expected<ConnPtr> accept() override;

  // Only the first caller closes the inner listener and sees its result.
  expected<void> close() override;

  std::string address() const override { return inner_->address(); }

  bool is_open() const { return open_.load(std::memory_order_acquire); }

 private:
  std::unique_ptr<Listener> inner_;
  std::atomic<bool> open_{true};
};

// Build TcpListener -> KeepAliveListener (if enabled) -> GracefulListener.
// Throws std::runtime_error if the socket cannot be bound.
std::unique_ptr<GracefulListener> listen_graceful(const ListenConfig& listen_config,
                                                  const KeepAliveConfig& keep_alive = KeepAliveConfig{});

}  // namespace grace

#endif  // GRACE_GRACEFUL_HPP_
