#include "grace/graceful.hpp"

#include "grace/log.hpp"

namespace grace {

expected<std::unique_ptr<TrackedConn>> GracefulListener::accept_tracked() {
  using Result = expected<std::unique_ptr<TrackedConn>>;

  auto result = inner_->accept();
  if (!result) {
    // Classify by the flag at failure time, not at call time.
    if (!open_.load(std::memory_order_acquire)) {
      return Result::error(Error::closed_after_shutdown(result.get_error()));
    }
    return Result::error(result.get_error());
  }

  return Result::success(std::make_unique<TrackedConn>(std::move(result.value())));
}

expected<Listener::ConnPtr> GracefulListener::accept() {
  auto result = accept_tracked();
  if (!result) {
    return expected<ConnPtr>::error(result.get_error());
  }
  return expected<ConnPtr>::success(ConnPtr(std::move(result.value())));
}

expected<void> GracefulListener::close() {
  bool expected_open = true;
  if (!open_.compare_exchange_strong(expected_open, false, std::memory_order_acq_rel)) {
    GRACE_LOG_DEBUG("Listener " + inner_->address() + " already closed");
    return expected<void>::success();
  }

  auto result = inner_->close();
  if (!result) {
    GRACE_LOG_ERROR("Failed to close listener " + inner_->address() + ": " + result.get_error().message());
    return result;
  }
  GRACE_LOG_INFO("Listener " + inner_->address() + " closed, no longer accepting");
  return result;
}

std::unique_ptr<GracefulListener> listen_graceful(const ListenConfig& listen_config,
                                                  const KeepAliveConfig& keep_alive) {
  auto tcp = std::make_unique<TcpListener>(listen_config);
  if (!keep_alive.enabled) {
    return std::make_unique<GracefulListener>(std::move(tcp));
  }
  return std::make_unique<GracefulListener>(std::make_unique<KeepAliveListener>(std::move(tcp), keep_alive.period));
}

}  // namespace grace
