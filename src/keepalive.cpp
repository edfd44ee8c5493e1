#include "grace/keepalive.hpp"

#include "grace/log.hpp"

namespace grace {

KeepAliveListener::KeepAliveListener(std::unique_ptr<TcpListener> inner, std::chrono::seconds period)
    : inner_(std::move(inner)), period_(period) {}

expected<std::unique_ptr<TcpConn>> KeepAliveListener::accept_tcp() {
  auto result = inner_->accept_tcp();
  if (!result) {
    return result;
  }

  // The connection is usable without keep-alive; report and hand it on.
  TcpConn& conn = *result.value();
  auto ka = conn.set_keep_alive(true);
  if (!ka) {
    GRACE_LOG_WARN("Keep-alive not enabled for " + conn.remote_address() + ": " + ka.get_error().message());
    return result;
  }
  auto period = conn.set_keep_alive_period(period_);
  if (!period) {
    GRACE_LOG_WARN("Keep-alive period not set for " + conn.remote_address() + ": " + period.get_error().message());
  }
  return result;
}

expected<Listener::ConnPtr> KeepAliveListener::accept() {
  auto result = accept_tcp();
  if (!result) {
    return expected<ConnPtr>::error(result.get_error());
  }
  return expected<ConnPtr>::success(ConnPtr(std::move(result.value())));
}

}  // namespace grace
