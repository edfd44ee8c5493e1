#ifndef GRACE_TRACKED_CONN_HPP_
#define GRACE_TRACKED_CONN_HPP_

#include "conn.hpp"
#include "conn_state.hpp"
#include "vocabulary.hpp"

#include <memory>
#include <string>

namespace grace {

// ============================================================================
// TrackedConn (connection + last known protocol state)
// ============================================================================

/**
 * @brief Wraps an accepted connection and records its last protocol state.
 *
 * All I/O is forwarded unchanged. The state tag is not synchronized: the
 * owning server updates it from a single place (its connection state-change
 * hook) and is responsible for not writing it from two threads at once.
 */
class TrackedConn : public Conn {
 public:
  explicit TrackedConn(std::unique_ptr<Conn> inner) : inner_(std::move(inner)) {}

  expected<size_t> read(void* buf, size_t len) override { return inner_->read(buf, len); }
  expected<size_t> write(const void* buf, size_t len) override { return inner_->write(buf, len); }
  expected<void> close() override { return inner_->close(); }

  bool is_open() const override { return inner_->is_open(); }
  int handle() const override { return inner_->handle(); }
  std::string remote_address() const override { return inner_->remote_address(); }

  ConnState last_state() const { return last_state_; }
  void set_last_state(ConnState state) { last_state_ = state; }

  Conn& inner() { return *inner_; }
  const Conn& inner() const { return *inner_; }

 private:
  std::unique_ptr<Conn> inner_;
  ConnState last_state_ = ConnState::kNew;
};

}  // namespace grace

#endif  // GRACE_TRACKED_CONN_HPP_
