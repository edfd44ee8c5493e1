#ifndef GRACE_CONN_HPP_
#define GRACE_CONN_HPP_

#include "vocabulary.hpp"

#include <cstddef>

#include <string>

namespace grace {

// ============================================================================
// Conn - stream connection interface
// ============================================================================

class Conn {
 public:
  virtual ~Conn() = default;

  // Read up to len bytes (blocking).
  // Returns the byte count, 0 when the peer closed, error() on socket failure.
  virtual expected<size_t> read(void* buf, size_t len) = 0;

  // Write up to len bytes (blocking).
  // Returns the byte count written, error() on socket failure.
  virtual expected<size_t> write(const void* buf, size_t len) = 0;

  // Close the connection.
  // Returns error(kConnectionClosed) if already closed.
  virtual expected<void> close() = 0;

  virtual bool is_open() const = 0;

  // Native descriptor, -1 once closed.
  virtual int handle() const = 0;

  // "ip:port" of the peer, empty if unknown.
  virtual std::string remote_address() const = 0;
};

}  // namespace grace

#endif  // GRACE_CONN_HPP_
