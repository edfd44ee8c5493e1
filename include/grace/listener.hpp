#ifndef GRACE_LISTENER_HPP_
#define GRACE_LISTENER_HPP_

#include "conn.hpp"
#include "vocabulary.hpp"

#include <memory>
#include <string>

namespace grace {

// ============================================================================
// Listener - stream listener interface
// ============================================================================

class Listener {
 public:
  using ConnPtr = std::unique_ptr<Conn>;

  virtual ~Listener() = default;

  // Block until the next connection arrives.
  // Returns the connection, or error() if the listener failed or was closed.
  virtual expected<ConnPtr> accept() = 0;

  // Stop listening and wake blocked accept() calls.
  // Implementations need not be idempotent.
  virtual expected<void> close() = 0;

  // Bound address as "ip:port".
  virtual std::string address() const = 0;
};

}  // namespace grace

#endif  // GRACE_LISTENER_HPP_
