#ifndef GRACE_CONN_STATE_HPP_
#define GRACE_CONN_STATE_HPP_

#include <cstdint>

namespace grace {

// ============================================================================
// Protocol state tag (recorded per connection by the owning server)
// ============================================================================

enum class ConnState : uint8_t {
  kNew = 0,   // Accepted, nothing recorded yet (the unset value)
  kActive,    // Reading or serving a request
  kIdle,      // Between requests on a kept-alive connection
  kHijacked,  // Taken over by a handler; no longer tracked by the server
  kClosed     // Closed by either side
};

inline const char* to_string(ConnState state) {
  switch (state) {
    case ConnState::kNew:
      return "new";
    case ConnState::kActive:
      return "active";
    case ConnState::kIdle:
      return "idle";
    case ConnState::kHijacked:
      return "hijacked";
    case ConnState::kClosed:
      return "closed";
  }
  return "unknown";
}

// Hijacked and closed connections never return to the server.
inline bool is_terminal(ConnState state) {
  return state == ConnState::kHijacked || state == ConnState::kClosed;
}

}  // namespace grace

#endif  // GRACE_CONN_STATE_HPP_
