#pragma once

#include <cstdint>
#include <optional>

namespace hllrcon::client {

enum class SessionState : uint8_t {
    Disconnected = 0,   // no socket yet
    Connected = 1,      // socket open, no XOR key
    Keyed = 2,          // ServerConnect done, XOR key known
    Authenticated = 3,  // Login done, auth token known
    Closed = 4,         // terminal; the session is never reused
};

enum class SessionEvent : uint8_t {
    Connect = 0,
    KeyExchanged = 1,
    LoggedIn = 2,
    Close = 3,
};

// Allowed transitions:
//   Disconnected  --Connect-->      Connected
//   Connected     --KeyExchanged--> Keyed
//   Keyed         --LoggedIn-->     Authenticated
//   any           --Close-->        Closed
// Returns nullopt for anything else.
std::optional<SessionState> next_state(SessionState from, SessionEvent event);

const char* session_state_name(SessionState state);
const char* session_event_name(SessionEvent event);

} // namespace hllrcon::client
