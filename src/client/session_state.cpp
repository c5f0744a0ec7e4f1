#include "session_state.hpp"
#include <optional>

namespace hllrcon::client {

std::optional<SessionState> next_state(SessionState from, SessionEvent event) {
    if (event == SessionEvent::Close) {
        return SessionState::Closed;
    }

    switch (from) {
        case SessionState::Disconnected:
            if (event == SessionEvent::Connect) return SessionState::Connected;
            break;
        case SessionState::Connected:
            if (event == SessionEvent::KeyExchanged) return SessionState::Keyed;
            break;
        case SessionState::Keyed:
            if (event == SessionEvent::LoggedIn) return SessionState::Authenticated;
            break;
        case SessionState::Authenticated:
        case SessionState::Closed:
            break;
    }
    return std::nullopt;
}

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Disconnected:  return "Disconnected";
        case SessionState::Connected:     return "Connected";
        case SessionState::Keyed:         return "Keyed";
        case SessionState::Authenticated: return "Authenticated";
        case SessionState::Closed:        return "Closed";
    }
    return "Unknown";
}

const char* session_event_name(SessionEvent event) {
    switch (event) {
        case SessionEvent::Connect:      return "Connect";
        case SessionEvent::KeyExchanged: return "KeyExchanged";
        case SessionEvent::LoggedIn:     return "LoggedIn";
        case SessionEvent::Close:        return "Close";
    }
    return "Unknown";
}

} // namespace hllrcon::client
