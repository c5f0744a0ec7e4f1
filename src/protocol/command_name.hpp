#pragma once

#include <string_view>

namespace hllrcon::protocol {

constexpr int PROTOCOL_VERSION = 2;

// Command names carried in the envelope's Name field
namespace command {
    // Handshake, sent before an auth token exists
    constexpr std::string_view ServerConnect = "ServerConnect";  // cleartext, returns the XOR key
    constexpr std::string_view Login = "Login";                  // returns the auth token

    // Authenticated commands
    constexpr std::string_view ChangeMap = "ChangeMap";
    constexpr std::string_view ServerInformation = "ServerInformation";
}

constexpr int STATUS_OK = 200;

} // namespace hllrcon::protocol
