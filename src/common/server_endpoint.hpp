#pragma once

#include <cstdint>
#include <string>

namespace hllrcon {

// One controllable game server, as loaded from configuration.
struct ServerEndpoint {
    std::string name;
    std::string host;
    uint16_t port = 0;
    std::string password;

    std::string address() const { return host + ":" + std::to_string(port); }
};

} // namespace hllrcon
