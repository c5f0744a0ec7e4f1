#include "errors.hpp"
#include <string>

namespace hllrcon {

ConnectionError::ConnectionError(const std::string& host, uint16_t port, const std::string& reason)
    : RconError("Failed to connect to " + host + ":" + std::to_string(port) + ": " + reason)
    , host_(host)
    , port_(port) {
}

CommandError::CommandError(const std::string& command, int status_code, const std::string& status_message)
    : RconError(command + " failed with status " + std::to_string(status_code) + ": " + status_message)
    , command_(command)
    , status_code_(status_code)
    , status_message_(status_message) {
}

} // namespace hllrcon
