#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace hllrcon::client {

class Session;

// Typed RCON commands on top of an authenticated session. Errors from the
// session propagate unchanged.
class Commands {
public:
    explicit Commands(Session& session) : session_(session) {}

    void change_map(const std::string& map_id);

    // ServerInformation {Name, Value}. Returns the content when it is an
    // object (e.g. "session": MapName, ServerName, player counts), else {}.
    nlohmann::json server_information(const std::string& name, const std::string& value = "");

private:
    Session& session_;
};

} // namespace hllrcon::client
