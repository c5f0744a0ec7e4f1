#pragma once

#include "client/session.hpp"
#include "common/errors.hpp"
#include "common/server_endpoint.hpp"
#include "registry/rcon_config.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace hllrcon::registry {

struct ServerEntry {
    size_t index = 0;
    std::string name;
};

struct ChangeMapResult {
    bool success = false;
    std::string message;
};

// Returned by current_map() whenever the map can not be determined
inline constexpr const char* UNKNOWN_MAP = "Unknown";
inline constexpr const char* UNKNOWN_SERVER = "Unknown Server";

// Short label for logging a degraded operation, one per error kind
const char* failure_label(ErrorKind kind);

// The configured game servers, numbered 0..N-1.
//
// Every operation opens its own session, uses it and closes it; nothing is
// shared between calls, so const operations may run concurrently. None of
// them throw on RCON failures: they degrade to the documented sentinel
// values and log a warning naming the server.
class ServerRegistry {
public:
    // Throws ConfigError when the config holds no servers.
    explicit ServerRegistry(const RconConfig& config);

    // Replaces each configured name with the ServerName reported by the
    // server. A server that can not be reached keeps its configured name.
    // Not thread-safe; call once at startup before sharing the registry.
    void fetch_display_names();

    std::vector<ServerEntry> list_servers() const;
    size_t size() const { return servers_.size(); }

    std::string server_name(size_t index) const;
    std::string current_map(size_t index) const;
    ChangeMapResult change_map(size_t index, const std::string& map_id) const;

private:
    void log_failure(const char* operation, const ServerEndpoint& server, const RconError& e) const;

    std::vector<ServerEndpoint> servers_;
    client::SessionOptions session_options_;
};

} // namespace hllrcon::registry
