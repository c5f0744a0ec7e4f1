#pragma once

#include "common/server_endpoint.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hllrcon::registry {

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> system_env(const std::string& name);

class RconConfig {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};

    // JSON file: {"timeout_ms": 5000, "servers": [{"name", "host", "port", "password"}]}
    // Returns false (and logs) when the file is missing or not valid JSON.
    // Throws ConfigError for entries that are present but invalid.
    bool load_file(const std::string& path);

    // SERVER{i}_HOST / _PORT / _PASSWORD / _NAME for i = 1, 2, ... with
    // RCON_PORT / RCON_PASSWORD as shared fallbacks, or the single legacy
    // RCON_HOST endpoint when no indexed server exists. RCON_TIMEOUT_MS
    // overrides the timeout. Replaces any servers loaded before.
    // Throws ConfigError for incomplete or invalid entries.
    void load_environment(const EnvLookup& env = system_env);

    const std::vector<ServerEndpoint>& servers() const { return servers_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    void add_server(ServerEndpoint endpoint) { servers_.push_back(std::move(endpoint)); }
    void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

    // Both throw ConfigError naming `what` when the text is out of range
    static uint16_t parse_port(const std::string& s, const std::string& what);
    static std::chrono::milliseconds parse_timeout(const std::string& s, const std::string& what);

private:
    std::vector<ServerEndpoint> servers_;
    std::chrono::milliseconds timeout_ = DEFAULT_TIMEOUT;
};

} // namespace hllrcon::registry
