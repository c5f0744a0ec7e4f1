#include "rcon_config.hpp"
#include "common/errors.hpp"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace hllrcon::registry {

namespace {

// Unset and empty variables are treated alike
std::optional<std::string> non_empty(const EnvLookup& env, const std::string& name) {
    auto value = env(name);
    if (value && !value->empty()) return value;
    return std::nullopt;
}

} // namespace

std::optional<std::string> system_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::chrono::milliseconds RconConfig::parse_timeout(const std::string& s, const std::string& what) {
    bool digits = !s.empty() && s.size() <= 9;
    for (char c : s) {
        digits = digits && std::isdigit(static_cast<unsigned char>(c));
    }
    long value = digits ? std::stol(s) : 0;
    if (value <= 0) {
        throw ConfigError(what + ": '" + s + "' is not a positive number of milliseconds");
    }
    return std::chrono::milliseconds(value);
}

uint16_t RconConfig::parse_port(const std::string& s, const std::string& what) {
    bool digits = !s.empty() && s.size() <= 5;
    for (char c : s) {
        digits = digits && std::isdigit(static_cast<unsigned char>(c));
    }
    int value = digits ? std::stoi(s) : 0;
    if (value < 1 || value > 65535) {
        throw ConfigError(what + ": '" + s + "' is not a valid port (1-65535)");
    }
    return static_cast<uint16_t>(value);
}

bool RconConfig::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RconConfig::load_file: Failed to open %s", path.c_str());
        return false;
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RconConfig::load_file: Error parsing %s: %s",
                     path.c_str(), e.what());
        return false;
    }

    try {
        std::chrono::milliseconds timeout = timeout_;
        if (j.contains("timeout_ms")) {
            int timeout_ms = j.at("timeout_ms").get<int>();
            if (timeout_ms <= 0) {
                throw ConfigError(path + ": timeout_ms must be positive");
            }
            timeout = std::chrono::milliseconds(timeout_ms);
        }

        std::vector<ServerEndpoint> servers;
        size_t index = 1;
        for (const auto& s : j.value("servers", json::array())) {
            const std::string where = path + ": servers[" + std::to_string(index - 1) + "]";

            ServerEndpoint endpoint;
            endpoint.host = s.value("host", "");
            endpoint.password = s.value("password", "");
            endpoint.name = s.value("name", "");
            if (endpoint.name.empty()) {
                endpoint.name = "HLL Server " + std::to_string(index);
            }

            if (endpoint.host.empty()) {
                throw ConfigError(where + " has no host");
            }
            if (endpoint.password.empty()) {
                throw ConfigError(where + " has no password");
            }

            const json& port = s.value("port", json());
            if (port.is_number_integer()) {
                endpoint.port = parse_port(std::to_string(port.get<long long>()), where + ".port");
            } else if (port.is_string()) {
                endpoint.port = parse_port(port.get<std::string>(), where + ".port");
            } else {
                throw ConfigError(where + " has no port");
            }

            servers.push_back(std::move(endpoint));
            ++index;
        }
        servers_ = std::move(servers);
        timeout_ = timeout;
    } catch (const json::exception& e) {
        throw ConfigError(path + ": " + e.what());
    }

    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "RconConfig::load_file: Loaded %zu server(s) from %s",
                servers_.size(), path.c_str());
    return true;
}

void RconConfig::load_environment(const EnvLookup& env) {
    const std::string shared_password = non_empty(env, "RCON_PASSWORD").value_or("");
    const std::optional<std::string> shared_port = non_empty(env, "RCON_PORT");

    std::vector<ServerEndpoint> servers;
    for (size_t index = 1;; ++index) {
        const std::string prefix = "SERVER" + std::to_string(index) + "_";
        auto host = non_empty(env, prefix + "HOST");
        if (!host) break;

        auto port = non_empty(env, prefix + "PORT");
        if (!port) port = shared_port;
        std::string password = non_empty(env, prefix + "PASSWORD").value_or(shared_password);

        if (!port || password.empty()) {
            throw ConfigError(prefix + "HOST is defined but port or password is missing. Set "
                              + prefix + "PORT / " + prefix
                              + "PASSWORD or the shared RCON_PORT / RCON_PASSWORD.");
        }

        ServerEndpoint endpoint;
        endpoint.name = non_empty(env, prefix + "NAME").value_or("HLL Server " + std::to_string(index));
        endpoint.host = *host;
        endpoint.port = parse_port(*port, prefix + "PORT");
        endpoint.password = password;
        servers.push_back(std::move(endpoint));
    }

    if (servers.empty()) {
        auto host = non_empty(env, "RCON_HOST");
        if (host && shared_port && !shared_password.empty()) {
            ServerEndpoint endpoint;
            endpoint.name = non_empty(env, "SERVER_NAME").value_or("HLL Server");
            endpoint.host = *host;
            endpoint.port = parse_port(*shared_port, "RCON_PORT");
            endpoint.password = shared_password;
            servers.push_back(std::move(endpoint));
        }
    }

    if (auto timeout = non_empty(env, "RCON_TIMEOUT_MS")) {
        timeout_ = parse_timeout(*timeout, "RCON_TIMEOUT_MS");
    }

    servers_ = std::move(servers);
}

} // namespace hllrcon::registry
