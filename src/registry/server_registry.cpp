#include "server_registry.hpp"
#include "client/commands.hpp"
#include "client/session.hpp"
#include "common/errors.hpp"
#include "common/string_util.hpp"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace hllrcon::registry {

namespace {

// Trimmed string field of a ServerInformation reply, empty when absent
std::string string_field(const json& info, const char* key) {
    auto it = info.find(key);
    if (it == info.end() || !it->is_string()) return {};
    return util::trim(it->get<std::string>());
}

} // namespace

const char* failure_label(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection:       return "server unreachable";
        case ErrorKind::Io:               return "connection lost";
        case ErrorKind::ConnectionClosed: return "connection closed by server";
        case ErrorKind::Protocol:         return "protocol violation";
        case ErrorKind::Command:          return "command rejected";
    }
    return "failure";
}

ServerRegistry::ServerRegistry(const RconConfig& config)
    : servers_(config.servers()) {
    if (servers_.empty()) {
        throw ConfigError("No RCON servers configured. Provide SERVER*_HOST / SERVER*_PORT / "
                          "SERVER*_PASSWORD or RCON_HOST / RCON_PORT / RCON_PASSWORD.");
    }
    session_options_.timeout = config.timeout();
}

void ServerRegistry::log_failure(const char* operation, const ServerEndpoint& server,
                                 const RconError& e) const {
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ServerRegistry::%s: %s for %s (%s): %s",
                operation, failure_label(e.kind()), server.name.c_str(),
                server.address().c_str(), e.what());
}

void ServerRegistry::fetch_display_names() {
    for (auto& server : servers_) {
        try {
            client::Session session(server, session_options_);
            session.connect();
            std::string name = string_field(client::Commands(session).server_information("session"),
                                            "ServerName");
            if (!name.empty()) {
                server.name = name;
            }
        } catch (const RconError& e) {
            log_failure("fetch_display_names", server, e);
        }
    }
}

std::vector<ServerEntry> ServerRegistry::list_servers() const {
    std::vector<ServerEntry> entries;
    entries.reserve(servers_.size());
    for (size_t i = 0; i < servers_.size(); ++i) {
        entries.push_back({i, servers_[i].name});
    }
    return entries;
}

std::string ServerRegistry::server_name(size_t index) const {
    if (index >= servers_.size()) return UNKNOWN_SERVER;
    return servers_[index].name;
}

std::string ServerRegistry::current_map(size_t index) const {
    if (index >= servers_.size()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ServerRegistry::current_map: Invalid server index %zu",
                    index);
        return UNKNOWN_MAP;
    }

    const ServerEndpoint& server = servers_[index];
    json info;
    try {
        client::Session session(server, session_options_);
        session.connect();
        info = client::Commands(session).server_information("session");
    } catch (const RconError& e) {
        log_failure("current_map", server, e);
        return UNKNOWN_MAP;
    }

    std::string map_name = string_field(info, "MapName");
    if (map_name.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ServerRegistry::current_map: %s (%s) reported no MapName",
                    server.name.c_str(), server.address().c_str());
        return UNKNOWN_MAP;
    }
    return map_name;
}

ChangeMapResult ServerRegistry::change_map(size_t index, const std::string& map_id) const {
    if (index >= servers_.size()) {
        return {false, "Invalid server index"};
    }

    const ServerEndpoint& server = servers_[index];
    try {
        client::Session session(server, session_options_);
        session.connect();

        client::Commands commands(session);
        commands.change_map(map_id);

        // Best effort: a failed read-back does not undo the change
        std::string new_map;
        try {
            new_map = string_field(commands.server_information("session"), "MapName");
        } catch (const RconError& e) {
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION,
                        "ServerRegistry::change_map: Could not read back map on %s: %s",
                        server.name.c_str(), e.what());
        }

        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "ServerRegistry::change_map: %s -> %s",
                    server.name.c_str(), map_id.c_str());
        return {true, "Successfully issued ChangeMap to " + (new_map.empty() ? map_id : new_map)
                      + " on " + server.name};
    } catch (const RconError& e) {
        log_failure("change_map", server, e);
        return {false, e.what()};
    }
}

} // namespace hllrcon::registry
