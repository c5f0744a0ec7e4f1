// Server list loading from environment variables and JSON files.

#include "common/errors.hpp"
#include "registry/rcon_config.hpp"
#include "test_harness.hpp"
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>

using namespace hllrcon;
using namespace hllrcon::registry;

namespace {

// EnvLookup over a fixed set of variables
EnvLookup env_of(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

// Temporary JSON file removed on scope exit
struct TempFile {
    std::filesystem::path path;

    explicit TempFile(const std::string& contents) {
        static int counter = 0;
        path = std::filesystem::temp_directory_path()
            / ("hllrcon_config_test_" + std::to_string(++counter) + ".json");
        std::ofstream(path) << contents;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

} // namespace

// ============================================================================
// Environment
// ============================================================================

TEST(indexed_servers_in_order) {
    RconConfig config;
    config.load_environment(env_of({
        {"SERVER1_HOST", "10.0.0.1"}, {"SERVER1_PORT", "7779"}, {"SERVER1_PASSWORD", "one"},
        {"SERVER1_NAME", "Frontline"},
        {"SERVER2_HOST", "10.0.0.2"}, {"SERVER2_PORT", "7780"}, {"SERVER2_PASSWORD", "two"},
    }));

    const auto& servers = config.servers();
    ASSERT_EQ(servers.size(), size_t{2});
    ASSERT_EQ(servers[0].name, std::string("Frontline"));
    ASSERT_EQ(servers[0].host, std::string("10.0.0.1"));
    ASSERT_EQ(servers[0].port, 7779);
    ASSERT_EQ(servers[0].password, std::string("one"));
    ASSERT_EQ(servers[1].name, std::string("HLL Server 2"));
    ASSERT_EQ(servers[1].port, 7780);
    ASSERT_TRUE(config.timeout() == RconConfig::DEFAULT_TIMEOUT);
}

TEST(indexed_servers_stop_at_first_gap) {
    RconConfig config;
    config.load_environment(env_of({
        {"SERVER1_HOST", "a"}, {"SERVER1_PORT", "1"}, {"SERVER1_PASSWORD", "p"},
        {"SERVER3_HOST", "c"}, {"SERVER3_PORT", "3"}, {"SERVER3_PASSWORD", "p"},
    }));
    ASSERT_EQ(config.servers().size(), size_t{1});
}

TEST(shared_port_and_password_fallback) {
    RconConfig config;
    config.load_environment(env_of({
        {"RCON_PORT", "7779"}, {"RCON_PASSWORD", "shared"},
        {"SERVER1_HOST", "a"},
        {"SERVER2_HOST", "b"}, {"SERVER2_PORT", "8000"},
    }));

    const auto& servers = config.servers();
    ASSERT_EQ(servers.size(), size_t{2});
    ASSERT_EQ(servers[0].port, 7779);
    ASSERT_EQ(servers[0].password, std::string("shared"));
    ASSERT_EQ(servers[1].port, 8000);
    ASSERT_EQ(servers[1].password, std::string("shared"));
}

TEST(indexed_host_without_password_rejected) {
    RconConfig config;
    ASSERT_THROWS(config.load_environment(env_of({{"SERVER1_HOST", "a"}, {"SERVER1_PORT", "1"}})),
                  ConfigError);
}

TEST(legacy_single_server) {
    RconConfig config;
    config.load_environment(env_of({
        {"RCON_HOST", "hll.example.org"}, {"RCON_PORT", "7779"}, {"RCON_PASSWORD", "pw"},
    }));

    ASSERT_EQ(config.servers().size(), size_t{1});
    ASSERT_EQ(config.servers()[0].name, std::string("HLL Server"));
    ASSERT_EQ(config.servers()[0].host, std::string("hll.example.org"));
}

TEST(legacy_single_server_with_name) {
    RconConfig config;
    config.load_environment(env_of({
        {"RCON_HOST", "h"}, {"RCON_PORT", "7779"}, {"RCON_PASSWORD", "pw"}, {"SERVER_NAME", "Main"},
    }));
    ASSERT_EQ(config.servers()[0].name, std::string("Main"));
}

TEST(legacy_incomplete_gives_no_servers) {
    RconConfig config;
    config.load_environment(env_of({{"RCON_HOST", "h"}, {"RCON_PORT", "7779"}}));
    ASSERT_TRUE(config.servers().empty());
}

TEST(indexed_servers_take_precedence_over_legacy) {
    RconConfig config;
    config.load_environment(env_of({
        {"RCON_HOST", "legacy"}, {"RCON_PORT", "7779"}, {"RCON_PASSWORD", "pw"},
        {"SERVER1_HOST", "indexed"},
    }));
    ASSERT_EQ(config.servers().size(), size_t{1});
    ASSERT_EQ(config.servers()[0].host, std::string("indexed"));
}

TEST(empty_variables_count_as_unset) {
    RconConfig config;
    config.load_environment(env_of({
        {"SERVER1_HOST", ""}, {"RCON_HOST", "h"}, {"RCON_PORT", "7779"}, {"RCON_PASSWORD", "pw"},
    }));
    ASSERT_EQ(config.servers().size(), size_t{1});
    ASSERT_EQ(config.servers()[0].host, std::string("h"));
}

TEST(invalid_port_rejected) {
    RconConfig config;
    ASSERT_THROWS(config.load_environment(env_of({
        {"SERVER1_HOST", "a"}, {"SERVER1_PORT", "70000"}, {"SERVER1_PASSWORD", "p"},
    })), ConfigError);
    ASSERT_THROWS(config.load_environment(env_of({
        {"SERVER1_HOST", "a"}, {"SERVER1_PORT", "77x"}, {"SERVER1_PASSWORD", "p"},
    })), ConfigError);
    ASSERT_THROWS(config.load_environment(env_of({
        {"SERVER1_HOST", "a"}, {"SERVER1_PORT", "0"}, {"SERVER1_PASSWORD", "p"},
    })), ConfigError);
}

TEST(timeout_from_environment) {
    RconConfig config;
    config.load_environment(env_of({{"RCON_TIMEOUT_MS", "1500"}}));
    ASSERT_TRUE(config.timeout() == std::chrono::milliseconds(1500));

    ASSERT_THROWS(config.load_environment(env_of({{"RCON_TIMEOUT_MS", "-5"}})), ConfigError);
    ASSERT_THROWS(config.load_environment(env_of({{"RCON_TIMEOUT_MS", "0"}})), ConfigError);
}

TEST(parse_helpers) {
    ASSERT_EQ(RconConfig::parse_port("65535", "port"), 65535);
    ASSERT_EQ(RconConfig::parse_port("1", "port"), 1);
    ASSERT_THROWS(RconConfig::parse_port("", "port"), ConfigError);
    ASSERT_THROWS(RconConfig::parse_port("65536", "port"), ConfigError);
    ASSERT_TRUE(RconConfig::parse_timeout("250", "-t") == std::chrono::milliseconds(250));
    ASSERT_THROWS(RconConfig::parse_timeout("2.5", "-t"), ConfigError);
}

// ============================================================================
// JSON file
// ============================================================================

TEST(load_file_reads_servers) {
    TempFile file(R"({
        "timeout_ms": 2500,
        "servers": [
            {"name": "Frontline", "host": "10.0.0.1", "port": 7779, "password": "one"},
            {"host": "10.0.0.2", "port": "7780", "password": "two"}
        ]
    })");

    RconConfig config;
    ASSERT_TRUE(config.load_file(file.path.string()));
    ASSERT_EQ(config.servers().size(), size_t{2});
    ASSERT_EQ(config.servers()[0].name, std::string("Frontline"));
    ASSERT_EQ(config.servers()[0].port, 7779);
    ASSERT_EQ(config.servers()[1].name, std::string("HLL Server 2"));
    ASSERT_EQ(config.servers()[1].port, 7780);
    ASSERT_TRUE(config.timeout() == std::chrono::milliseconds(2500));
}

TEST(load_file_missing_returns_false) {
    RconConfig config;
    ASSERT_FALSE(config.load_file("/nonexistent/hllrcon/servers.json"));
    ASSERT_TRUE(config.servers().empty());
}

TEST(load_file_malformed_returns_false) {
    TempFile file("{\"servers\": [");
    RconConfig config;
    ASSERT_FALSE(config.load_file(file.path.string()));
}

TEST(load_file_invalid_entry_throws_and_keeps_state) {
    TempFile file(R"({"timeout_ms": 900, "servers": [{"host": "a", "port": 99999, "password": "p"}]})");

    RconConfig config;
    config.set_timeout(std::chrono::milliseconds(1234));
    ASSERT_THROWS(config.load_file(file.path.string()), ConfigError);
    ASSERT_TRUE(config.servers().empty());
    ASSERT_TRUE(config.timeout() == std::chrono::milliseconds(1234));
}

TEST(load_file_entry_without_password_throws) {
    TempFile file(R"({"servers": [{"host": "a", "port": 7779}]})");
    RconConfig config;
    ASSERT_THROWS(config.load_file(file.path.string()), ConfigError);
}

TEST(load_file_wrong_types_throw) {
    TempFile file(R"({"timeout_ms": "soon", "servers": []})");
    RconConfig config;
    ASSERT_THROWS(config.load_file(file.path.string()), ConfigError);
}

int main() {
    std::printf("\n  Config tests\n\n");

    RUN_TEST(indexed_servers_in_order);
    RUN_TEST(indexed_servers_stop_at_first_gap);
    RUN_TEST(shared_port_and_password_fallback);
    RUN_TEST(indexed_host_without_password_rejected);
    RUN_TEST(legacy_single_server);
    RUN_TEST(legacy_single_server_with_name);
    RUN_TEST(legacy_incomplete_gives_no_servers);
    RUN_TEST(indexed_servers_take_precedence_over_legacy);
    RUN_TEST(empty_variables_count_as_unset);
    RUN_TEST(invalid_port_rejected);
    RUN_TEST(timeout_from_environment);
    RUN_TEST(parse_helpers);

    RUN_TEST(load_file_reads_servers);
    RUN_TEST(load_file_missing_returns_false);
    RUN_TEST(load_file_malformed_returns_false);
    RUN_TEST(load_file_invalid_entry_throws_and_keeps_state);
    RUN_TEST(load_file_entry_without_password_throws);
    RUN_TEST(load_file_wrong_types_throw);

    return print_results("Config");
}
