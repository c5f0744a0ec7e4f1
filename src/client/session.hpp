#pragma once

#include "client/session_state.hpp"
#include "common/server_endpoint.hpp"
#include "protocol/byte_stream.hpp"
#include "protocol/envelope.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hllrcon::client {

struct SessionOptions {
    // Bounds the connect and every later read and write
    std::chrono::milliseconds timeout{5000};
    // Starting value of the id counter; the first request uses this plus one
    uint32_t first_message_id = 0;
};

// One RCON V2 connection: connect, handshake, authenticated commands, close.
//
// A session is used for a single logical operation and then discarded. It
// owns its socket exclusively; the destructor closes it, so a session going
// out of scope during an exception never leaks the connection.
//
// Any I/O or protocol failure closes the session before the error
// propagates. A CommandError (non-200 status) leaves it usable.
class Session {
public:
    explicit Session(ServerEndpoint endpoint, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Opens the TCP connection and runs ServerConnect then Login.
    // Throws ConnectionError, IoError, ProtocolError or CommandError.
    void connect();

    // Valid only once authenticated. Returns the decoded ContentBody.
    nlohmann::json send_command(std::string_view name, const nlohmann::json& content);

    // Idempotent. Releases the socket and wipes the key and token.
    void close();

    SessionState state() const { return state_; }
    bool is_authenticated() const { return state_ == SessionState::Authenticated; }
    const ServerEndpoint& endpoint() const { return endpoint_; }
    uint32_t last_message_id() const { return message_id_; }

private:
    // Throws ConnectionError, including when no socket can be created
    std::unique_ptr<protocol::ByteStream> open_stream() const;
    void exchange_key();
    void login();

    // One request/response round trip. `encrypt` is false only for ServerConnect.
    protocol::ResponseEnvelope exchange(std::string_view name, const nlohmann::json& content,
                                        bool encrypt, bool include_auth);
    uint32_t next_message_id();
    void transition(SessionEvent event);

    ServerEndpoint endpoint_;
    SessionOptions options_;
    std::unique_ptr<protocol::ByteStream> stream_;

    std::vector<uint8_t> xor_key_;
    std::string auth_token_;
    uint32_t message_id_ = 0;
    SessionState state_ = SessionState::Disconnected;
};

} // namespace hllrcon::client
