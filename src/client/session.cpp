#include "session.hpp"
#include "client/tcp_stream.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "protocol/command_name.hpp"
#include "protocol/frame.hpp"
#include "protocol/xor_cipher.hpp"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace hllrcon::client {

using namespace hllrcon::protocol;

Session::Session(ServerEndpoint endpoint, SessionOptions options)
    : endpoint_(std::move(endpoint))
    , options_(options)
    , message_id_(options.first_message_id) {
}

Session::~Session() {
    close();
}

void Session::transition(SessionEvent event) {
    auto next = next_state(state_, event);
    if (!next) {
        throw ProtocolError(std::string("invalid session transition: ") + session_event_name(event)
                            + " in state " + session_state_name(state_));
    }
    state_ = *next;
}

uint32_t Session::next_message_id() {
    // Unsigned arithmetic wraps modulo 2^32
    return ++message_id_;
}

std::unique_ptr<ByteStream> Session::open_stream() const {
    // The io_context and its reactor allocate descriptors; running out of
    // them surfaces from asio as std::system_error.
    try {
        auto stream = std::make_unique<TcpStream>(options_.timeout);
        stream->connect(endpoint_.host, endpoint_.port);
        return stream;
    } catch (const std::system_error& e) {
        throw ConnectionError(endpoint_.host, endpoint_.port, e.what());
    }
}

void Session::connect() {
    transition(SessionEvent::Connect);

    try {
        stream_ = open_stream();

        exchange_key();
        login();
    } catch (const RconError&) {
        close();
        throw;
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Session::connect: Authenticated with %s (%s)",
                 endpoint_.address().c_str(), endpoint_.name.c_str());
}

void Session::exchange_key() {
    ResponseEnvelope resp = exchange(command::ServerConnect, "", false, false);

    if (!resp.content_body.is_string() || resp.content_body.get<std::string>().empty()) {
        throw ProtocolError("ServerConnect did not return an XOR key");
    }

    std::vector<uint8_t> key;
    try {
        key = util::base64_decode(resp.content_body.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(std::string("failed to decode XOR key from ServerConnect: ") + e.what());
    }
    if (key.empty()) {
        throw ProtocolError("received empty XOR key from server");
    }

    xor_key_ = std::move(key);
    transition(SessionEvent::KeyExchanged);
}

void Session::login() {
    ResponseEnvelope resp = exchange(command::Login, endpoint_.password, true, false);

    // decode_content_body already trimmed surrounding whitespace
    if (!resp.content_body.is_string() || resp.content_body.get<std::string>().empty()) {
        throw ProtocolError("Login did not return an auth token");
    }

    auth_token_ = resp.content_body.get<std::string>();
    transition(SessionEvent::LoggedIn);
}

nlohmann::json Session::send_command(std::string_view name, const nlohmann::json& content) {
    if (state_ != SessionState::Authenticated || auth_token_.empty()) {
        throw ProtocolError("cannot send " + std::string(name) + ": session is "
                            + session_state_name(state_) + ", not Authenticated");
    }
    return exchange(name, content, true, true).content_body;
}

ResponseEnvelope Session::exchange(std::string_view name, const nlohmann::json& content,
                                   bool encrypt, bool include_auth) {
    if (!stream_) {
        throw ProtocolError("connection has been closed");
    }

    try {
        RequestEnvelope req;
        req.auth_token = include_auth ? auth_token_ : "";
        req.name = std::string(name);
        req.content_body = content;

        std::vector<uint8_t> body = req.serialize();
        if (encrypt) {
            body = xor_transform(body, xor_key_);
        }

        const uint32_t id = next_message_id();
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Session::exchange: -> %s (id %u, %zu bytes)",
                     req.name.c_str(), id, body.size());
        stream_->write_all(encode_frame(id, body));

        Frame frame = decode_frame(*stream_);
        if (frame.message_id != id) {
            throw ProtocolError("desync: response id " + std::to_string(frame.message_id)
                                + " did not match request id " + std::to_string(id)
                                + " for " + req.name);
        }

        std::vector<uint8_t> plain = encrypt ? xor_transform(frame.body, xor_key_)
                                             : std::move(frame.body);
        ResponseEnvelope resp = ResponseEnvelope::parse(plain);
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Session::exchange: <- %s (id %u, status %d)",
                     req.name.c_str(), id, resp.status_code);

        if (resp.status_code != STATUS_OK) {
            throw CommandError(req.name, resp.status_code, resp.status_message);
        }
        return resp;
    } catch (const IoError&) {
        close();
        throw;
    } catch (const ProtocolError&) {
        close();
        throw;
    }
}

void Session::close() {
    if (stream_) {
        stream_->close();
        stream_.reset();
    }

    std::fill(xor_key_.begin(), xor_key_.end(), uint8_t{0});
    xor_key_.clear();
    std::fill(auth_token_.begin(), auth_token_.end(), '\0');
    auth_token_.clear();

    transition(SessionEvent::Close);
}

} // namespace hllrcon::client
