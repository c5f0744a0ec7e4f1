#pragma once

#include "protocol/command_name.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace hllrcon::protocol {

// Logical request carried, as JSON, inside a frame body
struct RequestEnvelope {
    std::string auth_token;
    int version = PROTOCOL_VERSION;
    std::string name;
    nlohmann::json content_body = "";

    nlohmann::json to_json() const;

    // Compact UTF-8 encoding, no whitespace
    std::vector<uint8_t> serialize() const;
};

struct ResponseEnvelope {
    int status_code = 0;
    std::string status_message;
    std::string name;
    nlohmann::json content_body;  // already passed through decode_content_body

    // Throws ProtocolError on malformed JSON or a body that is not an object.
    static ResponseEnvelope parse(std::span<const uint8_t> body);
};

// String content has NUL bytes removed and whitespace trimmed; when the
// result looks like a JSON object or array it is parsed. Anything else is
// returned unchanged.
nlohmann::json decode_content_body(const nlohmann::json& raw);

} // namespace hllrcon::protocol
