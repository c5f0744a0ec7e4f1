#include "envelope.hpp"
#include "common/errors.hpp"
#include "common/string_util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace hllrcon::protocol {

namespace {

// Servers are not consistent about field casing (StatusCode vs statusCode),
// so every response field is looked up under both spellings.
const json* find_field(const json& j, const char* pascal, const char* camel) {
    auto it = j.find(pascal);
    if (it != j.end()) return &*it;
    it = j.find(camel);
    if (it != j.end()) return &*it;
    return nullptr;
}

std::string string_field(const json& j, const char* pascal, const char* camel) {
    const json* v = find_field(j, pascal, camel);
    if (v && v->is_string()) return v->get<std::string>();
    return {};
}

} // namespace

json RequestEnvelope::to_json() const {
    return json{
        {"AuthToken", auth_token},
        {"Version", version},
        {"Name", name},
        {"ContentBody", content_body},
    };
}

std::vector<uint8_t> RequestEnvelope::serialize() const {
    std::string text = to_json().dump(-1, ' ', false, json::error_handler_t::replace);
    return std::vector<uint8_t>(text.begin(), text.end());
}

ResponseEnvelope ResponseEnvelope::parse(std::span<const uint8_t> body) {
    json j;
    try {
        j = json::parse(body.begin(), body.end());
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("malformed JSON body: ") + e.what());
    }
    if (!j.is_object()) {
        throw ProtocolError("response body is not a JSON object");
    }

    ResponseEnvelope resp;
    const json* status = find_field(j, "StatusCode", "statusCode");
    if (status && status->is_number_integer()) {
        resp.status_code = status->get<int>();
    }
    resp.status_message = string_field(j, "StatusMessage", "statusMessage");
    resp.name = string_field(j, "Name", "name");

    const json* content = find_field(j, "ContentBody", "contentBody");
    if (content) {
        resp.content_body = decode_content_body(*content);
    }
    return resp;
}

json decode_content_body(const json& raw) {
    if (!raw.is_string()) {
        return raw;
    }

    std::string text = raw.get<std::string>();
    text.erase(std::remove(text.begin(), text.end(), '\0'), text.end());
    text = util::trim(text);

    if (!text.empty() && (text.front() == '{' || text.front() == '[')) {
        json nested = json::parse(text, nullptr, false);
        if (!nested.is_discarded()) {
            return nested;
        }
    }
    return text;
}

} // namespace hllrcon::protocol
