#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace hllrcon::util {

inline constexpr std::string_view BASE64_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string base64_encode(std::span<const uint8_t> input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    uint32_t accumulator = 0;
    int bits = 0;
    for (uint8_t byte : input) {
        accumulator = (accumulator << 8) | byte;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            output.push_back(BASE64_ALPHABET[(accumulator >> bits) & 0x3F]);
        }
    }
    if (bits > 0) {
        output.push_back(BASE64_ALPHABET[(accumulator << (6 - bits)) & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

inline std::string base64_encode(std::string_view input) {
    return base64_encode(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(input.data()), input.size()));
}

// Strict RFC 4648 decoding: padded input, standard alphabet only.
// Throws std::invalid_argument on anything else.
inline std::vector<uint8_t> base64_decode(std::string_view input) {
    if (input.size() % 4 != 0) {
        throw std::invalid_argument("base64: input length is not a multiple of 4");
    }

    std::array<int, 256> table{};
    table.fill(-1);
    for (size_t i = 0; i < BASE64_ALPHABET.size(); ++i) {
        table[static_cast<uint8_t>(BASE64_ALPHABET[i])] = static_cast<int>(i);
    }

    std::vector<uint8_t> output;
    output.reserve((input.size() / 4) * 3);

    uint32_t accumulator = 0;
    int bits = 0;
    size_t padding = 0;
    for (size_t i = 0; i < input.size(); ++i) {
        char ch = input[i];
        if (ch == '=') {
            // Padding only at the tail, at most two characters
            if (input.size() - i > 2) {
                throw std::invalid_argument("base64: misplaced padding");
            }
            ++padding;
            continue;
        }
        if (padding > 0) {
            throw std::invalid_argument("base64: data after padding");
        }
        int value = table[static_cast<uint8_t>(ch)];
        if (value < 0) {
            throw std::invalid_argument("base64: invalid character");
        }
        accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
        }
    }
    return output;
}

} // namespace hllrcon::util
