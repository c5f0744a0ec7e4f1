#include "xor_cipher.hpp"
#include "common/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace hllrcon::protocol {

std::vector<uint8_t> xor_transform(std::span<const uint8_t> data, std::span<const uint8_t> key) {
    if (key.empty()) {
        throw ProtocolError("XOR key not initialized");
    }

    std::vector<uint8_t> out(data.size());
    const size_t key_len = key.size();
    for (size_t i = 0; i < data.size(); ++i) {
        out[i] = data[i] ^ key[i % key_len];
    }
    return out;
}

} // namespace hllrcon::protocol
