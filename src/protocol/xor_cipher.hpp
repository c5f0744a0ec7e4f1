#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace hllrcon::protocol {

// data[i] ^ key[i % key.size()]. Applying it twice with the same key gives
// back the input, so the same call obscures and reveals.
// Throws ProtocolError if the key is empty.
std::vector<uint8_t> xor_transform(std::span<const uint8_t> data, std::span<const uint8_t> key);

} // namespace hllrcon::protocol
