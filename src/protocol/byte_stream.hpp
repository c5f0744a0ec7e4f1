#pragma once

#include <cstdint>
#include <span>

namespace hllrcon::protocol {

// Blocking, exact-length byte stream the frame codec reads from and writes to.
// Implementations throw ConnectionClosed when the peer closes before the
// requested bytes arrive and IoError for any other fault.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual void read_exact(std::span<uint8_t> dst) = 0;
    virtual void write_all(std::span<const uint8_t> src) = 0;
    virtual void close() = 0;
};

} // namespace hllrcon::protocol
