#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace hllrcon::protocol {

class ByteStream;

// Upper bound on a frame body accepted from the wire (16 MiB)
constexpr uint32_t MAX_FRAME_BODY = 16u * 1024u * 1024u;

struct FrameHeader {
    uint32_t message_id = 0;
    uint32_t length = 0;

    static constexpr size_t serialized_size() { return sizeof(uint32_t) * 2; }

    void serialize(BufferWriter& w) const {
        w.write_le(message_id);
        w.write_le(length);
    }

    void deserialize(BufferReader& r) {
        message_id = r.read_le<uint32_t>();
        length = r.read_le<uint32_t>();
    }
};

struct Frame {
    uint32_t message_id = 0;
    uint32_t length = 0;
    std::vector<uint8_t> body;
};

// header(id, body.size()) followed by body
std::vector<uint8_t> encode_frame(uint32_t message_id, std::span<const uint8_t> body);

// Blocks until a whole frame has been read from the stream.
Frame decode_frame(ByteStream& stream);

} // namespace hllrcon::protocol
