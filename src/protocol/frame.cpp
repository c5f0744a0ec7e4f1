#include "frame.hpp"
#include "common/errors.hpp"
#include "protocol/byte_stream.hpp"
#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace hllrcon::protocol {

std::vector<uint8_t> encode_frame(uint32_t message_id, std::span<const uint8_t> body) {
    if (body.size() > std::numeric_limits<uint32_t>::max()) {
        throw ProtocolError("frame body does not fit a 32-bit length");
    }

    std::vector<uint8_t> data;
    data.reserve(FrameHeader::serialized_size() + body.size());
    BufferWriter w(data);
    FrameHeader hdr;
    hdr.message_id = message_id;
    hdr.length = static_cast<uint32_t>(body.size());
    hdr.serialize(w);
    w.write_bytes(body);
    return data;
}

Frame decode_frame(ByteStream& stream) {
    std::array<uint8_t, FrameHeader::serialized_size()> header_buffer;
    stream.read_exact(header_buffer);

    BufferReader r(header_buffer);
    FrameHeader hdr;
    hdr.deserialize(r);

    if (hdr.length > MAX_FRAME_BODY) {
        throw ProtocolError("frame " + std::to_string(hdr.message_id) + " announces "
                            + std::to_string(hdr.length) + " body bytes, limit is "
                            + std::to_string(MAX_FRAME_BODY));
    }

    Frame frame;
    frame.message_id = hdr.message_id;
    frame.length = hdr.length;
    frame.body.resize(hdr.length);
    if (hdr.length > 0) {
        stream.read_exact(frame.body);
    }
    return frame;
}

} // namespace hllrcon::protocol
