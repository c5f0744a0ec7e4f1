#pragma once

#include "protocol/buffer_writer.hpp"
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>

namespace hllrcon::protocol {

// Bounds-checked reader over a received buffer
class BufferReader {
    std::span<const uint8_t> data_;
    size_t offset_ = 0;

    void check_bounds(size_t n) const {
        if (offset_ + n > data_.size()) {
            throw std::out_of_range("BufferReader: read past end of buffer");
        }
    }

public:
    explicit BufferReader(std::span<const uint8_t> data) : data_(data) {}

    template<typename T>
    T read_le() {
        check_bounds(sizeof(T));
        T val;
        std::memcpy(&val, data_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return from_little_endian(val);
    }

    size_t offset() const { return offset_; }
    size_t remaining_size() const { return data_.size() - offset_; }
};

} // namespace hllrcon::protocol
