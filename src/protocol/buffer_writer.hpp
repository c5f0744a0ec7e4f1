#pragma once

#include <bit>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace hllrcon::protocol {

// Integers on the RCON wire are little endian whatever the host order is.
template<typename T>
constexpr T to_little_endian(T val) {
    static_assert(std::is_unsigned_v<T>);
    if constexpr (std::endian::native == std::endian::little) {
        return val;
    } else {
        T out = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            out = static_cast<T>((out << 8) | ((val >> (8 * i)) & 0xFF));
        }
        return out;
    }
}

template<typename T>
constexpr T from_little_endian(T val) {
    return to_little_endian(val);
}

// Buffer writer with two modes:
//   BufferWriter(span) - fixed buffer, bounds-checked, no allocations
//   BufferWriter(vec)  - append mode, grows the vector on each write
class BufferWriter {
    uint8_t* data_ = nullptr;
    size_t capacity_ = 0;
    size_t offset_ = 0;
    std::vector<uint8_t>* vec_ = nullptr;  // null for span mode

    void ensure(size_t n) {
        if (vec_) {
            if (vec_->size() < offset_ + n) {
                vec_->resize(offset_ + n);
            }
            data_ = vec_->data();
            capacity_ = vec_->size();
        } else if (offset_ + n > capacity_) {
            throw std::out_of_range("BufferWriter: write past end of buffer");
        }
    }

public:
    explicit BufferWriter(std::span<uint8_t> buf)
        : data_(buf.data()), capacity_(buf.size()) {}

    explicit BufferWriter(std::vector<uint8_t>& buf)
        : data_(buf.data()), capacity_(buf.size()), offset_(buf.size()), vec_(&buf) {}

    template<typename T>
    void write_le(T val) {
        ensure(sizeof(T));
        T wire = to_little_endian(val);
        std::memcpy(data_ + offset_, &wire, sizeof(T));
        offset_ += sizeof(T);
    }

    void write_bytes(std::span<const uint8_t> bytes) {
        if (bytes.empty()) return;
        ensure(bytes.size());
        std::memcpy(data_ + offset_, bytes.data(), bytes.size());
        offset_ += bytes.size();
    }

    size_t offset() const { return offset_; }
};

} // namespace hllrcon::protocol
