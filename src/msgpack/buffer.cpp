//! # Buffer Implementation
//!
//! Big-endian scalar access for `Buffer` and growth policy for `ArrayBuffer`.

#include "msgpack/buffer.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace msgcodec::msgpack {

// ============================================================================
// Big-endian helpers
// ============================================================================

void Buffer::write_be(size_t index, uint64_t v, size_t width) {
    ensure_capacity(index + width);
    uint8_t* dst = data() + index;
    for (size_t i = 0; i < width; ++i) {
        dst[i] = static_cast<uint8_t>(v >> (8 * (width - 1 - i)));
    }
}

auto Buffer::read_be(size_t index, size_t width) const -> uint64_t {
    const uint8_t* src = data() + index;
    uint64_t v = 0;
    for (size_t i = 0; i < width; ++i) {
        v = (v << 8) | src[i];
    }
    return v;
}

// ============================================================================
// Writes
// ============================================================================

auto Buffer::write_byte(size_t index, uint8_t b) -> size_t {
    ensure_capacity(index + 1);
    data()[index] = b;
    return 1;
}

auto Buffer::write_short(size_t index, int16_t v) -> size_t {
    write_be(index, static_cast<uint16_t>(v), 2);
    return 2;
}

auto Buffer::write_int(size_t index, int32_t v) -> size_t {
    write_be(index, static_cast<uint32_t>(v), 4);
    return 4;
}

auto Buffer::write_long(size_t index, int64_t v) -> size_t {
    write_be(index, static_cast<uint64_t>(v), 8);
    return 8;
}

auto Buffer::write_float(size_t index, float v) -> size_t {
    write_be(index, std::bit_cast<uint32_t>(v), 4);
    return 4;
}

auto Buffer::write_double(size_t index, double v) -> size_t {
    write_be(index, std::bit_cast<uint64_t>(v), 8);
    return 8;
}

auto Buffer::write_byte_and_byte(size_t index, uint8_t code, uint8_t v) -> size_t {
    ensure_capacity(index + 2);
    data()[index] = code;
    data()[index + 1] = v;
    return 2;
}

auto Buffer::write_byte_and_short(size_t index, uint8_t code, int16_t v) -> size_t {
    write_be(index + 1, static_cast<uint16_t>(v), 2);
    data()[index] = code;
    return 3;
}

auto Buffer::write_byte_and_int(size_t index, uint8_t code, int32_t v) -> size_t {
    write_be(index + 1, static_cast<uint32_t>(v), 4);
    data()[index] = code;
    return 5;
}

auto Buffer::write_byte_and_long(size_t index, uint8_t code, int64_t v) -> size_t {
    write_be(index + 1, static_cast<uint64_t>(v), 8);
    data()[index] = code;
    return 9;
}

auto Buffer::write_byte_and_float(size_t index, uint8_t code, float v) -> size_t {
    write_be(index + 1, std::bit_cast<uint32_t>(v), 4);
    data()[index] = code;
    return 5;
}

auto Buffer::write_byte_and_double(size_t index, uint8_t code, double v) -> size_t {
    write_be(index + 1, std::bit_cast<uint64_t>(v), 8);
    data()[index] = code;
    return 9;
}

auto Buffer::write_bytes(size_t index, std::span<const uint8_t> src) -> size_t {
    if (src.empty()) {
        return 0;
    }
    ensure_capacity(index + src.size());
    std::memcpy(data() + index, src.data(), src.size());
    return src.size();
}

// ============================================================================
// Reads
// ============================================================================

auto Buffer::read_byte(size_t index) const -> uint8_t {
    return data()[index];
}

auto Buffer::read_short(size_t index) const -> int16_t {
    return static_cast<int16_t>(read_be(index, 2));
}

auto Buffer::read_int(size_t index) const -> int32_t {
    return static_cast<int32_t>(read_be(index, 4));
}

auto Buffer::read_long(size_t index) const -> int64_t {
    return static_cast<int64_t>(read_be(index, 8));
}

auto Buffer::read_float(size_t index) const -> float {
    return std::bit_cast<float>(static_cast<uint32_t>(read_be(index, 4)));
}

auto Buffer::read_double(size_t index) const -> double {
    return std::bit_cast<double>(read_be(index, 8));
}

auto Buffer::read_bytes(size_t index, size_t len) const -> std::span<const uint8_t> {
    return {data() + index, len};
}

// ============================================================================
// ArrayBuffer
// ============================================================================

ArrayBuffer::ArrayBuffer(size_t initial_capacity) {
    bytes_.reserve(initial_capacity);
}

void ArrayBuffer::ensure_capacity(size_t required) {
    if (required <= bytes_.size()) {
        return;
    }
    if (required > bytes_.capacity()) {
        bytes_.reserve(std::max(required, bytes_.capacity() * 2));
    }
    bytes_.resize(required, 0);
}

} // namespace msgcodec::msgpack
