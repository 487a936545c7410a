//! # Offset-Addressed Buffers
//!
//! A `Buffer` is a mutable byte region written at explicit indices. The packer
//! functions never append: every write names its position, and the buffer
//! grows on demand so that `[index, index + len)` is always addressable.
//!
//! ## Byte Order
//!
//! All multi-byte integers and floats are written big-endian, as MessagePack
//! requires.
//!
//! ## Implementations
//!
//! | Class         | Storage                  |
//! |---------------|--------------------------|
//! | `ArrayBuffer` | growable `std::vector`   |
//!
//! Other storage (memory-mapped files, pooled slabs) can be plugged in by
//! implementing `data()`, `size()` and `ensure_capacity()`.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace msgcodec::msgpack {

/// Abstract offset-addressed byte buffer.
///
/// Write methods return the number of bytes written. Read methods require
/// `index + width <= size()`.
class Buffer {
public:
    virtual ~Buffer() = default;

    /// Current addressable size in bytes.
    [[nodiscard]] virtual auto size() const -> size_t = 0;

    /// Grows the buffer so that at least `required` bytes are addressable.
    /// Existing contents are preserved.
    virtual void ensure_capacity(size_t required) = 0;

    /// Raw storage, valid until the next `ensure_capacity` call.
    [[nodiscard]] virtual auto data() -> uint8_t* = 0;
    [[nodiscard]] virtual auto data() const -> const uint8_t* = 0;

    // ------------------------------------------------------------------------
    // Writes
    // ------------------------------------------------------------------------

    auto write_byte(size_t index, uint8_t b) -> size_t;
    auto write_short(size_t index, int16_t v) -> size_t;
    auto write_int(size_t index, int32_t v) -> size_t;
    auto write_long(size_t index, int64_t v) -> size_t;
    auto write_float(size_t index, float v) -> size_t;
    auto write_double(size_t index, double v) -> size_t;

    /// Format code followed by a fixed-width payload.
    auto write_byte_and_byte(size_t index, uint8_t code, uint8_t v) -> size_t;
    auto write_byte_and_short(size_t index, uint8_t code, int16_t v) -> size_t;
    auto write_byte_and_int(size_t index, uint8_t code, int32_t v) -> size_t;
    auto write_byte_and_long(size_t index, uint8_t code, int64_t v) -> size_t;
    auto write_byte_and_float(size_t index, uint8_t code, float v) -> size_t;
    auto write_byte_and_double(size_t index, uint8_t code, double v) -> size_t;

    /// Copies `src` to `[index, index + src.size())`.
    auto write_bytes(size_t index, std::span<const uint8_t> src) -> size_t;

    // ------------------------------------------------------------------------
    // Reads
    // ------------------------------------------------------------------------

    [[nodiscard]] auto read_byte(size_t index) const -> uint8_t;
    [[nodiscard]] auto read_short(size_t index) const -> int16_t;
    [[nodiscard]] auto read_int(size_t index) const -> int32_t;
    [[nodiscard]] auto read_long(size_t index) const -> int64_t;
    [[nodiscard]] auto read_float(size_t index) const -> float;
    [[nodiscard]] auto read_double(size_t index) const -> double;

    /// View of `[index, index + len)`.
    [[nodiscard]] auto read_bytes(size_t index, size_t len) const -> std::span<const uint8_t>;

    /// View of the whole buffer.
    [[nodiscard]] auto bytes() const -> std::span<const uint8_t> {
        return {data(), size()};
    }

private:
    void write_be(size_t index, uint64_t v, size_t width);
    [[nodiscard]] auto read_be(size_t index, size_t width) const -> uint64_t;
};

/// Growable buffer backed by a `std::vector<uint8_t>`.
///
/// `size()` is the high-water mark of all writes; growth at least doubles the
/// reserved capacity.
class ArrayBuffer : public Buffer {
public:
    ArrayBuffer() = default;
    explicit ArrayBuffer(size_t initial_capacity);

    [[nodiscard]] auto size() const -> size_t override {
        return bytes_.size();
    }

    void ensure_capacity(size_t required) override;

    [[nodiscard]] auto data() -> uint8_t* override {
        return bytes_.data();
    }

    [[nodiscard]] auto data() const -> const uint8_t* override {
        return bytes_.data();
    }

    /// Capacity reserved so far.
    [[nodiscard]] auto capacity() const -> size_t {
        return bytes_.capacity();
    }

    /// Discards the contents; capacity is kept.
    void clear() {
        bytes_.clear();
    }

    /// Copies the contents out.
    [[nodiscard]] auto to_vector() const -> std::vector<uint8_t> {
        return bytes_;
    }

private:
    std::vector<uint8_t> bytes_;
};

} // namespace msgcodec::msgpack
