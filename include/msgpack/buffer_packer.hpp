//! # MessagePack Packer
//!
//! Stateless functions that write one MessagePack unit into a `Buffer` at an
//! explicit index and return the number of bytes written. Nothing is appended
//! and no position is remembered: the caller advances its own cursor by the
//! returned count.
//!
//! ## Minimal Encoding
//!
//! Every function picks the format code with the fewest total bytes for the
//! value. Integers are tested from the widest negative range inwards, then
//! through fixnum and successively wider unsigned ranges:
//!
//! | Range                 | Code              | Bytes |
//! |-----------------------|-------------------|-------|
//! | `[-2^63, -2^31)`      | int 64            | 9     |
//! | `[-2^31, -2^15)`      | int 32            | 5     |
//! | `[-2^15, -2^7)`       | int 16            | 3     |
//! | `[-2^7, -2^5)`        | int 8             | 2     |
//! | `[-2^5, 2^7)`         | fixint            | 1     |
//! | `[2^7, 2^8)`          | uint 8            | 2     |
//! | `[2^8, 2^16)`         | uint 16           | 3     |
//! | `[2^16, 2^32)`        | uint 32           | 5     |
//! | `[2^32, 2^64)`        | uint 64           | 9     |
//!
//! ## Example
//!
//! ```cpp
//! ArrayBuffer buf;
//! size_t pos = 0;
//! pos += unwrap(pack_array_header(buf, pos, 2));
//! pos += pack_i64(buf, pos, -33);
//! pos += unwrap(pack_string(buf, pos, "hello"));
//! ```
//!
//! ## Limits
//!
//! Lengths above 32 bits have no MessagePack representation; the functions
//! that accept such lengths return `MessageError::Kind::InvalidArgument` and
//! write nothing.

#pragma once

#include "common.hpp"
#include "msgpack/big_integer.hpp"
#include "msgpack/buffer.hpp"
#include "msgpack/msgpack_error.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace msgcodec::msgpack {

// ============================================================================
// Scalars
// ============================================================================

auto pack_nil(Buffer& buf, size_t index) -> size_t;
auto pack_boolean(Buffer& buf, size_t index, bool v) -> size_t;

auto pack_i8(Buffer& buf, size_t index, int8_t v) -> size_t;
auto pack_i16(Buffer& buf, size_t index, int16_t v) -> size_t;
auto pack_i32(Buffer& buf, size_t index, int32_t v) -> size_t;
auto pack_i64(Buffer& buf, size_t index, int64_t v) -> size_t;

auto pack_u8(Buffer& buf, size_t index, uint8_t v) -> size_t;
auto pack_u16(Buffer& buf, size_t index, uint16_t v) -> size_t;
auto pack_u32(Buffer& buf, size_t index, uint32_t v) -> size_t;

/// Values above `INT64_MAX` use the uint 64 form.
auto pack_u64(Buffer& buf, size_t index, uint64_t v) -> size_t;

/// Packs a value of at most 64 bits.
///
/// Values with `bit_length() <= 63` go through `pack_i64`; non-negative
/// 64-bit values use uint 64. Anything wider fails with `InvalidArgument`.
[[nodiscard]] auto pack_big_integer(Buffer& buf, size_t index, const BigInteger& v)
    -> Result<size_t, MessageError>;

/// Always float 32; no narrowing is attempted.
auto pack_f32(Buffer& buf, size_t index, float v) -> size_t;

/// Always float 64.
auto pack_f64(Buffer& buf, size_t index, double v) -> size_t;

// ============================================================================
// Headers
// ============================================================================

/// fixstr below 32 bytes, then str 8/16/32.
auto pack_raw_string_header(Buffer& buf, size_t index, uint32_t len) -> size_t;

/// Header and UTF-8 payload; returns their combined length.
[[nodiscard]] auto pack_string(Buffer& buf, size_t index, std::string_view s)
    -> Result<size_t, MessageError>;

/// fixarray below 16 elements, then array 16/32. Negative sizes fail and
/// write nothing.
[[nodiscard]] auto pack_array_header(Buffer& buf, size_t index, int64_t size)
    -> Result<size_t, MessageError>;

/// fixmap below 16 entries, then map 16/32. Negative sizes fail and write
/// nothing.
[[nodiscard]] auto pack_map_header(Buffer& buf, size_t index, int64_t size)
    -> Result<size_t, MessageError>;

/// Extension header with a trailing type tag.
///
/// | Payload length            | Form          | Bytes |
/// |---------------------------|---------------|-------|
/// | 1, 2, 4, 8, 16            | fixext N      | 2     |
/// | other, below 2^8          | ext 8         | 3     |
/// | below 2^16                | ext 16        | 4     |
/// | below 2^32                | ext 32        | 6     |
[[nodiscard]] auto pack_extension_type_header(Buffer& buf, size_t index, int8_t ext_type,
                                              int64_t payload_len) -> Result<size_t, MessageError>;

/// bin 8/16/32; binary data has no fixed form.
auto pack_binary_header(Buffer& buf, size_t index, uint32_t len) -> size_t;

/// Header and payload of a binary value.
[[nodiscard]] auto pack_binary(Buffer& buf, size_t index, std::span<const uint8_t> data)
    -> Result<size_t, MessageError>;

/// Extension header and payload.
[[nodiscard]] auto pack_extension(Buffer& buf, size_t index, int8_t ext_type,
                                  std::span<const uint8_t> data) -> Result<size_t, MessageError>;

// ============================================================================
// Payload
// ============================================================================

/// Copies raw bytes with no header.
auto write_payload(Buffer& buf, size_t index, std::span<const uint8_t> data) -> size_t;

/// Copies `data[offset, offset + length)` with no header.
auto write_payload(Buffer& buf, size_t index, std::span<const uint8_t> data, size_t offset,
                   size_t length) -> size_t;

} // namespace msgcodec::msgpack
