//! # MessagePack Unpacker
//!
//! `MessageUnpacker` reads MessagePack values from a byte span with a forward
//! cursor. It is the inverse of the packer: every `pack_*` function has an
//! `unpack_*` counterpart that accepts what it writes, and more generally any
//! valid encoding of the requested kind (non-minimal encodings included).
//!
//! ## Error Positions
//!
//! On failure the cursor is left where the failing value started, and the
//! error's `offset` points at that byte.
//!
//! ## Example
//!
//! ```cpp
//! MessageUnpacker unpacker(buf.bytes());
//! while (unpacker.has_next()) {
//!     auto value = unpacker.unpack_value();
//!     if (is_err(value)) {
//!         std::cerr << unwrap_err(value).to_string() << std::endl;
//!         break;
//!     }
//!     std::cout << unwrap(value).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "msgpack/msgpack_error.hpp"
#include "msgpack/value.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace msgcodec::msgpack {

/// Limits applied while decoding.
struct UnpackOptions {
    /// Maximum array/map nesting accepted by `unpack_value` and `skip_value`.
    size_t max_depth = 512;
};

/// Kind of the next value, derived from its format code.
enum class ValueType {
    Nil,
    Boolean,
    Integer,
    Float,
    String,
    Binary,
    Array,
    Map,
    Extension,
};

/// Returns the name of a value type ("nil", "integer", ...).
[[nodiscard]] auto value_type_name(ValueType type) -> const char*;

/// Classifies a format code. `NEVER_USED` (0xc1) has no type.
[[nodiscard]] auto value_type_of(uint8_t format) -> std::optional<ValueType>;

/// Header of an extension value.
struct ExtensionTypeHeader {
    int8_t type = 0;
    uint32_t length = 0;
};

class MessageUnpacker {
public:
    explicit MessageUnpacker(std::span<const uint8_t> data, UnpackOptions options = {});

    /// Current cursor position.
    [[nodiscard]] auto position() const -> size_t {
        return pos_;
    }

    /// Bytes left after the cursor.
    [[nodiscard]] auto remaining() const -> size_t {
        return data_.size() - pos_;
    }

    [[nodiscard]] auto has_next() const -> bool {
        return pos_ < data_.size();
    }

    /// Peeks at the next format code without consuming it.
    [[nodiscard]] auto next_format() const -> Result<uint8_t, MessageError>;

    /// Peeks at the kind of the next value.
    [[nodiscard]] auto next_value_type() const -> Result<ValueType, MessageError>;

    /// Consumes a nil if one is next; returns whether it did.
    auto try_unpack_nil() -> bool;

    // ------------------------------------------------------------------------
    // Scalars
    // ------------------------------------------------------------------------

    auto unpack_nil() -> Result<bool, MessageError>;
    auto unpack_boolean() -> Result<bool, MessageError>;

    /// Any integer form that fits in `int64_t`.
    auto unpack_i64() -> Result<int64_t, MessageError>;

    /// Any non-negative integer form.
    auto unpack_u64() -> Result<uint64_t, MessageError>;

    /// Any integer form, as an `int64_t` or (above `INT64_MAX`) `uint64_t` value.
    auto unpack_integer() -> Result<Value, MessageError>;

    /// float 32 or float 64, widened to double.
    auto unpack_f64() -> Result<double, MessageError>;

    // ------------------------------------------------------------------------
    // Headers and payloads
    // ------------------------------------------------------------------------

    auto unpack_raw_string_header() -> Result<uint32_t, MessageError>;
    auto unpack_string() -> Result<std::string, MessageError>;
    auto unpack_array_header() -> Result<uint32_t, MessageError>;
    auto unpack_map_header() -> Result<uint32_t, MessageError>;
    auto unpack_binary_header() -> Result<uint32_t, MessageError>;
    auto unpack_extension_type_header() -> Result<ExtensionTypeHeader, MessageError>;

    /// Consumes `len` raw bytes.
    auto read_payload(size_t len) -> Result<std::span<const uint8_t>, MessageError>;

    // ------------------------------------------------------------------------
    // Whole values
    // ------------------------------------------------------------------------

    /// Decodes the next value, including nested containers.
    auto unpack_value() -> Result<Value, MessageError>;

    /// Skips the next value, including nested containers.
    auto skip_value() -> Result<bool, MessageError>;

private:
    std::span<const uint8_t> data_;
    UnpackOptions options_;
    size_t pos_ = 0;

    [[nodiscard]] auto require(size_t start, size_t len) const -> std::optional<MessageError>;
    [[nodiscard]] auto read_be(size_t at, size_t width) const -> uint64_t;
    [[nodiscard]] auto mismatch(const char* expected, uint8_t format) const -> MessageError;

    auto unpack_value_at_depth(size_t depth) -> Result<Value, MessageError>;
    auto skip_value_at_depth(size_t depth) -> Result<bool, MessageError>;
};

} // namespace msgcodec::msgpack
