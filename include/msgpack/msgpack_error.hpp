//! # MessagePack Error Types
//!
//! Errors reported by the packer and the unpacker. Packing fails only on
//! caller errors (negative sizes, values outside the format's range); unpacking
//! fails when the input is truncated or holds an unexpected format code.
//!
//! ## Example
//!
//! ```cpp
//! auto header = pack_array_header(buf, 0, -1);
//! if (is_err(header)) {
//!     std::cerr << unwrap_err(header).to_string() << std::endl;
//!     // Output: "invalid argument: invalid size: array size must be >= 0 (-1)"
//! }
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace msgcodec::msgpack {

/// An error encountered while packing or unpacking MessagePack data.
struct MessageError {
    enum class Kind {
        InvalidArgument,  ///< Caller error: negative size, out-of-range value, oversize length
        InsufficientData, ///< Input ended before the value was complete
        TypeMismatch,     ///< Found a format code other than the one requested
        NestingTooDeep,   ///< Nested containers exceed UnpackOptions::max_depth
    };

    Kind kind;

    /// Human-readable error description.
    std::string message;

    /// Byte position where the error was detected (0 if not applicable).
    size_t offset = 0;

    static auto invalid_argument(std::string msg) -> MessageError {
        return MessageError{Kind::InvalidArgument, std::move(msg), 0};
    }

    static auto insufficient_data(std::string msg, size_t offset) -> MessageError {
        return MessageError{Kind::InsufficientData, std::move(msg), offset};
    }

    static auto type_mismatch(std::string msg, size_t offset) -> MessageError {
        return MessageError{Kind::TypeMismatch, std::move(msg), offset};
    }

    static auto nesting_too_deep(std::string msg, size_t offset) -> MessageError {
        return MessageError{Kind::NestingTooDeep, std::move(msg), offset};
    }

    [[nodiscard]] static auto kind_name(Kind kind) -> const char* {
        switch (kind) {
        case Kind::InvalidArgument:
            return "invalid argument";
        case Kind::InsufficientData:
            return "insufficient data";
        case Kind::TypeMismatch:
            return "type mismatch";
        case Kind::NestingTooDeep:
            return "nesting too deep";
        }
        return "unknown error";
    }

    /// Formats the error as "<kind>: <message>", with " at offset N" for
    /// errors detected while reading.
    [[nodiscard]] auto to_string() const -> std::string {
        std::string out = std::string(kind_name(kind)) + ": " + message;
        if (kind != Kind::InvalidArgument) {
            out += " at offset " + std::to_string(offset);
        }
        return out;
    }
};

} // namespace msgcodec::msgpack
