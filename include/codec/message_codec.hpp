//! # Message Codecs
//!
//! A `MessageCodec` packs and unpacks values of exactly one type, the one its
//! descriptor describes. Codecs are immutable once built and shared through
//! `MessageCodecPtr`, so one instance can serve any number of threads.
//!
//! ## Error Handling
//!
//! Codecs report failures as `CodecError`. Wire-level failures from the packer
//! or unpacker are wrapped with `Kind::Message`; a value that does not match
//! the codec's type is `Kind::InvalidValue`.
//!
//! ## Example
//!
//! ```cpp
//! auto codec = unwrap(factory.of<std::vector<int32_t>>());
//!
//! Array items;
//! items.emplace_back(1);
//! items.emplace_back(2);
//! auto bytes = codec->encode(Value(std::move(items)));
//! auto decoded = codec->decode(unwrap(bytes));
//! ```

#pragma once

#include "common.hpp"
#include "msgpack/buffer.hpp"
#include "msgpack/message_unpacker.hpp"
#include "msgpack/msgpack_error.hpp"
#include "msgpack/value.hpp"
#include "types/type_descriptor.hpp"

#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace msgcodec::codec {

using msgpack::Buffer;
using msgpack::MessageUnpacker;
using msgpack::Value;
using types::TypeDescriptorPtr;

/// An error raised while resolving a codec or packing/unpacking with one.
struct CodecError {
    enum class Kind {
        InvalidArgument,      ///< Caller error, e.g. a null descriptor
        UnsupportedStructure, ///< The type refers to itself before derivation completes
        UnimplementedShape,   ///< The descriptor holds a shape no codec handles
        UnknownType,          ///< A type name the introspector cannot resolve
        InvalidValue,         ///< A value that does not fit the codec's type
        Message,              ///< Wire-level packing or unpacking failure
    };

    Kind kind;
    std::string message;

    static auto invalid_argument(std::string msg) -> CodecError {
        return CodecError{Kind::InvalidArgument, std::move(msg)};
    }

    static auto unsupported_structure(std::string msg) -> CodecError {
        return CodecError{Kind::UnsupportedStructure, std::move(msg)};
    }

    static auto unimplemented_shape(std::string msg) -> CodecError {
        return CodecError{Kind::UnimplementedShape, std::move(msg)};
    }

    static auto unknown_type(std::string msg) -> CodecError {
        return CodecError{Kind::UnknownType, std::move(msg)};
    }

    static auto invalid_value(std::string msg) -> CodecError {
        return CodecError{Kind::InvalidValue, std::move(msg)};
    }

    static auto from_message(const msgpack::MessageError& err) -> CodecError {
        return CodecError{Kind::Message, err.to_string()};
    }

    [[nodiscard]] static auto kind_name(Kind kind) -> const char*;

    /// Formats the error as "<kind>: <message>".
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Converts a wire-level result into a codec result.
template <typename T>
[[nodiscard]] auto from_wire(Result<T, msgpack::MessageError> result) -> Result<T, CodecError> {
    if (is_err(result)) {
        return CodecError::from_message(unwrap_err(result));
    }
    return std::move(unwrap(result));
}

/// Packs and unpacks values of one type.
class MessageCodec {
public:
    explicit MessageCodec(TypeDescriptorPtr descriptor) : descriptor_(std::move(descriptor)) {}
    virtual ~MessageCodec() = default;

    MessageCodec(const MessageCodec&) = delete;
    auto operator=(const MessageCodec&) -> MessageCodec& = delete;

    /// The type this codec is bound to.
    [[nodiscard]] auto descriptor() const -> const TypeDescriptorPtr& {
        return descriptor_;
    }

    /// Codec class name for diagnostics ("OptionCodec", "RecordCodec", ...).
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /// Writes `value` at `index`; returns the bytes written.
    [[nodiscard]] virtual auto pack(Buffer& buf, size_t index, const Value& value) const
        -> Result<size_t, CodecError> = 0;

    /// Reads one value from the unpacker's cursor.
    [[nodiscard]] virtual auto unpack(MessageUnpacker& unpacker) const
        -> Result<Value, CodecError> = 0;

    /// Packs `value` into a fresh byte vector.
    [[nodiscard]] auto encode(const Value& value) const -> Result<std::vector<uint8_t>, CodecError>;

    /// Unpacks one value from `bytes`. Trailing bytes are an error.
    [[nodiscard]] auto decode(std::span<const uint8_t> bytes) const -> Result<Value, CodecError>;

private:
    TypeDescriptorPtr descriptor_;
};

using MessageCodecPtr = std::shared_ptr<const MessageCodec>;

/// Codec table keyed by structural descriptor equality.
using CodecMap = std::unordered_map<TypeDescriptorPtr, MessageCodecPtr, types::DescriptorHash,
                                    types::DescriptorEqual>;

} // namespace msgcodec::codec
