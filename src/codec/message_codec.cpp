//! # Message Codec Implementation
//!
//! Error formatting and the byte-vector conveniences shared by every codec.

#include "codec/message_codec.hpp"

namespace msgcodec::codec {

auto CodecError::kind_name(Kind kind) -> const char* {
    switch (kind) {
    case Kind::InvalidArgument:
        return "invalid argument";
    case Kind::UnsupportedStructure:
        return "unsupported structure";
    case Kind::UnimplementedShape:
        return "unimplemented shape";
    case Kind::UnknownType:
        return "unknown type";
    case Kind::InvalidValue:
        return "invalid value";
    case Kind::Message:
        return "message error";
    }
    return "unknown error";
}

auto CodecError::to_string() const -> std::string {
    return std::string(kind_name(kind)) + ": " + message;
}

auto MessageCodec::encode(const Value& value) const -> Result<std::vector<uint8_t>, CodecError> {
    msgpack::ArrayBuffer buf;
    auto written = pack(buf, 0, value);
    if (is_err(written)) {
        return unwrap_err(written);
    }
    return buf.to_vector();
}

auto MessageCodec::decode(std::span<const uint8_t> bytes) const -> Result<Value, CodecError> {
    MessageUnpacker unpacker(bytes);
    auto value = unpack(unpacker);
    if (is_err(value)) {
        return value;
    }
    if (unpacker.has_next()) {
        return CodecError::invalid_value(std::to_string(unpacker.remaining()) +
                                         " trailing byte(s) after " +
                                         types::descriptor_to_string(descriptor()) + " value");
    }
    return value;
}

} // namespace msgcodec::codec
