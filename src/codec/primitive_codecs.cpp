//! # Primitive Codec Implementation

#include "codec/primitive_codecs.hpp"

#include "msgpack/buffer_packer.hpp"

#include <array>
#include <cmath>
#include <limits>

namespace msgcodec::codec {

using types::PrimitiveKind;

namespace {

constexpr std::array ALL_KINDS = {
    PrimitiveKind::Bool, PrimitiveKind::I8,     PrimitiveKind::I16,    PrimitiveKind::I32,
    PrimitiveKind::I64,  PrimitiveKind::U8,     PrimitiveKind::U16,    PrimitiveKind::U32,
    PrimitiveKind::U64,  PrimitiveKind::F32,    PrimitiveKind::F64,    PrimitiveKind::String,
    PrimitiveKind::Binary, PrimitiveKind::Any,
};

struct SignedRange {
    int64_t min;
    int64_t max;
};

auto signed_range(PrimitiveKind kind) -> SignedRange {
    switch (kind) {
    case PrimitiveKind::I8:
        return {std::numeric_limits<int8_t>::min(), std::numeric_limits<int8_t>::max()};
    case PrimitiveKind::I16:
        return {std::numeric_limits<int16_t>::min(), std::numeric_limits<int16_t>::max()};
    case PrimitiveKind::I32:
        return {std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()};
    default:
        return {std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max()};
    }
}

auto unsigned_max(PrimitiveKind kind) -> uint64_t {
    switch (kind) {
    case PrimitiveKind::U8:
        return std::numeric_limits<uint8_t>::max();
    case PrimitiveKind::U16:
        return std::numeric_limits<uint16_t>::max();
    case PrimitiveKind::U32:
        return std::numeric_limits<uint32_t>::max();
    default:
        return std::numeric_limits<uint64_t>::max();
    }
}

auto is_signed_kind(PrimitiveKind kind) -> bool {
    return kind == PrimitiveKind::I8 || kind == PrimitiveKind::I16 || kind == PrimitiveKind::I32 ||
           kind == PrimitiveKind::I64;
}

auto is_unsigned_kind(PrimitiveKind kind) -> bool {
    return kind == PrimitiveKind::U8 || kind == PrimitiveKind::U16 || kind == PrimitiveKind::U32 ||
           kind == PrimitiveKind::U64;
}

auto is_known_kind(PrimitiveKind kind) -> bool {
    for (auto k : ALL_KINDS) {
        if (k == kind)
            return true;
    }
    return false;
}

auto out_of_range(PrimitiveKind kind, const Value& value) -> CodecError {
    return CodecError::invalid_value(value.to_string() + " is out of range for " +
                                     types::primitive_kind_to_string(kind));
}

auto wrong_type(PrimitiveKind kind, const Value& value) -> CodecError {
    return CodecError::invalid_value(std::string("expected ") +
                                     types::primitive_kind_to_string(kind) + ", got " +
                                     value.type_name());
}

} // namespace

PrimitiveCodec::PrimitiveCodec(PrimitiveKind kind)
    : MessageCodec(types::make_primitive(kind)), kind_(kind) {}

auto PrimitiveCodec::name() const -> std::string {
    return "PrimitiveCodec(" + types::primitive_kind_to_string(kind_) + ")";
}

auto PrimitiveCodec::pack(Buffer& buf, size_t index, const Value& value) const
    -> Result<size_t, CodecError> {
    if (is_signed_kind(kind_)) {
        auto v = value.try_as_i64();
        if (!v) {
            return value.is_integer() ? out_of_range(kind_, value) : wrong_type(kind_, value);
        }
        auto range = signed_range(kind_);
        if (*v < range.min || *v > range.max) {
            return out_of_range(kind_, value);
        }
        return msgpack::pack_i64(buf, index, *v);
    }
    if (is_unsigned_kind(kind_)) {
        auto v = value.try_as_u64();
        if (!v) {
            return value.is_integer() ? out_of_range(kind_, value) : wrong_type(kind_, value);
        }
        if (*v > unsigned_max(kind_)) {
            return out_of_range(kind_, value);
        }
        return msgpack::pack_u64(buf, index, *v);
    }

    switch (kind_) {
    case PrimitiveKind::Bool:
        if (!value.is_bool()) {
            return wrong_type(kind_, value);
        }
        return msgpack::pack_boolean(buf, index, value.as_bool());
    case PrimitiveKind::F32:
    case PrimitiveKind::F64: {
        auto v = value.try_as_f64();
        if (!v) {
            return wrong_type(kind_, value);
        }
        if (kind_ == PrimitiveKind::F32) {
            // Infinity and NaN have f32 forms; finite values must fit.
            if (std::isfinite(*v) && std::fabs(*v) > std::numeric_limits<float>::max()) {
                return out_of_range(kind_, value);
            }
            return msgpack::pack_f32(buf, index, static_cast<float>(*v));
        }
        return msgpack::pack_f64(buf, index, *v);
    }
    case PrimitiveKind::String:
        if (!value.is_string()) {
            return wrong_type(kind_, value);
        }
        return from_wire(msgpack::pack_string(buf, index, value.as_string()));
    case PrimitiveKind::Binary:
        if (!value.is_binary()) {
            return wrong_type(kind_, value);
        }
        return from_wire(msgpack::pack_binary(buf, index, value.as_binary().data));
    case PrimitiveKind::Any:
        return from_wire(msgpack::pack_value(buf, index, value));
    default:
        break;
    }
    return CodecError::unimplemented_shape("no packer for " +
                                           types::primitive_kind_to_string(kind_));
}

auto PrimitiveCodec::unpack(MessageUnpacker& unpacker) const -> Result<Value, CodecError> {
    if (is_signed_kind(kind_)) {
        auto v = unpacker.unpack_i64();
        if (is_err(v)) {
            return CodecError::from_message(unwrap_err(v));
        }
        auto range = signed_range(kind_);
        if (unwrap(v) < range.min || unwrap(v) > range.max) {
            return out_of_range(kind_, Value(unwrap(v)));
        }
        return Value(unwrap(v));
    }
    if (is_unsigned_kind(kind_)) {
        auto v = unpacker.unpack_u64();
        if (is_err(v)) {
            return CodecError::from_message(unwrap_err(v));
        }
        if (unwrap(v) > unsigned_max(kind_)) {
            return out_of_range(kind_, Value(unwrap(v)));
        }
        return Value(unwrap(v));
    }

    switch (kind_) {
    case PrimitiveKind::Bool: {
        auto v = unpacker.unpack_boolean();
        if (is_err(v)) {
            return CodecError::from_message(unwrap_err(v));
        }
        return Value(unwrap(v));
    }
    case PrimitiveKind::F32:
    case PrimitiveKind::F64: {
        auto v = unpacker.unpack_f64();
        if (is_err(v)) {
            return CodecError::from_message(unwrap_err(v));
        }
        if (kind_ == PrimitiveKind::F32) {
            return Value(static_cast<float>(unwrap(v)));
        }
        return Value(unwrap(v));
    }
    case PrimitiveKind::String: {
        auto v = unpacker.unpack_string();
        if (is_err(v)) {
            return CodecError::from_message(unwrap_err(v));
        }
        return Value(std::move(unwrap(v)));
    }
    case PrimitiveKind::Binary: {
        auto len = unpacker.unpack_binary_header();
        if (is_err(len)) {
            return CodecError::from_message(unwrap_err(len));
        }
        auto payload = unpacker.read_payload(unwrap(len));
        if (is_err(payload)) {
            return CodecError::from_message(unwrap_err(payload));
        }
        auto bytes = unwrap(payload);
        return Value(msgpack::Binary{std::vector<uint8_t>(bytes.begin(), bytes.end())});
    }
    case PrimitiveKind::Any:
        return from_wire(unpacker.unpack_value());
    default:
        break;
    }
    return CodecError::unimplemented_shape("no unpacker for " +
                                           types::primitive_kind_to_string(kind_));
}

auto primitive_codec(PrimitiveKind kind) -> MessageCodecPtr {
    if (!is_known_kind(kind)) {
        return nullptr;
    }
    const auto& codecs = standard_codecs();
    auto it = codecs.find(types::make_primitive(kind));
    return it != codecs.end() ? it->second : nullptr;
}

auto standard_codecs() -> const CodecMap& {
    static const CodecMap codecs = [] {
        CodecMap map;
        for (auto kind : ALL_KINDS) {
            auto codec = std::make_shared<PrimitiveCodec>(kind);
            map.emplace(codec->descriptor(), std::move(codec));
        }
        return map;
    }();
    return codecs;
}

} // namespace msgcodec::codec
