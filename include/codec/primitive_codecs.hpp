//! # Primitive Codecs
//!
//! One codec per `PrimitiveKind`. Integers are range-checked against their
//! kind on both pack and unpack, and always written with the minimal integer
//! form, so an `i64` codec and a `u8` codec produce the same bytes for 7.
//!
//! | Kind              | Value form             | Wire form          |
//! |-------------------|------------------------|--------------------|
//! | `Bool`            | bool                   | true / false       |
//! | `I8`..`I64`       | integer in range       | minimal integer    |
//! | `U8`..`U64`       | non-negative integer   | minimal integer    |
//! | `F32`             | float or double        | float 32           |
//! | `F64`             | float or double        | float 64           |
//! | `String`          | string                 | str                |
//! | `Binary`          | binary                 | bin                |
//! | `Any`             | anything               | as `pack_value`    |

#pragma once

#include "codec/message_codec.hpp"

namespace msgcodec::codec {

class PrimitiveCodec : public MessageCodec {
public:
    explicit PrimitiveCodec(types::PrimitiveKind kind);

    [[nodiscard]] auto kind() const -> types::PrimitiveKind {
        return kind_;
    }

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto pack(Buffer& buf, size_t index, const Value& value) const
        -> Result<size_t, CodecError> override;
    [[nodiscard]] auto unpack(MessageUnpacker& unpacker) const
        -> Result<Value, CodecError> override;

private:
    types::PrimitiveKind kind_;
};

/// Shared codec for a primitive kind; null for a kind outside `PrimitiveKind`.
[[nodiscard]] auto primitive_codec(types::PrimitiveKind kind) -> MessageCodecPtr;

/// Known-codec table holding the codec of every primitive kind.
[[nodiscard]] auto standard_codecs() -> const CodecMap&;

} // namespace msgcodec::codec
