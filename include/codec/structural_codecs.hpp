//! # Structural Codecs
//!
//! Codecs for options, tuples, enums and records. Each is built from the codecs
//! of its nested types, which the factory resolves first.
//!
//! | Codec         | Value form                     | Wire form                      |
//! |---------------|--------------------------------|--------------------------------|
//! | `OptionCodec` | nil or inner value             | nil or inner encoding          |
//! | `TupleCodec`  | array of exact arity           | array of exact arity           |
//! | `EnumCodec`   | string naming a symbol         | str                            |
//! | `RecordCodec` | map from field name to value   | array of field values in order |
//!
//! Records go over the wire positionally: the field names live in the
//! descriptor, not in the message.

#pragma once

#include "codec/message_codec.hpp"

#include <string>
#include <vector>

namespace msgcodec::codec {

class OptionCodec : public MessageCodec {
public:
    OptionCodec(TypeDescriptorPtr descriptor, MessageCodecPtr inner);

    [[nodiscard]] auto inner() const -> const MessageCodecPtr& {
        return inner_;
    }

    [[nodiscard]] auto name() const -> std::string override {
        return "OptionCodec";
    }
    [[nodiscard]] auto pack(Buffer& buf, size_t index, const Value& value) const
        -> Result<size_t, CodecError> override;
    [[nodiscard]] auto unpack(MessageUnpacker& unpacker) const
        -> Result<Value, CodecError> override;

private:
    MessageCodecPtr inner_;
};

class TupleCodec : public MessageCodec {
public:
    TupleCodec(TypeDescriptorPtr descriptor, std::vector<MessageCodecPtr> elements);

    [[nodiscard]] auto elements() const -> const std::vector<MessageCodecPtr>& {
        return elements_;
    }

    [[nodiscard]] auto name() const -> std::string override {
        return "TupleCodec";
    }
    [[nodiscard]] auto pack(Buffer& buf, size_t index, const Value& value) const
        -> Result<size_t, CodecError> override;
    [[nodiscard]] auto unpack(MessageUnpacker& unpacker) const
        -> Result<Value, CodecError> override;

private:
    std::vector<MessageCodecPtr> elements_;
};

class EnumCodec : public MessageCodec {
public:
    /// `descriptor` must hold an `EnumShape`.
    explicit EnumCodec(TypeDescriptorPtr descriptor);

    [[nodiscard]] auto symbols() const -> const std::vector<std::string>& {
        return symbols_;
    }

    [[nodiscard]] auto name() const -> std::string override {
        return "EnumCodec";
    }
    [[nodiscard]] auto pack(Buffer& buf, size_t index, const Value& value) const
        -> Result<size_t, CodecError> override;
    [[nodiscard]] auto unpack(MessageUnpacker& unpacker) const
        -> Result<Value, CodecError> override;

private:
    std::vector<std::string> symbols_;

    [[nodiscard]] auto is_symbol(const std::string& s) const -> bool;
};

/// A record field paired with the codec resolved for its type.
struct FieldCodec {
    std::string name;
    MessageCodecPtr codec;
    bool optional = false; // an absent value packs as nil
};

/// Packs a record map as an array of its field values in declaration order.
///
/// A decoded record always carries every field: an optional field that was
/// absent when packed comes back present with a nil value.
class RecordCodec : public MessageCodec {
public:
    /// `descriptor` must hold a `RecordShape` whose fields line up with
    /// `field_codecs`.
    RecordCodec(TypeDescriptorPtr descriptor, std::vector<MessageCodecPtr> field_codecs);

    [[nodiscard]] auto fields() const -> const std::vector<FieldCodec>& {
        return fields_;
    }

    [[nodiscard]] auto name() const -> std::string override {
        return "RecordCodec";
    }
    [[nodiscard]] auto pack(Buffer& buf, size_t index, const Value& value) const
        -> Result<size_t, CodecError> override;
    [[nodiscard]] auto unpack(MessageUnpacker& unpacker) const
        -> Result<Value, CodecError> override;

private:
    std::string record_name_;
    std::vector<FieldCodec> fields_;
};

} // namespace msgcodec::codec
