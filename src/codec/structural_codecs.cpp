//! # Structural Codec Implementation

#include "codec/structural_codecs.hpp"

#include "msgpack/buffer_packer.hpp"

#include <algorithm>

namespace msgcodec::codec {

using msgpack::Array;
using msgpack::Map;

// ============================================================================
// OptionCodec
// ============================================================================

OptionCodec::OptionCodec(TypeDescriptorPtr descriptor, MessageCodecPtr inner)
    : MessageCodec(std::move(descriptor)), inner_(std::move(inner)) {}

auto OptionCodec::pack(Buffer& buf, size_t index, const Value& value) const
    -> Result<size_t, CodecError> {
    if (value.is_nil()) {
        return msgpack::pack_nil(buf, index);
    }
    return inner_->pack(buf, index, value);
}

auto OptionCodec::unpack(MessageUnpacker& unpacker) const -> Result<Value, CodecError> {
    if (unpacker.try_unpack_nil()) {
        return Value();
    }
    return inner_->unpack(unpacker);
}

// ============================================================================
// TupleCodec
// ============================================================================

TupleCodec::TupleCodec(TypeDescriptorPtr descriptor, std::vector<MessageCodecPtr> elements)
    : MessageCodec(std::move(descriptor)), elements_(std::move(elements)) {}

auto TupleCodec::pack(Buffer& buf, size_t index, const Value& value) const
    -> Result<size_t, CodecError> {
    if (!value.is_array()) {
        return CodecError::invalid_value(std::string("expected tuple array, got ") +
                                         value.type_name());
    }
    const auto& items = value.as_array();
    if (items.size() != elements_.size()) {
        return CodecError::invalid_value("expected " + std::to_string(elements_.size()) +
                                         " tuple elements, got " + std::to_string(items.size()));
    }

    auto header =
        from_wire(msgpack::pack_array_header(buf, index, static_cast<int64_t>(items.size())));
    if (is_err(header)) {
        return header;
    }
    size_t pos = index + unwrap(header);
    for (size_t i = 0; i < items.size(); ++i) {
        auto written = elements_[i]->pack(buf, pos, items[i]);
        if (is_err(written)) {
            return written;
        }
        pos += unwrap(written);
    }
    return pos - index;
}

auto TupleCodec::unpack(MessageUnpacker& unpacker) const -> Result<Value, CodecError> {
    auto size = unpacker.unpack_array_header();
    if (is_err(size)) {
        return CodecError::from_message(unwrap_err(size));
    }
    if (unwrap(size) != elements_.size()) {
        return CodecError::invalid_value("expected " + std::to_string(elements_.size()) +
                                         " tuple elements, got " + std::to_string(unwrap(size)));
    }

    Array items;
    items.reserve(elements_.size());
    for (const auto& element : elements_) {
        auto item = element->unpack(unpacker);
        if (is_err(item)) {
            return item;
        }
        items.push_back(std::move(unwrap(item)));
    }
    return Value(std::move(items));
}

// ============================================================================
// EnumCodec
// ============================================================================

EnumCodec::EnumCodec(TypeDescriptorPtr descriptor)
    : MessageCodec(std::move(descriptor)),
      symbols_(this->descriptor()->as<types::EnumShape>().symbols) {}

auto EnumCodec::is_symbol(const std::string& s) const -> bool {
    return std::find(symbols_.begin(), symbols_.end(), s) != symbols_.end();
}

auto EnumCodec::pack(Buffer& buf, size_t index, const Value& value) const
    -> Result<size_t, CodecError> {
    if (!value.is_string()) {
        return CodecError::invalid_value(std::string("expected enum symbol, got ") +
                                         value.type_name());
    }
    if (!is_symbol(value.as_string())) {
        return CodecError::invalid_value("'" + value.as_string() + "' is not a symbol of " +
                                         types::descriptor_to_string(descriptor()));
    }
    return from_wire(msgpack::pack_string(buf, index, value.as_string()));
}

auto EnumCodec::unpack(MessageUnpacker& unpacker) const -> Result<Value, CodecError> {
    auto s = unpacker.unpack_string();
    if (is_err(s)) {
        return CodecError::from_message(unwrap_err(s));
    }
    if (!is_symbol(unwrap(s))) {
        return CodecError::invalid_value("'" + unwrap(s) + "' is not a symbol of " +
                                         types::descriptor_to_string(descriptor()));
    }
    return Value(std::move(unwrap(s)));
}

// ============================================================================
// RecordCodec
// ============================================================================

RecordCodec::RecordCodec(TypeDescriptorPtr descriptor, std::vector<MessageCodecPtr> field_codecs)
    : MessageCodec(std::move(descriptor)) {
    const auto& record = this->descriptor()->as<types::RecordShape>();
    record_name_ = record.name;
    fields_.reserve(record.fields.size());
    for (size_t i = 0; i < record.fields.size() && i < field_codecs.size(); ++i) {
        const auto& field = record.fields[i];
        bool optional = field.type && field.type->is<types::OptionShape>();
        fields_.push_back(FieldCodec{field.name, std::move(field_codecs[i]), optional});
    }
}

auto RecordCodec::pack(Buffer& buf, size_t index, const Value& value) const
    -> Result<size_t, CodecError> {
    if (!value.is_map()) {
        return CodecError::invalid_value("expected " + record_name_ + " as a map, got " +
                                         value.type_name());
    }
    for (const auto& entry : value.as_map()) {
        const Value& key = entry.first;
        bool known = key.is_string() &&
                     std::any_of(fields_.begin(), fields_.end(),
                                 [&](const FieldCodec& f) { return f.name == key.as_string(); });
        if (!known) {
            return CodecError::invalid_value(record_name_ + " has no field " + key.to_string());
        }
    }

    auto header =
        from_wire(msgpack::pack_array_header(buf, index, static_cast<int64_t>(fields_.size())));
    if (is_err(header)) {
        return header;
    }
    size_t pos = index + unwrap(header);
    for (const auto& field : fields_) {
        const Value* field_value = value.get(field.name);
        if (!field_value) {
            if (!field.optional) {
                return CodecError::invalid_value(record_name_ + "." + field.name +
                                                 " is missing");
            }
            pos += msgpack::pack_nil(buf, pos);
            continue;
        }
        auto written = field.codec->pack(buf, pos, *field_value);
        if (is_err(written)) {
            auto err = unwrap_err(written);
            err.message = record_name_ + "." + field.name + ": " + err.message;
            return err;
        }
        pos += unwrap(written);
    }
    return pos - index;
}

auto RecordCodec::unpack(MessageUnpacker& unpacker) const -> Result<Value, CodecError> {
    auto size = unpacker.unpack_array_header();
    if (is_err(size)) {
        return CodecError::from_message(unwrap_err(size));
    }
    if (unwrap(size) != fields_.size()) {
        return CodecError::invalid_value(record_name_ + " expects " +
                                         std::to_string(fields_.size()) + " fields, got " +
                                         std::to_string(unwrap(size)));
    }

    Map entries;
    entries.reserve(fields_.size());
    for (const auto& field : fields_) {
        auto item = field.codec->unpack(unpacker);
        if (is_err(item)) {
            auto err = unwrap_err(item);
            err.message = record_name_ + "." + field.name + ": " + err.message;
            return err;
        }
        entries.emplace_back(Value(field.name), std::move(unwrap(item)));
    }
    return Value(std::move(entries));
}

} // namespace msgcodec::codec
