//! # Collection Codec Implementation

#include "codec/collection_codecs.hpp"

#include "msgpack/buffer_packer.hpp"

#include <algorithm>

namespace msgcodec::codec {

using msgpack::Array;
using msgpack::Map;

// ============================================================================
// SequenceCodec
// ============================================================================

SequenceCodec::SequenceCodec(TypeDescriptorPtr descriptor, MessageCodecPtr element)
    : MessageCodec(std::move(descriptor)), element_(std::move(element)) {}

auto SequenceCodec::pack(Buffer& buf, size_t index, const Value& value) const
    -> Result<size_t, CodecError> {
    if (!value.is_array()) {
        return CodecError::invalid_value(std::string("expected array for ") +
                                         types::descriptor_to_string(descriptor()) + ", got " +
                                         value.type_name());
    }
    const auto& items = value.as_array();
    auto header =
        from_wire(msgpack::pack_array_header(buf, index, static_cast<int64_t>(items.size())));
    if (is_err(header)) {
        return header;
    }
    size_t pos = index + unwrap(header);
    for (size_t i = 0; i < items.size(); ++i) {
        auto written = element_->pack(buf, pos, items[i]);
        if (is_err(written)) {
            auto err = unwrap_err(written);
            err.message = "[" + std::to_string(i) + "]: " + err.message;
            return err;
        }
        pos += unwrap(written);
    }
    return pos - index;
}

auto SequenceCodec::unpack(MessageUnpacker& unpacker) const -> Result<Value, CodecError> {
    auto size = unpacker.unpack_array_header();
    if (is_err(size)) {
        return CodecError::from_message(unwrap_err(size));
    }

    Array items;
    items.reserve(reserve_hint(unwrap(size), unpacker.remaining()));
    for (uint32_t i = 0; i < unwrap(size); ++i) {
        auto item = element_->unpack(unpacker);
        if (is_err(item)) {
            auto err = unwrap_err(item);
            err.message = "[" + std::to_string(i) + "]: " + err.message;
            return err;
        }
        items.push_back(std::move(unwrap(item)));
    }
    return Value(std::move(items));
}

auto IndexedSequenceCodec::reserve_hint(uint32_t size, size_t remaining) const -> size_t {
    // Each element occupies at least one byte
    return std::min<size_t>(size, remaining);
}

auto ForeignListCodec::name() const -> std::string {
    return "ForeignListCodec(" + descriptor()->as<types::ForeignListShape>().container + ")";
}

// ============================================================================
// MapCodec
// ============================================================================

MapCodec::MapCodec(TypeDescriptorPtr descriptor, MessageCodecPtr key, MessageCodecPtr value)
    : MessageCodec(std::move(descriptor)), key_(std::move(key)), value_(std::move(value)) {}

auto MapCodec::pack(Buffer& buf, size_t index, const Value& value) const
    -> Result<size_t, CodecError> {
    if (!value.is_map()) {
        return CodecError::invalid_value(std::string("expected map for ") +
                                         types::descriptor_to_string(descriptor()) + ", got " +
                                         value.type_name());
    }
    const auto& entries = value.as_map();
    auto header =
        from_wire(msgpack::pack_map_header(buf, index, static_cast<int64_t>(entries.size())));
    if (is_err(header)) {
        return header;
    }
    size_t pos = index + unwrap(header);
    for (const auto& entry : entries) {
        auto k = key_->pack(buf, pos, entry.first);
        if (is_err(k)) {
            return k;
        }
        pos += unwrap(k);
        auto v = value_->pack(buf, pos, entry.second);
        if (is_err(v)) {
            auto err = unwrap_err(v);
            err.message = "[" + entry.first.to_string() + "]: " + err.message;
            return err;
        }
        pos += unwrap(v);
    }
    return pos - index;
}

auto MapCodec::unpack(MessageUnpacker& unpacker) const -> Result<Value, CodecError> {
    auto size = unpacker.unpack_map_header();
    if (is_err(size)) {
        return CodecError::from_message(unwrap_err(size));
    }

    Map entries;
    entries.reserve(std::min<size_t>(unwrap(size), unpacker.remaining() / 2));
    for (uint32_t i = 0; i < unwrap(size); ++i) {
        auto k = key_->unpack(unpacker);
        if (is_err(k)) {
            return k;
        }
        auto v = value_->unpack(unpacker);
        if (is_err(v)) {
            auto err = unwrap_err(v);
            err.message = "[" + unwrap(k).to_string() + "]: " + err.message;
            return err;
        }
        entries.emplace_back(std::move(unwrap(k)), std::move(unwrap(v)));
    }
    return Value(std::move(entries));
}

auto ForeignMapCodec::name() const -> std::string {
    return "ForeignMapCodec(" + descriptor()->as<types::ForeignMapShape>().container + ")";
}

} // namespace msgcodec::codec
