//! # Collection Codecs
//!
//! Codecs for sequences and maps. All sequence variants share the array wire
//! form and all map variants the map wire form; they differ only in how a
//! decoded collection is materialized.
//!
//! | Codec                  | Descriptor shape              |
//! |------------------------|-------------------------------|
//! | `SequenceCodec`        | `Seq[T]`                      |
//! | `IndexedSequenceCodec` | `IndexedSeq[T]`               |
//! | `ForeignListCodec`     | list from another library     |
//! | `MapCodec`             | `Map[K, V]`                   |
//! | `ForeignMapCodec`      | map from another library      |

#pragma once

#include "codec/message_codec.hpp"

#include <string>

namespace msgcodec::codec {

class SequenceCodec : public MessageCodec {
public:
    SequenceCodec(TypeDescriptorPtr descriptor, MessageCodecPtr element);

    [[nodiscard]] auto element() const -> const MessageCodecPtr& {
        return element_;
    }

    [[nodiscard]] auto name() const -> std::string override {
        return "SequenceCodec";
    }
    [[nodiscard]] auto pack(Buffer& buf, size_t index, const Value& value) const
        -> Result<size_t, CodecError> override;
    [[nodiscard]] auto unpack(MessageUnpacker& unpacker) const
        -> Result<Value, CodecError> override;

protected:
    /// Elements to reserve before decoding `size` of them.
    [[nodiscard]] virtual auto reserve_hint(uint32_t size, size_t remaining) const -> size_t {
        (void)size;
        (void)remaining;
        return 0;
    }

private:
    MessageCodecPtr element_;
};

/// Sequence decoded into contiguous storage sized up front.
class IndexedSequenceCodec : public SequenceCodec {
public:
    using SequenceCodec::SequenceCodec;

    [[nodiscard]] auto name() const -> std::string override {
        return "IndexedSequenceCodec";
    }

protected:
    [[nodiscard]] auto reserve_hint(uint32_t size, size_t remaining) const -> size_t override;
};

/// Sequence adapter for a list-like container from another library.
class ForeignListCodec : public SequenceCodec {
public:
    using SequenceCodec::SequenceCodec;

    [[nodiscard]] auto name() const -> std::string override;
};

class MapCodec : public MessageCodec {
public:
    MapCodec(TypeDescriptorPtr descriptor, MessageCodecPtr key, MessageCodecPtr value);

    [[nodiscard]] auto key() const -> const MessageCodecPtr& {
        return key_;
    }

    [[nodiscard]] auto value() const -> const MessageCodecPtr& {
        return value_;
    }

    [[nodiscard]] auto name() const -> std::string override {
        return "MapCodec";
    }
    [[nodiscard]] auto pack(Buffer& buf, size_t index, const Value& value) const
        -> Result<size_t, CodecError> override;
    [[nodiscard]] auto unpack(MessageUnpacker& unpacker) const
        -> Result<Value, CodecError> override;

private:
    MessageCodecPtr key_;
    MessageCodecPtr value_;
};

/// Map adapter for a map-like container from another library.
class ForeignMapCodec : public MapCodec {
public:
    using MapCodec::MapCodec;

    [[nodiscard]] auto name() const -> std::string override;
};

} // namespace msgcodec::codec
