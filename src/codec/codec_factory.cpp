//! # Codec Factory Implementation
//!
//! Resolution order for a descriptor `T` with the path set `seen`:
//!
//! 1. known table
//! 2. derived cache
//! 3. `T` already on the path: recursive type, fail
//! 4. derive from the shape of `T`, then insert-if-absent into the cache

#include "codec/codec_factory.hpp"

#include "codec/collection_codecs.hpp"
#include "codec/primitive_codecs.hpp"
#include "codec/structural_codecs.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <string>
#include <type_traits>

namespace msgcodec::codec {

MessageCodecFactory::MessageCodecFactory(CodecMap known,
                                         std::shared_ptr<const types::TypeIntrospector> types)
    : known_(std::move(known)), types_(std::move(types)), cache_(make_box<CodecCache>()),
      counters_(make_box<Counters>()) {}

auto MessageCodecFactory::default_factory(std::shared_ptr<const types::TypeIntrospector> types)
    -> MessageCodecFactory {
    return MessageCodecFactory(standard_codecs(), std::move(types));
}

auto MessageCodecFactory::with_codecs(const CodecMap& codecs) const -> MessageCodecFactory {
    CodecMap merged = known_;
    for (const auto& [type, codec] : codecs) {
        merged.insert_or_assign(type, codec);
    }
    return MessageCodecFactory(std::move(merged), types_);
}

auto MessageCodecFactory::of(const TypeDescriptorPtr& type) const
    -> Result<MessageCodecPtr, CodecError> {
    return of_descriptor(type, {});
}

auto MessageCodecFactory::of_type(std::string_view name) const
    -> Result<MessageCodecPtr, CodecError> {
    // Named lookups share the cache, so a repeated name skips the introspector
    return of_descriptor(types::make_named(std::string(name)), {});
}

auto MessageCodecFactory::stats() const -> FactoryStats {
    auto cache = cache_->get_stats();
    return {counters_->known_hits.load(std::memory_order_relaxed),
            cache.hits,
            cache.misses,
            counters_->derivations.load(std::memory_order_relaxed),
            cache.lost_races,
            cache.total_entries};
}

// ============================================================================
// Resolution
// ============================================================================

auto MessageCodecFactory::of_descriptor(const TypeDescriptorPtr& type, SeenSet seen) const
    -> Result<MessageCodecPtr, CodecError> {
    if (!type) {
        return CodecError::invalid_argument("cannot resolve a codec for a null descriptor");
    }

    if (auto it = known_.find(type); it != known_.end()) {
        counters_->known_hits.fetch_add(1, std::memory_order_relaxed);
        return it->second;
    }

    if (auto cached = cache_->lookup(type)) {
        return cached;
    }

    bool on_path = std::any_of(seen.begin(), seen.end(), [&](const TypeDescriptorPtr& s) {
        return types::descriptors_equal(s, type);
    });
    if (on_path) {
        MSGCODEC_LOG_DEBUG("codec.factory",
                           "recursive type rejected: " << types::descriptor_to_string(type));
        return CodecError::unsupported_structure("Codec for recursive types is not supported: " +
                                                 types::descriptor_to_string(type));
    }

    auto derived = derive(type, seen);
    if (is_err(derived)) {
        return derived;
    }

    counters_->derivations.fetch_add(1, std::memory_order_relaxed);
    auto codec = cache_->insert(type, std::move(unwrap(derived)));
    MSGCODEC_LOG_TRACE("codec.factory",
                       "derived " << codec->name() << " for " << types::descriptor_to_string(type));
    return codec;
}

auto MessageCodecFactory::derive(const TypeDescriptorPtr& type, const SeenSet& seen) const
    -> Result<MessageCodecPtr, CodecError> {
    SeenSet next = seen;
    next.push_back(type);

    return std::visit(
        [&](const auto& shape) -> Result<MessageCodecPtr, CodecError> {
            using S = std::decay_t<decltype(shape)>;

            if constexpr (std::is_same_v<S, types::PrimitiveShape>) {
                auto codec = primitive_codec(shape.kind);
                if (!codec) {
                    return CodecError::unimplemented_shape(
                        "no codec for primitive kind " +
                        std::to_string(static_cast<int>(shape.kind)));
                }
                return codec;
            } else if constexpr (std::is_same_v<S, types::OptionShape>) {
                auto inner = of_descriptor(shape.element, next);
                if (is_err(inner)) {
                    return inner;
                }
                return MessageCodecPtr(std::make_shared<OptionCodec>(type, unwrap(inner)));
            } else if constexpr (std::is_same_v<S, types::TupleShape>) {
                std::vector<MessageCodecPtr> elements;
                elements.reserve(shape.elements.size());
                for (const auto& element : shape.elements) {
                    auto codec = of_descriptor(element, next);
                    if (is_err(codec)) {
                        return codec;
                    }
                    elements.push_back(unwrap(codec));
                }
                return MessageCodecPtr(std::make_shared<TupleCodec>(type, std::move(elements)));
            } else if constexpr (std::is_same_v<S, types::EnumShape>) {
                return MessageCodecPtr(std::make_shared<EnumCodec>(type));
            } else if constexpr (std::is_same_v<S, types::SequenceShape>) {
                auto element = of_descriptor(shape.element, next);
                if (is_err(element)) {
                    return element;
                }
                if (shape.indexed) {
                    return MessageCodecPtr(
                        std::make_shared<IndexedSequenceCodec>(type, unwrap(element)));
                }
                return MessageCodecPtr(std::make_shared<SequenceCodec>(type, unwrap(element)));
            } else if constexpr (std::is_same_v<S, types::ForeignListShape>) {
                auto element = of_descriptor(shape.element, next);
                if (is_err(element)) {
                    return element;
                }
                return MessageCodecPtr(std::make_shared<ForeignListCodec>(type, unwrap(element)));
            } else if constexpr (std::is_same_v<S, types::MapShape> ||
                                 std::is_same_v<S, types::ForeignMapShape>) {
                auto key = of_descriptor(shape.key, seen);
                if (is_err(key)) {
                    return key;
                }
                auto value = of_descriptor(shape.value, next);
                if (is_err(value)) {
                    return value;
                }
                if constexpr (std::is_same_v<S, types::ForeignMapShape>) {
                    return MessageCodecPtr(
                        std::make_shared<ForeignMapCodec>(type, unwrap(key), unwrap(value)));
                } else {
                    return MessageCodecPtr(
                        std::make_shared<MapCodec>(type, unwrap(key), unwrap(value)));
                }
            } else if constexpr (std::is_same_v<S, types::RecordShape>) {
                std::vector<MessageCodecPtr> fields;
                fields.reserve(shape.fields.size());
                for (const auto& field : shape.fields) {
                    auto codec = of_descriptor(field.type, next);
                    if (is_err(codec)) {
                        auto err = unwrap_err(codec);
                        if (err.kind != CodecError::Kind::UnsupportedStructure) {
                            err.message = shape.name + "." + field.name + ": " + err.message;
                        }
                        return err;
                    }
                    fields.push_back(unwrap(codec));
                }
                return MessageCodecPtr(std::make_shared<RecordCodec>(type, std::move(fields)));
            } else if constexpr (std::is_same_v<S, types::NamedShape>) {
                if (!types_) {
                    return CodecError::unknown_type("no type introspector to resolve " +
                                                    shape.name);
                }
                auto resolved = types_->describe(shape.name);
                if (!resolved) {
                    return CodecError::unknown_type("unknown type: " + shape.name);
                }
                MSGCODEC_LOG_TRACE("codec.factory",
                                   "resolved " << shape.name << " as "
                                               << types::descriptor_to_string(resolved));
                return of_descriptor(resolved, next);
            } else {
                static_assert(sizeof(S) == 0, "unhandled descriptor shape");
            }
        },
        type->shape);
}

} // namespace msgcodec::codec
