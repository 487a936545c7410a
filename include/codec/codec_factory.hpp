//! # Codec Factory
//!
//! `MessageCodecFactory` resolves the codec for a type descriptor. Codecs are
//! found in three places, in order:
//!
//! | Source        | Filled by                              | Counted as    |
//! |---------------|----------------------------------------|---------------|
//! | Known table   | constructor, `with_codecs()`           | `known_hits`  |
//! | Derived cache | earlier successful derivations         | `cache_hits`  |
//! | Derivation    | structural dispatch on the descriptor  | `derivations` |
//!
//! `cache_misses` counts cache lookups that found nothing. `lost_races`
//! counts derived codecs discarded because a concurrent derivation of the
//! same type was cached first.
//!
//! ## Derivation
//!
//! A composite descriptor is derived by resolving its nested descriptors
//! first and wrapping their codecs:
//!
//! - `Option[X]` becomes `OptionCodec(of(X))`
//! - `Tuple[A, B]` becomes `TupleCodec(of(A), of(B))`
//! - `Seq[X]` becomes `SequenceCodec`, `IndexedSeq[X]` an `IndexedSequenceCodec`
//! - `Map[K, V]` becomes `MapCodec(of(K), of(V))`
//! - a record becomes `RecordCodec` over its field codecs
//! - a `NamedShape` is looked up through the `TypeIntrospector`
//!
//! Every derivation carries the set of descriptors currently being derived.
//! Meeting one of them again means the type contains itself, which has no
//! finite codec, so resolution fails with `UnsupportedStructure`. Map keys
//! are resolved against the parent set.
//!
//! ## Thread Safety
//!
//! The known table is immutable after construction. The cache keeps the first
//! codec inserted for a descriptor, so concurrent resolutions of one type may
//! both derive a codec but all of them return the same one.

#pragma once

#include "codec/codec_cache.hpp"
#include "codec/message_codec.hpp"
#include "types/type_introspector.hpp"
#include "types/type_of.hpp"

#include <atomic>
#include <memory>
#include <string_view>
#include <vector>

namespace msgcodec::codec {

/// Descriptors under derivation on the current resolution path.
using SeenSet = std::vector<TypeDescriptorPtr>;

/// Resolver statistics.
struct FactoryStats {
    size_t known_hits = 0;
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    size_t derivations = 0;
    size_t lost_races = 0; ///< Derived codecs dropped for one already cached
    size_t cached = 0;     ///< Entries in the derived cache
};

class MessageCodecFactory {
public:
    /// Creates a factory consulting `known` before deriving anything.
    /// `types` resolves named types; without one, named lookups fail.
    explicit MessageCodecFactory(CodecMap known = {},
                                 std::shared_ptr<const types::TypeIntrospector> types = nullptr);

    MessageCodecFactory(MessageCodecFactory&&) = default;
    auto operator=(MessageCodecFactory&&) -> MessageCodecFactory& = default;

    /// Factory seeded with the codecs of all primitive kinds.
    [[nodiscard]] static auto default_factory(
        std::shared_ptr<const types::TypeIntrospector> types = nullptr) -> MessageCodecFactory;

    /// New factory whose known table is this one's overridden by `codecs`.
    /// The new factory starts with an empty cache.
    [[nodiscard]] auto with_codecs(const CodecMap& codecs) const -> MessageCodecFactory;

    /// Resolves the codec for `type`.
    [[nodiscard]] auto of(const TypeDescriptorPtr& type) const
        -> Result<MessageCodecPtr, CodecError>;

    /// Resolves the codec for the C++ type `T`.
    template <typename T> [[nodiscard]] auto of() const -> Result<MessageCodecPtr, CodecError> {
        return of(types::describe<T>());
    }

    /// Resolves the codec for a type known to the introspector by `name`.
    [[nodiscard]] auto of_type(std::string_view name) const
        -> Result<MessageCodecPtr, CodecError>;

    [[nodiscard]] auto known_codecs() const -> const CodecMap& {
        return known_;
    }

    [[nodiscard]] auto introspector() const
        -> const std::shared_ptr<const types::TypeIntrospector>& {
        return types_;
    }

    [[nodiscard]] auto stats() const -> FactoryStats;

private:
    struct Counters {
        std::atomic<size_t> known_hits{0};
        std::atomic<size_t> derivations{0};
    };

    CodecMap known_;
    std::shared_ptr<const types::TypeIntrospector> types_;
    Box<CodecCache> cache_;
    Box<Counters> counters_;

    [[nodiscard]] auto of_descriptor(const TypeDescriptorPtr& type, SeenSet seen) const
        -> Result<MessageCodecPtr, CodecError>;

    /// Builds a new codec for `type`, reached through the descriptors in `seen`.
    [[nodiscard]] auto derive(const TypeDescriptorPtr& type, const SeenSet& seen) const
        -> Result<MessageCodecPtr, CodecError>;
};

} // namespace msgcodec::codec
