//! # Codec Factory Tests
//!
//! Resolution order, memoization, recursive-type rejection and overrides.
//!
//! ## Test Coverage
//!
//! - Known codecs are returned as-is and take precedence over derivation
//! - Every descriptor shape derives the matching codec
//! - A second resolution is a cache hit with no introspector call
//! - Recursive types fail with `UnsupportedStructure`
//! - Unknown names and unimplemented shapes report their own error kinds
//! - Concurrent resolution returns a single codec
//! - The cache keeps the first codec inserted for a descriptor

#include "codec/codec_factory.hpp"
#include "codec/collection_codecs.hpp"
#include "codec/primitive_codecs.hpp"
#include "codec/structural_codecs.hpp"
#include "msgpack/buffer_packer.hpp"
#include "msgpack/code.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace msgcodec;
using namespace msgcodec::codec;
using namespace msgcodec::types;
using msgcodec::msgpack::Array;
using msgcodec::msgpack::Map;

namespace {

/// Packs every i32 as a full int 32, ignoring minimality.
class FixedWidthI32Codec : public MessageCodec {
public:
    FixedWidthI32Codec() : MessageCodec(make_i32()) {}

    auto name() const -> std::string override {
        return "FixedWidthI32Codec";
    }

    auto pack(Buffer& buf, size_t index, const Value& value) const
        -> Result<size_t, CodecError> override {
        auto v = value.try_as_i64();
        if (!v) {
            return CodecError::invalid_value("expected integer");
        }
        return buf.write_byte_and_int(index, msgpack::code::INT32, static_cast<int32_t>(*v));
    }

    auto unpack(MessageUnpacker& unpacker) const -> Result<Value, CodecError> override {
        return from_wire(unpacker.unpack_integer());
    }
};

/// Registry wrapper counting lookups.
class CountingIntrospector : public TypeIntrospector {
public:
    auto describe(std::string_view name) const -> TypeDescriptorPtr override {
        calls_.fetch_add(1);
        return registry_.describe(name);
    }

    auto registry() -> TypeRegistry& {
        return registry_;
    }

    auto calls() const -> int {
        return calls_.load();
    }

private:
    TypeRegistry registry_;
    mutable std::atomic<int> calls_{0};
};

auto point_descriptor() -> TypeDescriptorPtr {
    return make_record("Point", {{"x", make_i32()}, {"y", make_i32()}});
}

auto node_descriptor() -> TypeDescriptorPtr {
    return make_record("Node", {{"value", make_i32()}, {"next", make_option(make_named("Node"))}});
}

template <typename C> auto as_codec(const MessageCodecPtr& codec) -> const C* {
    return dynamic_cast<const C*>(codec.get());
}

} // namespace

// ============================================================================
// Known Codecs
// ============================================================================

TEST(CodecFactoryTest, DefaultFactoryKnowsPrimitives) {
    auto factory = MessageCodecFactory::default_factory();
    EXPECT_EQ(factory.known_codecs().size(), standard_codecs().size());

    auto codec = factory.of(make_i32());
    ASSERT_TRUE(is_ok(codec));
    EXPECT_EQ(unwrap(codec), primitive_codec(PrimitiveKind::I32));
    EXPECT_EQ(factory.stats().known_hits, 1u);
    EXPECT_EQ(factory.stats().derivations, 0u);
}

TEST(CodecFactoryTest, PrimitivesDeriveWithoutKnownTable) {
    MessageCodecFactory factory;
    auto codec = factory.of(make_string());
    ASSERT_TRUE(is_ok(codec));
    EXPECT_EQ(unwrap(codec)->name(), "PrimitiveCodec(string)");
    EXPECT_EQ(factory.stats().derivations, 1u);
}

TEST(CodecFactoryTest, NullDescriptor) {
    auto factory = MessageCodecFactory::default_factory();
    auto codec = factory.of(nullptr);
    ASSERT_TRUE(is_err(codec));
    EXPECT_EQ(unwrap_err(codec).kind, CodecError::Kind::InvalidArgument);
}

// ============================================================================
// Derivation
// ============================================================================

TEST(CodecFactoryTest, DerivesEveryShape) {
    auto factory = MessageCodecFactory::default_factory();

    struct Case {
        TypeDescriptorPtr type;
        std::string name;
    };
    std::vector<Case> cases = {
        {make_option(make_i32()), "OptionCodec"},
        {make_tuple({make_i32(), make_string()}), "TupleCodec"},
        {make_enum("Color", {"red", "green"}), "EnumCodec"},
        {make_sequence(make_i32()), "SequenceCodec"},
        {make_sequence(make_i32(), true), "IndexedSequenceCodec"},
        {make_foreign_list("absl::InlinedVector", make_i32()),
         "ForeignListCodec(absl::InlinedVector)"},
        {make_map(make_string(), make_i32()), "MapCodec"},
        {make_foreign_map("absl::flat_hash_map", make_string(), make_i32()),
         "ForeignMapCodec(absl::flat_hash_map)"},
        {point_descriptor(), "RecordCodec"},
    };
    for (const auto& c : cases) {
        auto codec = factory.of(c.type);
        ASSERT_TRUE(is_ok(codec)) << descriptor_to_string(c.type);
        EXPECT_EQ(unwrap(codec)->name(), c.name);
        EXPECT_TRUE(descriptors_equal(unwrap(codec)->descriptor(), c.type));
    }
}

TEST(CodecFactoryTest, NestedCodecsAreResolved) {
    auto factory = MessageCodecFactory::default_factory();
    auto codec = factory.of(make_map(make_string(), make_sequence(make_option(make_i64()))));
    ASSERT_TRUE(is_ok(codec));

    const auto* map = as_codec<MapCodec>(unwrap(codec));
    ASSERT_NE(map, nullptr);
    EXPECT_EQ(map->key(), primitive_codec(PrimitiveKind::String));
    const auto* seq = as_codec<SequenceCodec>(map->value());
    ASSERT_NE(seq, nullptr);
    const auto* opt = as_codec<OptionCodec>(seq->element());
    ASSERT_NE(opt, nullptr);
    EXPECT_EQ(opt->inner(), primitive_codec(PrimitiveKind::I64));
}

TEST(CodecFactoryTest, TypedEntryPoint) {
    auto factory = MessageCodecFactory::default_factory();
    auto codec = factory.of<std::vector<std::optional<int32_t>>>();
    ASSERT_TRUE(is_ok(codec));
    EXPECT_EQ(unwrap(codec)->name(), "IndexedSequenceCodec");

    auto map = factory.of<std::map<std::string, double>>();
    ASSERT_TRUE(is_ok(map));
    EXPECT_EQ(unwrap(map)->name(), "MapCodec");
}

TEST(CodecFactoryTest, DerivedRecordRoundTrip) {
    auto factory = MessageCodecFactory::default_factory();
    auto codec = factory.of(point_descriptor());
    ASSERT_TRUE(is_ok(codec));

    Value point(Map{});
    point.set("x", Value(1));
    point.set("y", Value(-2));
    auto bytes = unwrap(codec)->encode(point);
    ASSERT_TRUE(is_ok(bytes));
    EXPECT_EQ(unwrap(bytes), (std::vector<uint8_t>{0x92, 0x01, 0xfe}));

    auto decoded = unwrap(codec)->decode(unwrap(bytes));
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded), point);
}

// ============================================================================
// Memoization
// ============================================================================

TEST(CodecFactoryTest, SecondResolutionIsCacheHit) {
    auto factory = MessageCodecFactory::default_factory();
    auto type = make_option(make_i32());

    auto first = factory.of(type);
    ASSERT_TRUE(is_ok(first));
    auto after_first = factory.stats();
    EXPECT_EQ(after_first.derivations, 1u);
    EXPECT_EQ(after_first.cached, 1u);
    // Only the option is looked up; i32 comes from the known table
    EXPECT_EQ(after_first.cache_misses, 1u);
    EXPECT_EQ(after_first.known_hits, 1u);

    // A structurally equal descriptor hits the same entry
    auto second = factory.of(make_option(make_i32()));
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(first), unwrap(second));

    auto after_second = factory.stats();
    EXPECT_EQ(after_second.derivations, 1u);
    EXPECT_EQ(after_second.cache_hits, after_first.cache_hits + 1);
    EXPECT_EQ(after_second.cache_misses, 1u);
    EXPECT_EQ(after_second.lost_races, 0u);
}

TEST(CodecFactoryTest, NamedResolutionCallsIntrospectorOnce) {
    auto types = std::make_shared<CountingIntrospector>();
    types->registry().register_type(point_descriptor());
    auto factory = MessageCodecFactory::default_factory(types);

    EXPECT_EQ(factory.introspector(), types);

    auto first = factory.of_type("Point");
    ASSERT_TRUE(is_ok(first));
    EXPECT_EQ(types->calls(), 1);
    size_t derivations = factory.stats().derivations;

    auto second = factory.of_type("Point");
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(first), unwrap(second));
    EXPECT_EQ(types->calls(), 1);
    EXPECT_EQ(factory.stats().derivations, derivations);
}

TEST(CodecFactoryTest, SharedSubtreesDeriveOnce) {
    auto factory = MessageCodecFactory::default_factory();
    auto inner = make_sequence(make_i32());
    ASSERT_TRUE(is_ok(factory.of(make_tuple({inner, inner, inner}))));
    // The tuple and one sequence codec
    EXPECT_EQ(factory.stats().derivations, 2u);
}

TEST(CodecFactoryTest, FailuresAreNotCached) {
    auto types = std::make_shared<TypeRegistry>();
    auto factory = MessageCodecFactory::default_factory(types);

    auto missing = factory.of_type("Point");
    ASSERT_TRUE(is_err(missing));
    EXPECT_EQ(unwrap_err(missing).kind, CodecError::Kind::UnknownType);

    types->register_type(point_descriptor());
    EXPECT_TRUE(is_ok(factory.of_type("Point")));
}

TEST(CodecFactoryTest, ConcurrentResolutionAgrees) {
    auto factory = MessageCodecFactory::default_factory();
    auto type = make_map(make_string(), make_sequence(make_f64(), true));

    constexpr int THREADS = 8;
    std::vector<MessageCodecPtr> results(THREADS);
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            auto codec = factory.of(make_map(make_string(), make_sequence(make_f64(), true)));
            if (is_ok(codec)) {
                results[t] = unwrap(codec);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& codec : results) {
        ASSERT_NE(codec, nullptr);
        EXPECT_EQ(codec, results[0]);
    }
    auto cached = factory.of(type);
    ASSERT_TRUE(is_ok(cached));
    EXPECT_EQ(unwrap(cached), results[0]);

    // Every derivation either filled an entry or was dropped for one
    auto stats = factory.stats();
    EXPECT_EQ(stats.cached, 2u);
    EXPECT_EQ(stats.derivations, stats.cached + stats.lost_races);
}

TEST(CodecCacheTest, FirstInsertWins) {
    CodecCache cache;
    auto type = make_option(make_i32());
    auto first = std::make_shared<OptionCodec>(type, primitive_codec(PrimitiveKind::I32));
    auto second = std::make_shared<OptionCodec>(type, primitive_codec(PrimitiveKind::I32));

    EXPECT_EQ(cache.lookup(type), nullptr);
    EXPECT_EQ(cache.insert(type, first), first);
    EXPECT_EQ(cache.insert(make_option(make_i32()), second), first);
    EXPECT_EQ(cache.lookup(type), first);

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.total_entries, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.lost_races, 1u);
}

// ============================================================================
// Recursive Types
// ============================================================================

TEST(CodecFactoryTest, RecursiveRecordRejected) {
    auto types = std::make_shared<TypeRegistry>();
    types->register_type(node_descriptor());
    auto factory = MessageCodecFactory::default_factory(types);

    auto by_name = factory.of_type("Node");
    ASSERT_TRUE(is_err(by_name));
    EXPECT_EQ(unwrap_err(by_name).kind, CodecError::Kind::UnsupportedStructure);
    EXPECT_EQ(unwrap_err(by_name).message.rfind("Codec for recursive types is not supported: ", 0),
              0u);

    auto by_descriptor = factory.of(node_descriptor());
    ASSERT_TRUE(is_err(by_descriptor));
    EXPECT_EQ(unwrap_err(by_descriptor).kind, CodecError::Kind::UnsupportedStructure);
    EXPECT_EQ(unwrap_err(by_descriptor).message,
              "Codec for recursive types is not supported: Node");
}

TEST(CodecFactoryTest, RecursionThroughMapValueRejected) {
    auto types = std::make_shared<TypeRegistry>();
    types->register_type(
        make_record("Tree", {{"children", make_map(make_string(), make_named("Tree"))}}));
    auto factory = MessageCodecFactory::default_factory(types);

    auto codec = factory.of_type("Tree");
    ASSERT_TRUE(is_err(codec));
    EXPECT_EQ(unwrap_err(codec).kind, CodecError::Kind::UnsupportedStructure);
}

TEST(CodecFactoryTest, RecursionThroughSequenceRejected) {
    auto types = std::make_shared<TypeRegistry>();
    types->register_type(
        make_record("Folder", {{"name", make_string()},
                               {"folders", make_sequence(make_named("Folder"), true)}}));
    auto factory = MessageCodecFactory::default_factory(types);

    auto codec = factory.of_type("Folder");
    ASSERT_TRUE(is_err(codec));
    EXPECT_EQ(unwrap_err(codec).kind, CodecError::Kind::UnsupportedStructure);
}

TEST(CodecFactoryTest, RepeatedNonRecursiveTypeAccepted) {
    auto types = std::make_shared<TypeRegistry>();
    types->register_type(point_descriptor());
    types->register_type(make_record("Line", {{"from", make_named("Point")},
                                              {"to", make_named("Point")}}));
    auto factory = MessageCodecFactory::default_factory(types);

    auto codec = factory.of_type("Line");
    ASSERT_TRUE(is_ok(codec)) << unwrap_err(codec).to_string();
    EXPECT_EQ(unwrap(codec)->name(), "RecordCodec");
}

// ============================================================================
// Overrides
// ============================================================================

TEST(CodecFactoryTest, KnownCodecOverridesDerivation) {
    auto custom = std::make_shared<FixedWidthI32Codec>();
    CodecMap known;
    known.emplace(make_i32(), custom);
    MessageCodecFactory factory(known);

    auto codec = factory.of(make_i32());
    ASSERT_TRUE(is_ok(codec));
    EXPECT_EQ(unwrap(codec), custom);

    // Nested occurrences use the override too
    auto seq = factory.of(make_sequence(make_i32()));
    ASSERT_TRUE(is_ok(seq));
    Array items;
    items.emplace_back(1);
    auto bytes = unwrap(seq)->encode(Value(std::move(items)));
    ASSERT_TRUE(is_ok(bytes));
    EXPECT_EQ(unwrap(bytes), (std::vector<uint8_t>{0x91, 0xd2, 0x00, 0x00, 0x00, 0x01}));
}

TEST(CodecFactoryTest, KnownCodecForCompositeType) {
    auto point = point_descriptor();
    auto any = primitive_codec(PrimitiveKind::Any);
    CodecMap known;
    known.emplace(point, any);
    MessageCodecFactory factory(known);

    auto codec = factory.of(point_descriptor());
    ASSERT_TRUE(is_ok(codec));
    EXPECT_EQ(unwrap(codec), any);
    EXPECT_EQ(factory.stats().derivations, 0u);
}

TEST(CodecFactoryTest, WithCodecsIsRightBiased) {
    auto base = MessageCodecFactory::default_factory();
    auto custom = std::make_shared<FixedWidthI32Codec>();
    CodecMap overrides;
    overrides.emplace(make_i32(), custom);

    auto derived = base.with_codecs(overrides);
    EXPECT_EQ(derived.known_codecs().size(), base.known_codecs().size());

    auto from_derived = derived.of(make_i32());
    ASSERT_TRUE(is_ok(from_derived));
    EXPECT_EQ(unwrap(from_derived), custom);

    auto from_base = base.of(make_i32());
    ASSERT_TRUE(is_ok(from_base));
    EXPECT_EQ(unwrap(from_base), primitive_codec(PrimitiveKind::I32));
}

TEST(CodecFactoryTest, WithCodecsStartsWithEmptyCache) {
    auto base = MessageCodecFactory::default_factory();
    ASSERT_TRUE(is_ok(base.of(make_option(make_i32()))));
    EXPECT_EQ(base.stats().cached, 1u);

    auto derived = base.with_codecs({});
    EXPECT_EQ(derived.stats().cached, 0u);
}

TEST(CodecFactoryTest, WithCodecsKeepsIntrospector) {
    auto types = std::make_shared<TypeRegistry>();
    types->register_type(point_descriptor());
    auto base = MessageCodecFactory::default_factory(types);

    auto derived = base.with_codecs({});
    EXPECT_EQ(derived.introspector(), base.introspector());
    EXPECT_TRUE(is_ok(derived.of_type("Point")));
}

// ============================================================================
// Errors
// ============================================================================

TEST(CodecFactoryTest, UnknownTypeWithoutIntrospector) {
    auto factory = MessageCodecFactory::default_factory();
    auto codec = factory.of_type("Point");
    ASSERT_TRUE(is_err(codec));
    EXPECT_EQ(unwrap_err(codec).kind, CodecError::Kind::UnknownType);
}

TEST(CodecFactoryTest, UnknownNestedName) {
    auto types = std::make_shared<TypeRegistry>();
    auto factory = MessageCodecFactory::default_factory(types);
    auto codec = factory.of(make_option(make_named("Ghost")));
    ASSERT_TRUE(is_err(codec));
    EXPECT_EQ(unwrap_err(codec).kind, CodecError::Kind::UnknownType);
    EXPECT_EQ(unwrap_err(codec).message, "unknown type: Ghost");
}

TEST(CodecFactoryTest, UnimplementedPrimitiveKind) {
    auto factory = MessageCodecFactory::default_factory();
    auto codec = factory.of(make_primitive(static_cast<PrimitiveKind>(99)));
    ASSERT_TRUE(is_err(codec));
    EXPECT_EQ(unwrap_err(codec).kind, CodecError::Kind::UnimplementedShape);
    EXPECT_EQ(factory.stats().cached, 0u);
}

TEST(CodecFactoryTest, ErrorInRecordFieldNamesField) {
    auto factory = MessageCodecFactory::default_factory();
    auto broken = make_primitive(static_cast<PrimitiveKind>(99));
    auto codec = factory.of(make_record("Bad", {{"ok", make_i32()}, {"broken", broken}}));
    ASSERT_TRUE(is_err(codec));
    EXPECT_EQ(unwrap_err(codec).kind, CodecError::Kind::UnimplementedShape);
    EXPECT_EQ(unwrap_err(codec).message.rfind("Bad.broken: ", 0), 0u);
}
