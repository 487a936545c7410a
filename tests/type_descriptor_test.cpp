//! # Type Descriptor Tests
//!
//! Structural equality, hashing, display, `describe<T>()` and `TypeRegistry`.

#include "types/type_descriptor.hpp"
#include "types/type_introspector.hpp"
#include "types/type_of.hpp"

#include <gtest/gtest.h>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace msgcodec::types;

namespace {

auto person_descriptor() -> TypeDescriptorPtr {
    return make_record("Person", {
                                     {"name", make_string()},
                                     {"age", make_i32()},
                                     {"email", make_option(make_string())},
                                 });
}

} // namespace

// ============================================================================
// Equality and Hashing
// ============================================================================

TEST(TypeDescriptorTest, StructuralEquality) {
    auto a = make_map(make_string(), make_sequence(make_i64(), true));
    auto b = make_map(make_string(), make_sequence(make_i64(), true));
    EXPECT_NE(a.get(), b.get());
    EXPECT_TRUE(descriptors_equal(a, b));
    EXPECT_EQ(hash_descriptor(a), hash_descriptor(b));
}

TEST(TypeDescriptorTest, IndexedFlagDistinguishesSequences) {
    EXPECT_FALSE(descriptors_equal(make_sequence(make_i32(), true), make_sequence(make_i32())));
}

TEST(TypeDescriptorTest, PrimitiveKindsDiffer) {
    EXPECT_FALSE(descriptors_equal(make_i32(), make_i64()));
    EXPECT_TRUE(descriptors_equal(make_primitive(PrimitiveKind::I32), make_i32()));
}

TEST(TypeDescriptorTest, RecordEqualityIncludesFields) {
    EXPECT_TRUE(descriptors_equal(person_descriptor(), person_descriptor()));
    auto other = make_record("Person", {{"name", make_string()}});
    EXPECT_FALSE(descriptors_equal(person_descriptor(), other));
}

TEST(TypeDescriptorTest, NamedIsNotTheRecord) {
    EXPECT_FALSE(descriptors_equal(make_named("Person"), person_descriptor()));
    EXPECT_TRUE(descriptors_equal(make_named("Person"), make_named("Person")));
}

TEST(TypeDescriptorTest, NullHandling) {
    EXPECT_TRUE(descriptors_equal(nullptr, nullptr));
    EXPECT_FALSE(descriptors_equal(make_i32(), nullptr));
    EXPECT_EQ(hash_descriptor(nullptr), 0u);
    EXPECT_EQ(descriptor_to_string(nullptr), "<null>");
}

TEST(TypeDescriptorTest, ForeignContainersCompareByContainer) {
    auto a = make_foreign_list("boost::container::small_vector", make_i32());
    auto b = make_foreign_list("boost::container::small_vector", make_i32());
    auto c = make_foreign_list("absl::InlinedVector", make_i32());
    EXPECT_TRUE(descriptors_equal(a, b));
    EXPECT_FALSE(descriptors_equal(a, c));
    EXPECT_FALSE(descriptors_equal(a, make_sequence(make_i32())));
}

TEST(TypeDescriptorTest, TypeArgs) {
    auto m = make_map(make_string(), make_i32());
    auto args = m->type_args();
    ASSERT_EQ(args.size(), 2u);
    EXPECT_TRUE(descriptors_equal(args[0], make_string()));
    EXPECT_TRUE(person_descriptor()->type_args().size() == 3);
    EXPECT_TRUE(make_i32()->type_args().empty());
}

// ============================================================================
// Display
// ============================================================================

TEST(TypeDescriptorTest, ToString) {
    EXPECT_EQ(descriptor_to_string(make_i32()), "i32");
    EXPECT_EQ(descriptor_to_string(make_option(make_string())), "Option[string]");
    EXPECT_EQ(descriptor_to_string(make_tuple({make_bool(), make_f64()})), "Tuple[bool, f64]");
    EXPECT_EQ(descriptor_to_string(make_sequence(make_i64())), "Seq[i64]");
    EXPECT_EQ(descriptor_to_string(make_sequence(make_i64(), true)), "IndexedSeq[i64]");
    EXPECT_EQ(descriptor_to_string(make_map(make_string(), make_i32())), "Map[string, i32]");
    EXPECT_EQ(descriptor_to_string(make_foreign_map("absl::flat_hash_map", make_string(),
                                                    make_i32())),
              "absl::flat_hash_map[string, i32]");
    EXPECT_EQ(descriptor_to_string(person_descriptor()), "Person");
    EXPECT_EQ(descriptor_to_string(make_named("Person")), "&Person");
    EXPECT_EQ(descriptor_to_string(make_enum("Color", {"red"})), "Color");
}

TEST(TypeDescriptorTest, UnknownPrimitiveKindName) {
    EXPECT_EQ(primitive_kind_to_string(static_cast<PrimitiveKind>(99)), "primitive(99)");
}

// ============================================================================
// describe<T>()
// ============================================================================

TEST(TypeOfTest, Primitives) {
    EXPECT_TRUE(descriptors_equal(describe<int32_t>(), make_i32()));
    EXPECT_TRUE(descriptors_equal(describe<bool>(), make_bool()));
    EXPECT_TRUE(descriptors_equal(describe<std::string>(), make_string()));
    EXPECT_TRUE(
        descriptors_equal(describe<std::vector<uint8_t>>(), make_primitive(PrimitiveKind::Binary)));
}

TEST(TypeOfTest, Composites) {
    EXPECT_TRUE(descriptors_equal(describe<std::optional<int64_t>>(), make_option(make_i64())));
    EXPECT_TRUE(
        descriptors_equal(describe<std::vector<double>>(), make_sequence(make_f64(), true)));
    EXPECT_TRUE(descriptors_equal(describe<std::list<double>>(), make_sequence(make_f64())));
    EXPECT_TRUE(descriptors_equal(describe<std::map<std::string, int32_t>>(),
                                  make_map(make_string(), make_i32())));
    EXPECT_TRUE(descriptors_equal(describe<std::pair<int32_t, std::string>>(),
                                  make_tuple({make_i32(), make_string()})));
}

// ============================================================================
// TypeRegistry
// ============================================================================

TEST(TypeRegistryTest, RegisterByOwnName) {
    TypeRegistry registry;
    EXPECT_TRUE(registry.register_type(person_descriptor()));
    EXPECT_TRUE(registry.register_type(make_enum("Color", {"red", "green"})));
    EXPECT_FALSE(registry.register_type(make_i32()));
    EXPECT_FALSE(registry.register_type(nullptr));

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains("Person"));
    EXPECT_TRUE(descriptors_equal(registry.describe("Person"), person_descriptor()));
    EXPECT_EQ(registry.describe("Missing"), nullptr);
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"Color", "Person"}));
}

TEST(TypeRegistryTest, RegisterAlias) {
    TypeRegistry registry;
    registry.register_type("Ids", make_sequence(make_i64()));
    registry.register_type("Ids", make_sequence(make_i32()));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(descriptors_equal(registry.describe("Ids"), make_sequence(make_i32())));
}

TEST(TypeRegistryTest, ConcurrentRegistration) {
    TypeRegistry registry;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = 0; i < 50; ++i) {
                registry.register_type("T" + std::to_string(t * 50 + i), make_i32());
                (void)registry.describe("T0");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(registry.size(), 200u);
}
