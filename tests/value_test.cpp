//! # Value Tests
//!
//! Construction, comparison, deep copy, rendering and packing of `Value`.

#include "msgpack/message_unpacker.hpp"
#include "msgpack/value.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace msgcodec;
using namespace msgcodec::msgpack;

// ============================================================================
// Construction and Queries
// ============================================================================

TEST(ValueTest, DefaultIsNil) {
    Value v;
    EXPECT_TRUE(v.is_nil());
    EXPECT_STREQ(v.type_name(), "nil");
    EXPECT_EQ(v.to_string(), "nil");
}

TEST(ValueTest, Scalars) {
    EXPECT_TRUE(Value(true).is_bool());
    EXPECT_TRUE(Value(true).as_bool());
    EXPECT_TRUE(Value(42).is_integer());
    EXPECT_EQ(Value(42).as_i64(), 42);
    EXPECT_TRUE(Value(1.5f).is_float());
    EXPECT_TRUE(Value(2.5).is_float());
    EXPECT_TRUE(Value("hi").is_string());
    EXPECT_EQ(Value("hi").as_string(), "hi");
    EXPECT_TRUE(Value(Binary{{1}}).is_binary());
    EXPECT_TRUE(Value(Extension{1, {}}).is_extension());
    EXPECT_TRUE(Value(nullptr).is_nil());
}

TEST(ValueTest, SmallUnsignedStoredSigned) {
    Value v(uint64_t{7});
    EXPECT_TRUE(std::holds_alternative<int64_t>(v.data));
    EXPECT_EQ(v.as_i64(), 7);

    Value big(std::numeric_limits<uint64_t>::max());
    EXPECT_TRUE(std::holds_alternative<uint64_t>(big.data));
    EXPECT_FALSE(big.try_as_i64().has_value());
    EXPECT_EQ(big.try_as_u64(), std::numeric_limits<uint64_t>::max());
}

TEST(ValueTest, TryAsConversions) {
    EXPECT_EQ(Value(-3).try_as_i64(), -3);
    EXPECT_FALSE(Value(-3).try_as_u64().has_value());
    EXPECT_EQ(Value(1.5f).try_as_f64(), 1.5);
    EXPECT_FALSE(Value("x").try_as_f64().has_value());
}

// ============================================================================
// Containers
// ============================================================================

TEST(ValueTest, ArrayPushAndSize) {
    Value arr(Array{});
    arr.push(Value(1));
    arr.push(Value("two"));
    EXPECT_TRUE(arr.is_array());
    EXPECT_EQ(arr.size(), 2u);
    EXPECT_EQ(arr.as_array()[1].as_string(), "two");
}

TEST(ValueTest, MapGetAndSet) {
    Value m(Map{});
    m.set("a", Value(1));
    m.set("b", Value(2));
    m.set("a", Value(3));
    EXPECT_EQ(m.size(), 2u);
    ASSERT_NE(m.get("a"), nullptr);
    EXPECT_EQ(m.get("a")->as_i64(), 3);
    EXPECT_EQ(m.get("missing"), nullptr);
    EXPECT_EQ(Value(5).get("a"), nullptr);
}

TEST(ValueTest, ScalarSizeIsZero) {
    EXPECT_EQ(Value("abc").size(), 0u);
}

// ============================================================================
// Comparison and Copy
// ============================================================================

TEST(ValueTest, IntegersCompareNumerically) {
    EXPECT_EQ(Value(int64_t{5}), Value(uint64_t{5}));
    EXPECT_NE(Value(5), Value(6));
    EXPECT_NE(Value(5), Value(5.0));
    EXPECT_NE(Value(1.0f), Value(1.0));
}

TEST(ValueTest, ContainersCompareStructurally) {
    Array a;
    a.emplace_back(1);
    a.emplace_back("x");
    Array b;
    b.emplace_back(1);
    b.emplace_back("x");
    EXPECT_EQ(Value(std::move(a)), Value(std::move(b)));

    Map m1;
    m1.emplace_back(Value("k"), Value(1));
    Map m2;
    m2.emplace_back(Value("k"), Value(2));
    EXPECT_NE(Value(std::move(m1)), Value(std::move(m2)));
}

TEST(ValueTest, CloneIsDeep) {
    Value original(Map{});
    original.set("list", Value(Array{}));
    Value copy = original.clone();
    EXPECT_EQ(copy, original);

    copy.as_map_mut()[0].second.push(Value(1));
    EXPECT_EQ(original.get("list")->size(), 0u);
    EXPECT_EQ(copy.get("list")->size(), 1u);
}

// ============================================================================
// Rendering
// ============================================================================

TEST(ValueTest, ToString) {
    Value m(Map{});
    m.set("id", Value(1));
    Array tags;
    tags.emplace_back("a");
    tags.emplace_back("b");
    m.set("tags", Value(std::move(tags)));
    m.set("raw", Value(Binary{{0x0a, 0x0b}}));
    EXPECT_EQ(m.to_string(), R"({"id": 1, "tags": ["a", "b"], "raw": bin(0a0b)})");

    EXPECT_EQ(Value(Extension{5, {0x0a}}).to_string(), "ext(5, 0a)");
    EXPECT_EQ(Value(false).to_string(), "false");
    EXPECT_EQ(Value("a\"b\n").to_string(), R"("a\"b\n")");
}

// ============================================================================
// Packing
// ============================================================================

TEST(ValueTest, PackUsesMinimalCodes) {
    Array items;
    items.emplace_back(1);
    items.emplace_back(true);
    items.emplace_back();
    ArrayBuffer buf;
    auto n = pack_value(buf, 0, Value(std::move(items)));
    ASSERT_TRUE(is_ok(n));
    EXPECT_EQ(buf.to_vector(), (std::vector<uint8_t>{0x93, 0x01, 0xc3, 0xc0}));
}

TEST(ValueTest, PackFloatKeepsWidth) {
    ArrayBuffer buf;
    auto n = pack_value(buf, 0, Value(1.0f));
    ASSERT_TRUE(is_ok(n));
    EXPECT_EQ(unwrap(n), 5u);

    MessageUnpacker unpacker(buf.bytes());
    auto decoded = unpacker.unpack_value();
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded), Value(1.0f));
}
