//! # Buffer Tests
//!
//! Big-endian scalar access and growth of `ArrayBuffer`.

#include "msgpack/buffer.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace msgcodec::msgpack;

TEST(ArrayBufferTest, StartsEmpty) {
    ArrayBuffer buf;
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_TRUE(buf.bytes().empty());
}

TEST(ArrayBufferTest, InitialCapacityIsReserved) {
    ArrayBuffer buf(64);
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_GE(buf.capacity(), 64u);
}

TEST(ArrayBufferTest, GrowsOnWrite) {
    ArrayBuffer buf;
    EXPECT_EQ(buf.write_byte(0, 0x11), 1u);
    EXPECT_EQ(buf.size(), 1u);
    EXPECT_EQ(buf.write_long(1, 42), 8u);
    EXPECT_EQ(buf.size(), 9u);
}

TEST(ArrayBufferTest, WritePastEndZeroFillsGap) {
    ArrayBuffer buf;
    buf.write_byte(4, 0xff);
    EXPECT_EQ(buf.size(), 5u);
    EXPECT_EQ(buf.to_vector(), (std::vector<uint8_t>{0, 0, 0, 0, 0xff}));
}

TEST(ArrayBufferTest, EnsureCapacityPreservesContents) {
    ArrayBuffer buf;
    buf.write_int(0, 0x01020304);
    buf.ensure_capacity(1024);
    EXPECT_EQ(buf.size(), 1024u);
    EXPECT_EQ(buf.read_int(0), 0x01020304);
}

TEST(ArrayBufferTest, ClearKeepsCapacity) {
    ArrayBuffer buf;
    buf.ensure_capacity(100);
    size_t cap = buf.capacity();
    buf.clear();
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_EQ(buf.capacity(), cap);
}

TEST(BufferTest, ScalarsAreBigEndian) {
    ArrayBuffer buf;
    buf.write_short(0, 0x0102);
    buf.write_int(2, 0x03040506);
    EXPECT_EQ(buf.to_vector(), (std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04, 0x05, 0x06}));
}

TEST(BufferTest, NegativeScalarsRoundTrip) {
    ArrayBuffer buf;
    buf.write_short(0, -2);
    buf.write_int(2, -70000);
    buf.write_long(6, -5000000000);
    EXPECT_EQ(buf.read_short(0), -2);
    EXPECT_EQ(buf.read_int(2), -70000);
    EXPECT_EQ(buf.read_long(6), -5000000000);
    EXPECT_EQ(buf.read_byte(0), 0xff);
    EXPECT_EQ(buf.read_byte(1), 0xfe);
}

TEST(BufferTest, FloatBits) {
    ArrayBuffer buf;
    buf.write_float(0, 1.0f);
    EXPECT_EQ(buf.to_vector(), (std::vector<uint8_t>{0x3f, 0x80, 0x00, 0x00}));
    EXPECT_FLOAT_EQ(buf.read_float(0), 1.0f);

    buf.clear();
    buf.write_double(0, -2.5);
    EXPECT_EQ(buf.read_byte(0), 0xc0);
    EXPECT_DOUBLE_EQ(buf.read_double(0), -2.5);
}

TEST(BufferTest, CodePrefixedWrites) {
    ArrayBuffer buf;
    EXPECT_EQ(buf.write_byte_and_byte(0, 0xcc, 0xff), 2u);
    EXPECT_EQ(buf.write_byte_and_short(2, 0xcd, 0x0100), 3u);
    EXPECT_EQ(buf.write_byte_and_int(5, 0xce, 0x00010000), 5u);
    EXPECT_EQ(buf.write_byte_and_long(10, 0xcf, 1), 9u);
    EXPECT_EQ(buf.write_byte_and_float(19, 0xca, 0.0f), 5u);
    EXPECT_EQ(buf.write_byte_and_double(24, 0xcb, 0.0), 9u);
    EXPECT_EQ(buf.size(), 33u);

    EXPECT_EQ(buf.read_byte(0), 0xcc);
    EXPECT_EQ(buf.read_byte(1), 0xff);
    EXPECT_EQ(buf.read_byte(2), 0xcd);
    EXPECT_EQ(buf.read_short(3), 0x0100);
    EXPECT_EQ(buf.read_byte(5), 0xce);
    EXPECT_EQ(buf.read_int(6), 0x00010000);
    EXPECT_EQ(buf.read_byte(10), 0xcf);
    EXPECT_EQ(buf.read_long(11), 1);
    EXPECT_EQ(buf.read_byte(19), 0xca);
    EXPECT_EQ(buf.read_byte(24), 0xcb);
}

TEST(BufferTest, WriteBytesAndReadBack) {
    ArrayBuffer buf;
    std::vector<uint8_t> src = {1, 2, 3, 4};
    EXPECT_EQ(buf.write_bytes(2, src), 4u);
    auto view = buf.read_bytes(2, 4);
    EXPECT_EQ(std::vector<uint8_t>(view.begin(), view.end()), src);
}

TEST(BufferTest, WriteEmptyBytesDoesNotGrow) {
    ArrayBuffer buf;
    EXPECT_EQ(buf.write_bytes(10, {}), 0u);
    EXPECT_EQ(buf.size(), 0u);
}

TEST(BufferTest, OverwriteInPlace) {
    ArrayBuffer buf;
    buf.write_int(0, 0x11111111);
    buf.write_short(1, 0x2222);
    EXPECT_EQ(buf.size(), 4u);
    EXPECT_EQ(buf.to_vector(), (std::vector<uint8_t>{0x11, 0x22, 0x22, 0x11}));
}
