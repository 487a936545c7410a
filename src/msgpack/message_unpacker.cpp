//! # Unpacker Implementation
//!
//! Each `unpack_*` method validates the format code and the available bytes
//! before moving the cursor, so a failed call consumes nothing.

#include "msgpack/message_unpacker.hpp"

#include "msgpack/code.hpp"

#include <algorithm>
#include <bit>
#include <cstdio>
#include <limits>

namespace msgcodec::msgpack {

namespace {

auto format_hex(uint8_t b) -> std::string {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", b);
    return buf;
}

} // namespace

auto value_type_name(ValueType type) -> const char* {
    switch (type) {
    case ValueType::Nil:
        return "nil";
    case ValueType::Boolean:
        return "boolean";
    case ValueType::Integer:
        return "integer";
    case ValueType::Float:
        return "float";
    case ValueType::String:
        return "string";
    case ValueType::Binary:
        return "binary";
    case ValueType::Array:
        return "array";
    case ValueType::Map:
        return "map";
    case ValueType::Extension:
        return "extension";
    }
    return "unknown";
}

auto value_type_of(uint8_t format) -> std::optional<ValueType> {
    if (code::is_pos_fixint(format) || code::is_neg_fixint(format)) {
        return ValueType::Integer;
    }
    if (code::is_fixed_map(format)) {
        return ValueType::Map;
    }
    if (code::is_fixed_array(format)) {
        return ValueType::Array;
    }
    if (code::is_fixstr(format)) {
        return ValueType::String;
    }
    switch (format) {
    case code::NIL:
        return ValueType::Nil;
    case code::BOOLEAN_FALSE:
    case code::BOOLEAN_TRUE:
        return ValueType::Boolean;
    case code::BIN8:
    case code::BIN16:
    case code::BIN32:
        return ValueType::Binary;
    case code::EXT8:
    case code::EXT16:
    case code::EXT32:
    case code::FIXEXT1:
    case code::FIXEXT2:
    case code::FIXEXT4:
    case code::FIXEXT8:
    case code::FIXEXT16:
        return ValueType::Extension;
    case code::FLOAT32:
    case code::FLOAT64:
        return ValueType::Float;
    case code::UINT8:
    case code::UINT16:
    case code::UINT32:
    case code::UINT64:
    case code::INT8:
    case code::INT16:
    case code::INT32:
    case code::INT64:
        return ValueType::Integer;
    case code::STR8:
    case code::STR16:
    case code::STR32:
        return ValueType::String;
    case code::ARRAY16:
    case code::ARRAY32:
        return ValueType::Array;
    case code::MAP16:
    case code::MAP32:
        return ValueType::Map;
    default:
        return std::nullopt;
    }
}

MessageUnpacker::MessageUnpacker(std::span<const uint8_t> data, UnpackOptions options)
    : data_(data), options_(options) {}

// ============================================================================
// Helpers
// ============================================================================

auto MessageUnpacker::require(size_t start, size_t len) const -> std::optional<MessageError> {
    if (start > data_.size() || data_.size() - start < len) {
        return MessageError::insufficient_data("expected " + std::to_string(len) +
                                                   " more byte(s), " +
                                                   std::to_string(data_.size() -
                                                                  std::min(start, data_.size())) +
                                                   " available",
                                               start);
    }
    return std::nullopt;
}

auto MessageUnpacker::read_be(size_t at, size_t width) const -> uint64_t {
    uint64_t v = 0;
    for (size_t i = 0; i < width; ++i) {
        v = (v << 8) | data_[at + i];
    }
    return v;
}

auto MessageUnpacker::mismatch(const char* expected, uint8_t format) const -> MessageError {
    auto type = value_type_of(format);
    std::string found = type ? value_type_name(*type) : "reserved code";
    return MessageError::type_mismatch(std::string("expected ") + expected + ", found " + found +
                                           " (" + format_hex(format) + ")",
                                       pos_);
}

auto MessageUnpacker::next_format() const -> Result<uint8_t, MessageError> {
    if (auto err = require(pos_, 1)) {
        return *err;
    }
    return data_[pos_];
}

auto MessageUnpacker::next_value_type() const -> Result<ValueType, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    auto type = value_type_of(unwrap(format));
    if (!type) {
        return MessageError::type_mismatch("reserved format code " + format_hex(unwrap(format)),
                                           pos_);
    }
    return *type;
}

auto MessageUnpacker::try_unpack_nil() -> bool {
    if (pos_ < data_.size() && data_[pos_] == code::NIL) {
        ++pos_;
        return true;
    }
    return false;
}

// ============================================================================
// Scalars
// ============================================================================

auto MessageUnpacker::unpack_nil() -> Result<bool, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    if (unwrap(format) != code::NIL) {
        return mismatch("nil", unwrap(format));
    }
    ++pos_;
    return true;
}

auto MessageUnpacker::unpack_boolean() -> Result<bool, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    uint8_t b = unwrap(format);
    if (b != code::BOOLEAN_TRUE && b != code::BOOLEAN_FALSE) {
        return mismatch("boolean", b);
    }
    ++pos_;
    return b == code::BOOLEAN_TRUE;
}

auto MessageUnpacker::unpack_integer() -> Result<Value, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    uint8_t b = unwrap(format);
    if (code::is_pos_fixint(b)) {
        ++pos_;
        return Value(static_cast<int64_t>(b));
    }
    if (code::is_neg_fixint(b)) {
        ++pos_;
        return Value(static_cast<int64_t>(static_cast<int8_t>(b)));
    }

    size_t width = 0;
    bool is_signed = false;
    switch (b) {
    case code::UINT8:
        width = 1;
        break;
    case code::UINT16:
        width = 2;
        break;
    case code::UINT32:
        width = 4;
        break;
    case code::UINT64:
        width = 8;
        break;
    case code::INT8:
        width = 1;
        is_signed = true;
        break;
    case code::INT16:
        width = 2;
        is_signed = true;
        break;
    case code::INT32:
        width = 4;
        is_signed = true;
        break;
    case code::INT64:
        width = 8;
        is_signed = true;
        break;
    default:
        return mismatch("integer", b);
    }
    if (auto err = require(pos_ + 1, width)) {
        return *err;
    }
    uint64_t raw = read_be(pos_ + 1, width);
    pos_ += 1 + width;
    if (!is_signed) {
        return Value(raw);
    }
    // Sign-extend from the payload width
    int shift = static_cast<int>(64 - 8 * width);
    return Value(static_cast<int64_t>(raw << shift) >> shift);
}

auto MessageUnpacker::unpack_i64() -> Result<int64_t, MessageError> {
    size_t start = pos_;
    auto value = unpack_integer();
    if (is_err(value)) {
        return unwrap_err(value);
    }
    if (auto i = unwrap(value).try_as_i64()) {
        return *i;
    }
    pos_ = start;
    return MessageError::type_mismatch("integer " + unwrap(value).to_string() +
                                           " exceeds the int64 range",
                                       start);
}

auto MessageUnpacker::unpack_u64() -> Result<uint64_t, MessageError> {
    size_t start = pos_;
    auto value = unpack_integer();
    if (is_err(value)) {
        return unwrap_err(value);
    }
    if (auto u = unwrap(value).try_as_u64()) {
        return *u;
    }
    pos_ = start;
    return MessageError::type_mismatch("negative integer " + unwrap(value).to_string() +
                                           " where an unsigned value was expected",
                                       start);
}

auto MessageUnpacker::unpack_f64() -> Result<double, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    uint8_t b = unwrap(format);
    if (b == code::FLOAT32) {
        if (auto err = require(pos_ + 1, 4)) {
            return *err;
        }
        auto f = std::bit_cast<float>(static_cast<uint32_t>(read_be(pos_ + 1, 4)));
        pos_ += 5;
        return static_cast<double>(f);
    }
    if (b == code::FLOAT64) {
        if (auto err = require(pos_ + 1, 8)) {
            return *err;
        }
        auto d = std::bit_cast<double>(read_be(pos_ + 1, 8));
        pos_ += 9;
        return d;
    }
    return mismatch("float", b);
}

// ============================================================================
// Headers and payloads
// ============================================================================

auto MessageUnpacker::unpack_raw_string_header() -> Result<uint32_t, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    uint8_t b = unwrap(format);
    if (code::is_fixstr(b)) {
        ++pos_;
        return static_cast<uint32_t>(b & 0x1f);
    }
    size_t width = b == code::STR8 ? 1 : b == code::STR16 ? 2 : b == code::STR32 ? 4 : 0;
    if (width == 0) {
        return mismatch("string", b);
    }
    if (auto err = require(pos_ + 1, width)) {
        return *err;
    }
    auto len = static_cast<uint32_t>(read_be(pos_ + 1, width));
    pos_ += 1 + width;
    return len;
}

auto MessageUnpacker::unpack_string() -> Result<std::string, MessageError> {
    size_t start = pos_;
    auto header = unpack_raw_string_header();
    if (is_err(header)) {
        return unwrap_err(header);
    }
    auto payload = read_payload(unwrap(header));
    if (is_err(payload)) {
        pos_ = start;
        return unwrap_err(payload);
    }
    auto bytes = unwrap(payload);
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

auto MessageUnpacker::unpack_array_header() -> Result<uint32_t, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    uint8_t b = unwrap(format);
    if (code::is_fixed_array(b)) {
        ++pos_;
        return static_cast<uint32_t>(b & 0x0f);
    }
    size_t width = b == code::ARRAY16 ? 2 : b == code::ARRAY32 ? 4 : 0;
    if (width == 0) {
        return mismatch("array", b);
    }
    if (auto err = require(pos_ + 1, width)) {
        return *err;
    }
    auto size = static_cast<uint32_t>(read_be(pos_ + 1, width));
    pos_ += 1 + width;
    return size;
}

auto MessageUnpacker::unpack_map_header() -> Result<uint32_t, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    uint8_t b = unwrap(format);
    if (code::is_fixed_map(b)) {
        ++pos_;
        return static_cast<uint32_t>(b & 0x0f);
    }
    size_t width = b == code::MAP16 ? 2 : b == code::MAP32 ? 4 : 0;
    if (width == 0) {
        return mismatch("map", b);
    }
    if (auto err = require(pos_ + 1, width)) {
        return *err;
    }
    auto size = static_cast<uint32_t>(read_be(pos_ + 1, width));
    pos_ += 1 + width;
    return size;
}

auto MessageUnpacker::unpack_binary_header() -> Result<uint32_t, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    uint8_t b = unwrap(format);
    size_t width = b == code::BIN8 ? 1 : b == code::BIN16 ? 2 : b == code::BIN32 ? 4 : 0;
    if (width == 0) {
        return mismatch("binary", b);
    }
    if (auto err = require(pos_ + 1, width)) {
        return *err;
    }
    auto len = static_cast<uint32_t>(read_be(pos_ + 1, width));
    pos_ += 1 + width;
    return len;
}

auto MessageUnpacker::unpack_extension_type_header() -> Result<ExtensionTypeHeader, MessageError> {
    auto format = next_format();
    if (is_err(format)) {
        return unwrap_err(format);
    }
    uint8_t b = unwrap(format);

    // Fixed forms carry the length in the code; explicit forms in 1/2/4 bytes
    uint32_t fixed_len = 0;
    size_t width = 0;
    switch (b) {
    case code::FIXEXT1:
        fixed_len = 1;
        break;
    case code::FIXEXT2:
        fixed_len = 2;
        break;
    case code::FIXEXT4:
        fixed_len = 4;
        break;
    case code::FIXEXT8:
        fixed_len = 8;
        break;
    case code::FIXEXT16:
        fixed_len = 16;
        break;
    case code::EXT8:
        width = 1;
        break;
    case code::EXT16:
        width = 2;
        break;
    case code::EXT32:
        width = 4;
        break;
    default:
        return mismatch("extension", b);
    }
    if (auto err = require(pos_ + 1, width + 1)) {
        return *err;
    }
    ExtensionTypeHeader header;
    header.length = width == 0 ? fixed_len : static_cast<uint32_t>(read_be(pos_ + 1, width));
    header.type = static_cast<int8_t>(data_[pos_ + 1 + width]);
    pos_ += 2 + width;
    return header;
}

auto MessageUnpacker::read_payload(size_t len) -> Result<std::span<const uint8_t>, MessageError> {
    if (auto err = require(pos_, len)) {
        return *err;
    }
    auto bytes = data_.subspan(pos_, len);
    pos_ += len;
    return bytes;
}

// ============================================================================
// Whole values
// ============================================================================

auto MessageUnpacker::unpack_value() -> Result<Value, MessageError> {
    size_t start = pos_;
    auto value = unpack_value_at_depth(0);
    if (is_err(value)) {
        pos_ = start;
    }
    return value;
}

auto MessageUnpacker::skip_value() -> Result<bool, MessageError> {
    size_t start = pos_;
    auto skipped = skip_value_at_depth(0);
    if (is_err(skipped)) {
        pos_ = start;
    }
    return skipped;
}

auto MessageUnpacker::unpack_value_at_depth(size_t depth) -> Result<Value, MessageError> {
    auto type = next_value_type();
    if (is_err(type)) {
        return unwrap_err(type);
    }

    switch (unwrap(type)) {
    case ValueType::Nil:
        ++pos_;
        return Value();
    case ValueType::Boolean: {
        auto b = unpack_boolean();
        if (is_err(b)) {
            return unwrap_err(b);
        }
        return Value(unwrap(b));
    }
    case ValueType::Integer:
        return unpack_integer();
    case ValueType::Float: {
        bool single = data_[pos_] == code::FLOAT32;
        auto d = unpack_f64();
        if (is_err(d)) {
            return unwrap_err(d);
        }
        return single ? Value(static_cast<float>(unwrap(d))) : Value(unwrap(d));
    }
    case ValueType::String: {
        auto s = unpack_string();
        if (is_err(s)) {
            return unwrap_err(s);
        }
        return Value(std::move(unwrap(s)));
    }
    case ValueType::Binary: {
        auto len = unpack_binary_header();
        if (is_err(len)) {
            return unwrap_err(len);
        }
        auto payload = read_payload(unwrap(len));
        if (is_err(payload)) {
            return unwrap_err(payload);
        }
        auto bytes = unwrap(payload);
        return Value(Binary{std::vector<uint8_t>(bytes.begin(), bytes.end())});
    }
    case ValueType::Extension: {
        auto header = unpack_extension_type_header();
        if (is_err(header)) {
            return unwrap_err(header);
        }
        auto payload = read_payload(unwrap(header).length);
        if (is_err(payload)) {
            return unwrap_err(payload);
        }
        auto bytes = unwrap(payload);
        return Value(
            Extension{unwrap(header).type, std::vector<uint8_t>(bytes.begin(), bytes.end())});
    }
    case ValueType::Array: {
        if (depth >= options_.max_depth) {
            return MessageError::nesting_too_deep(
                "nesting exceeds " + std::to_string(options_.max_depth) + " levels", pos_);
        }
        auto size = unpack_array_header();
        if (is_err(size)) {
            return unwrap_err(size);
        }
        Array items;
        // Every element takes at least one byte
        items.reserve(std::min<size_t>(unwrap(size), remaining()));
        for (uint32_t i = 0; i < unwrap(size); ++i) {
            auto item = unpack_value_at_depth(depth + 1);
            if (is_err(item)) {
                return unwrap_err(item);
            }
            items.push_back(std::move(unwrap(item)));
        }
        return Value(std::move(items));
    }
    case ValueType::Map: {
        if (depth >= options_.max_depth) {
            return MessageError::nesting_too_deep(
                "nesting exceeds " + std::to_string(options_.max_depth) + " levels", pos_);
        }
        auto size = unpack_map_header();
        if (is_err(size)) {
            return unwrap_err(size);
        }
        Map entries;
        entries.reserve(std::min<size_t>(unwrap(size), remaining() / 2));
        for (uint32_t i = 0; i < unwrap(size); ++i) {
            auto key = unpack_value_at_depth(depth + 1);
            if (is_err(key)) {
                return unwrap_err(key);
            }
            auto val = unpack_value_at_depth(depth + 1);
            if (is_err(val)) {
                return unwrap_err(val);
            }
            entries.emplace_back(std::move(unwrap(key)), std::move(unwrap(val)));
        }
        return Value(std::move(entries));
    }
    }
    return mismatch("value", data_[pos_]);
}

auto MessageUnpacker::skip_value_at_depth(size_t depth) -> Result<bool, MessageError> {
    auto type = next_value_type();
    if (is_err(type)) {
        return unwrap_err(type);
    }

    switch (unwrap(type)) {
    case ValueType::Array:
    case ValueType::Map: {
        if (depth >= options_.max_depth) {
            return MessageError::nesting_too_deep(
                "nesting exceeds " + std::to_string(options_.max_depth) + " levels", pos_);
        }
        bool is_map = unwrap(type) == ValueType::Map;
        auto size = is_map ? unpack_map_header() : unpack_array_header();
        if (is_err(size)) {
            return unwrap_err(size);
        }
        uint64_t count = static_cast<uint64_t>(unwrap(size)) * (is_map ? 2 : 1);
        for (uint64_t i = 0; i < count; ++i) {
            auto skipped = skip_value_at_depth(depth + 1);
            if (is_err(skipped)) {
                return skipped;
            }
        }
        return true;
    }
    default: {
        auto value = unpack_value_at_depth(depth);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        return true;
    }
    }
}

} // namespace msgcodec::msgpack
