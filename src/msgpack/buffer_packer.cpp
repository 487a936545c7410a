//! # Packer Implementation

#include "msgpack/buffer_packer.hpp"

#include "msgpack/code.hpp"

#include <limits>
#include <optional>
#include <string>

namespace msgcodec::msgpack {

namespace {

constexpr int64_t MAX_LENGTH = std::numeric_limits<uint32_t>::max();

auto check_size(const char* what, int64_t size) -> std::optional<MessageError> {
    if (size < 0) {
        return MessageError::invalid_argument("invalid size: " + std::string(what) +
                                              " must be >= 0 (" + std::to_string(size) + ")");
    }
    if (size > MAX_LENGTH) {
        return MessageError::invalid_argument(std::string(what) + " " + std::to_string(size) +
                                              " exceeds the 32-bit length limit");
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Scalars
// ============================================================================

auto pack_nil(Buffer& buf, size_t index) -> size_t {
    return buf.write_byte(index, code::NIL);
}

auto pack_boolean(Buffer& buf, size_t index, bool v) -> size_t {
    return buf.write_byte(index, v ? code::BOOLEAN_TRUE : code::BOOLEAN_FALSE);
}

auto pack_i8(Buffer& buf, size_t index, int8_t v) -> size_t {
    return pack_i64(buf, index, v);
}

auto pack_i16(Buffer& buf, size_t index, int16_t v) -> size_t {
    return pack_i64(buf, index, v);
}

auto pack_i32(Buffer& buf, size_t index, int32_t v) -> size_t {
    return pack_i64(buf, index, v);
}

auto pack_i64(Buffer& buf, size_t index, int64_t v) -> size_t {
    if (v < -(int64_t{1} << 5)) {
        if (v < -(int64_t{1} << 15)) {
            if (v < -(int64_t{1} << 31)) {
                return buf.write_byte_and_long(index, code::INT64, v);
            }
            return buf.write_byte_and_int(index, code::INT32, static_cast<int32_t>(v));
        }
        if (v < -(int64_t{1} << 7)) {
            return buf.write_byte_and_short(index, code::INT16, static_cast<int16_t>(v));
        }
        return buf.write_byte_and_byte(index, code::INT8, static_cast<uint8_t>(v));
    }
    if (v < (int64_t{1} << 7)) {
        // positive or negative fixint
        return buf.write_byte(index, static_cast<uint8_t>(v));
    }
    if (v < (int64_t{1} << 16)) {
        if (v < (int64_t{1} << 8)) {
            return buf.write_byte_and_byte(index, code::UINT8, static_cast<uint8_t>(v));
        }
        return buf.write_byte_and_short(index, code::UINT16, static_cast<int16_t>(v));
    }
    if (v < (int64_t{1} << 32)) {
        return buf.write_byte_and_int(index, code::UINT32, static_cast<int32_t>(v));
    }
    return buf.write_byte_and_long(index, code::UINT64, v);
}

auto pack_u8(Buffer& buf, size_t index, uint8_t v) -> size_t {
    return pack_i64(buf, index, v);
}

auto pack_u16(Buffer& buf, size_t index, uint16_t v) -> size_t {
    return pack_i64(buf, index, v);
}

auto pack_u32(Buffer& buf, size_t index, uint32_t v) -> size_t {
    return pack_i64(buf, index, v);
}

auto pack_u64(Buffer& buf, size_t index, uint64_t v) -> size_t {
    if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return buf.write_byte_and_long(index, code::UINT64, static_cast<int64_t>(v));
    }
    return pack_i64(buf, index, static_cast<int64_t>(v));
}

auto pack_big_integer(Buffer& buf, size_t index, const BigInteger& v)
    -> Result<size_t, MessageError> {
    size_t bits = v.bit_length();
    if (bits <= 63) {
        return pack_i64(buf, index, v.to_i64());
    }
    if (bits == 64 && !v.is_negative()) {
        return buf.write_byte_and_long(index, code::UINT64, static_cast<int64_t>(v.to_u64()));
    }
    return MessageError::invalid_argument("value exceeds representable range: " + v.to_string() +
                                          " does not fit in 64 bits");
}

auto pack_f32(Buffer& buf, size_t index, float v) -> size_t {
    return buf.write_byte_and_float(index, code::FLOAT32, v);
}

auto pack_f64(Buffer& buf, size_t index, double v) -> size_t {
    return buf.write_byte_and_double(index, code::FLOAT64, v);
}

// ============================================================================
// Headers
// ============================================================================

auto pack_raw_string_header(Buffer& buf, size_t index, uint32_t len) -> size_t {
    if (len < (1u << 5)) {
        return buf.write_byte(index, static_cast<uint8_t>(code::FIXSTR_PREFIX | len));
    }
    if (len < (1u << 8)) {
        return buf.write_byte_and_byte(index, code::STR8, static_cast<uint8_t>(len));
    }
    if (len < (1u << 16)) {
        return buf.write_byte_and_short(index, code::STR16, static_cast<int16_t>(len));
    }
    return buf.write_byte_and_int(index, code::STR32, static_cast<int32_t>(len));
}

auto pack_string(Buffer& buf, size_t index, std::string_view s) -> Result<size_t, MessageError> {
    if (auto err = check_size("string length", static_cast<int64_t>(s.size()))) {
        return *err;
    }
    size_t header = pack_raw_string_header(buf, index, static_cast<uint32_t>(s.size()));
    auto payload = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    return header + write_payload(buf, index + header, payload);
}

auto pack_array_header(Buffer& buf, size_t index, int64_t size) -> Result<size_t, MessageError> {
    if (auto err = check_size("array size", size)) {
        return *err;
    }
    if (size < (int64_t{1} << 4)) {
        return buf.write_byte(index, static_cast<uint8_t>(code::FIXARRAY_PREFIX | size));
    }
    if (size < (int64_t{1} << 16)) {
        return buf.write_byte_and_short(index, code::ARRAY16, static_cast<int16_t>(size));
    }
    return buf.write_byte_and_int(index, code::ARRAY32, static_cast<int32_t>(size));
}

auto pack_map_header(Buffer& buf, size_t index, int64_t size) -> Result<size_t, MessageError> {
    if (auto err = check_size("map size", size)) {
        return *err;
    }
    if (size < (int64_t{1} << 4)) {
        return buf.write_byte(index, static_cast<uint8_t>(code::FIXMAP_PREFIX | size));
    }
    if (size < (int64_t{1} << 16)) {
        return buf.write_byte_and_short(index, code::MAP16, static_cast<int16_t>(size));
    }
    return buf.write_byte_and_int(index, code::MAP32, static_cast<int32_t>(size));
}

auto pack_extension_type_header(Buffer& buf, size_t index, int8_t ext_type, int64_t payload_len)
    -> Result<size_t, MessageError> {
    if (auto err = check_size("extension length", payload_len)) {
        return *err;
    }
    auto tag = static_cast<uint8_t>(ext_type);
    if (payload_len < (int64_t{1} << 8)) {
        switch (payload_len) {
        case 1:
            return buf.write_byte_and_byte(index, code::FIXEXT1, tag);
        case 2:
            return buf.write_byte_and_byte(index, code::FIXEXT2, tag);
        case 4:
            return buf.write_byte_and_byte(index, code::FIXEXT4, tag);
        case 8:
            return buf.write_byte_and_byte(index, code::FIXEXT8, tag);
        case 16:
            return buf.write_byte_and_byte(index, code::FIXEXT16, tag);
        default:
            break;
        }
        buf.write_byte_and_byte(index, code::EXT8, static_cast<uint8_t>(payload_len));
        buf.write_byte(index + 2, tag);
        return size_t{3};
    }
    if (payload_len < (int64_t{1} << 16)) {
        buf.write_byte_and_short(index, code::EXT16, static_cast<int16_t>(payload_len));
        buf.write_byte(index + 3, tag);
        return size_t{4};
    }
    buf.write_byte_and_int(index, code::EXT32, static_cast<int32_t>(payload_len));
    buf.write_byte(index + 5, tag);
    return size_t{6};
}

auto pack_binary_header(Buffer& buf, size_t index, uint32_t len) -> size_t {
    if (len < (1u << 8)) {
        return buf.write_byte_and_byte(index, code::BIN8, static_cast<uint8_t>(len));
    }
    if (len < (1u << 16)) {
        return buf.write_byte_and_short(index, code::BIN16, static_cast<int16_t>(len));
    }
    return buf.write_byte_and_int(index, code::BIN32, static_cast<int32_t>(len));
}

auto pack_binary(Buffer& buf, size_t index, std::span<const uint8_t> data)
    -> Result<size_t, MessageError> {
    if (auto err = check_size("binary length", static_cast<int64_t>(data.size()))) {
        return *err;
    }
    size_t header = pack_binary_header(buf, index, static_cast<uint32_t>(data.size()));
    return header + write_payload(buf, index + header, data);
}

auto pack_extension(Buffer& buf, size_t index, int8_t ext_type, std::span<const uint8_t> data)
    -> Result<size_t, MessageError> {
    auto header =
        pack_extension_type_header(buf, index, ext_type, static_cast<int64_t>(data.size()));
    if (is_err(header)) {
        return header;
    }
    size_t len = unwrap(header);
    return len + write_payload(buf, index + len, data);
}

// ============================================================================
// Payload
// ============================================================================

auto write_payload(Buffer& buf, size_t index, std::span<const uint8_t> data) -> size_t {
    return buf.write_bytes(index, data);
}

auto write_payload(Buffer& buf, size_t index, std::span<const uint8_t> data, size_t offset,
                   size_t length) -> size_t {
    return buf.write_bytes(index, data.subspan(offset, length));
}

} // namespace msgcodec::msgpack
