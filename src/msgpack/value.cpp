//! # Value Implementation
//!
//! Deep copy, structural comparison, text rendering and packing of `Value`.

#include "msgpack/value.hpp"

#include "msgpack/buffer_packer.hpp"

#include <cstdio>
#include <sstream>
#include <type_traits>

namespace msgcodec::msgpack {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void write_hex(std::ostream& os, const std::vector<uint8_t>& bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    for (uint8_t b : bytes) {
        os << digits[b >> 4] << digits[b & 0x0f];
    }
}

void write_quoted(std::ostream& os, const std::string& s) {
    os << '"';
    for (char c : s) {
        switch (c) {
        case '"':
            os << "\\\"";
            break;
        case '\\':
            os << "\\\\";
            break;
        case '\n':
            os << "\\n";
            break;
        case '\r':
            os << "\\r";
            break;
        case '\t':
            os << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(c));
                os << esc;
            } else {
                os << c;
            }
        }
    }
    os << '"';
}

void write_value(std::ostream& os, const Value& value) {
    std::visit(overloaded{
                   [&](const Value::Nil&) { os << "nil"; },
                   [&](bool b) { os << (b ? "true" : "false"); },
                   [&](int64_t i) { os << i; },
                   [&](uint64_t u) { os << u; },
                   [&](float f) { os << f; },
                   [&](double d) { os << d; },
                   [&](const std::string& s) { write_quoted(os, s); },
                   [&](const Binary& bin) {
                       os << "bin(";
                       write_hex(os, bin.data);
                       os << ")";
                   },
                   [&](const Box<Array>& arr) {
                       os << "[";
                       for (size_t i = 0; i < arr->size(); ++i) {
                           if (i > 0) {
                               os << ", ";
                           }
                           write_value(os, (*arr)[i]);
                       }
                       os << "]";
                   },
                   [&](const Box<Map>& map) {
                       os << "{";
                       for (size_t i = 0; i < map->size(); ++i) {
                           if (i > 0) {
                               os << ", ";
                           }
                           write_value(os, (*map)[i].first);
                           os << ": ";
                           write_value(os, (*map)[i].second);
                       }
                       os << "}";
                   },
                   [&](const Extension& ext) {
                       os << "ext(" << static_cast<int>(ext.type) << ", ";
                       write_hex(os, ext.data);
                       os << ")";
                   },
               },
               value.data);
}

auto integers_equal(const Value& a, const Value& b) -> bool {
    auto ai = a.try_as_i64();
    auto bi = b.try_as_i64();
    if (ai && bi) {
        return *ai == *bi;
    }
    auto au = a.try_as_u64();
    auto bu = b.try_as_u64();
    return au && bu && *au == *bu;
}

} // namespace

auto Value::type_name() const -> const char* {
    return std::visit(overloaded{
                          [](const Nil&) { return "nil"; },
                          [](bool) { return "boolean"; },
                          [](int64_t) { return "integer"; },
                          [](uint64_t) { return "integer"; },
                          [](float) { return "float"; },
                          [](double) { return "float"; },
                          [](const std::string&) { return "string"; },
                          [](const Binary&) { return "binary"; },
                          [](const Box<Array>&) { return "array"; },
                          [](const Box<Map>&) { return "map"; },
                          [](const Extension&) { return "extension"; },
                      },
                      data);
}

auto Value::get(std::string_view key) const -> const Value* {
    if (auto* map = std::get_if<Box<Map>>(&data)) {
        for (const auto& [k, v] : **map) {
            if (k.is_string() && k.as_string() == key) {
                return &v;
            }
        }
    }
    return nullptr;
}

void Value::set(std::string_view key, Value value) {
    auto& map = as_map_mut();
    for (auto& [k, v] : map) {
        if (k.is_string() && k.as_string() == key) {
            v = std::move(value);
            return;
        }
    }
    map.emplace_back(Value(key), std::move(value));
}

auto Value::clone() const -> Value {
    return std::visit(overloaded{
                          [](const Box<Array>& arr) {
                              Array copy;
                              copy.reserve(arr->size());
                              for (const auto& item : *arr) {
                                  copy.push_back(item.clone());
                              }
                              return Value(std::move(copy));
                          },
                          [](const Box<Map>& map) {
                              Map copy;
                              copy.reserve(map->size());
                              for (const auto& [k, v] : *map) {
                                  copy.emplace_back(k.clone(), v.clone());
                              }
                              return Value(std::move(copy));
                          },
                          [](const auto& scalar) {
                              Value copy;
                              copy.data.emplace<std::decay_t<decltype(scalar)>>(scalar);
                              return copy;
                          },
                      },
                      data);
}

auto Value::operator==(const Value& other) const -> bool {
    if (is_integer() && other.is_integer()) {
        return integers_equal(*this, other);
    }
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_array()) {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) {
                return false;
            }
        }
        return true;
    }
    if (is_map()) {
        const auto& a = as_map();
        const auto& b = other.as_map();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i].first != b[i].first || a[i].second != b[i].second) {
                return false;
            }
        }
        return true;
    }
    return std::visit(
        [](const auto& a, const auto& b) {
            if constexpr (std::is_same_v<std::decay_t<decltype(a)>, std::decay_t<decltype(b)>>) {
                return a == b;
            } else {
                return false;
            }
        },
        data, other.data);
}

auto Value::to_string() const -> std::string {
    std::ostringstream oss;
    write_value(oss, *this);
    return oss.str();
}

// ============================================================================
// Packing
// ============================================================================

auto pack_value(Buffer& buf, size_t index, const Value& value) -> Result<size_t, MessageError> {
    using R = Result<size_t, MessageError>;
    return std::visit(
        overloaded{
            [&](const Value::Nil&) -> R { return pack_nil(buf, index); },
            [&](bool b) -> R { return pack_boolean(buf, index, b); },
            [&](int64_t i) -> R { return pack_i64(buf, index, i); },
            [&](uint64_t u) -> R { return pack_u64(buf, index, u); },
            [&](float f) -> R { return pack_f32(buf, index, f); },
            [&](double d) -> R { return pack_f64(buf, index, d); },
            [&](const std::string& s) -> R { return pack_string(buf, index, s); },
            [&](const Binary& bin) -> R { return pack_binary(buf, index, bin.data); },
            [&](const Extension& ext) -> R {
                return pack_extension(buf, index, ext.type, ext.data);
            },
            [&](const Box<Array>& arr) -> R {
                auto header = pack_array_header(buf, index, static_cast<int64_t>(arr->size()));
                if (is_err(header)) {
                    return header;
                }
                size_t pos = index + unwrap(header);
                for (const auto& item : *arr) {
                    auto written = pack_value(buf, pos, item);
                    if (is_err(written)) {
                        return written;
                    }
                    pos += unwrap(written);
                }
                return pos - index;
            },
            [&](const Box<Map>& map) -> R {
                auto header = pack_map_header(buf, index, static_cast<int64_t>(map->size()));
                if (is_err(header)) {
                    return header;
                }
                size_t pos = index + unwrap(header);
                for (const auto& [k, v] : *map) {
                    auto key = pack_value(buf, pos, k);
                    if (is_err(key)) {
                        return key;
                    }
                    pos += unwrap(key);
                    auto val = pack_value(buf, pos, v);
                    if (is_err(val)) {
                        return val;
                    }
                    pos += unwrap(val);
                }
                return pos - index;
            },
        },
        value.data);
}

} // namespace msgcodec::msgpack
