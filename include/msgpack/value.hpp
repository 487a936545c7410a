//! # Dynamic MessagePack Values
//!
//! `Value` holds any MessagePack value without a type descriptor. The unpacker
//! produces it, codecs consume and produce it, and `pack_value` writes it with
//! minimal format codes.
//!
//! ## Integer Representation
//!
//! | Wire value              | Storage    |
//! |-------------------------|------------|
//! | `[-2^63, 2^63)`         | `int64_t`  |
//! | `[2^63, 2^64)`          | `uint64_t` |
//!
//! Signed and unsigned integers compare numerically, so `Value(int64_t{5})`
//! equals `Value(uint64_t{5})`.
//!
//! ## Ownership
//!
//! Arrays and maps are boxed, which makes `Value` move-only. Use `clone()` for
//! an explicit deep copy.
//!
//! ## Example
//!
//! ```cpp
//! Map fields;
//! fields.emplace_back(Value("name"), Value("Alice"));
//! fields.emplace_back(Value("age"), Value(30));
//! Value person(std::move(fields));
//!
//! if (auto* age = person.get("age")) {
//!     std::cout << age->as_i64() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "msgpack/buffer.hpp"
#include "msgpack/msgpack_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace msgcodec::msgpack {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

struct Value;

using Array = std::vector<Value>;

/// Map entries in wire order. Keys may be any value.
using Map = std::vector<std::pair<Value, Value>>;

/// Raw binary payload (bin 8/16/32).
struct Binary {
    std::vector<uint8_t> data;

    auto operator==(const Binary& other) const -> bool = default;
};

/// Application-defined extension payload (fixext / ext 8/16/32).
struct Extension {
    int8_t type = 0;
    std::vector<uint8_t> data;

    auto operator==(const Extension& other) const -> bool = default;
};

// ============================================================================
// Value
// ============================================================================

struct Value {
    using Nil = std::monostate;

    using ValueVariant = std::variant<Nil,        // nil
                                      bool,       // boolean
                                      int64_t,    // signed integer
                                      uint64_t,   // integer above INT64_MAX
                                      float,      // float 32
                                      double,     // float 64
                                      std::string, // str
                                      Binary,     // bin
                                      Box<Array>, // array (boxed)
                                      Box<Map>,   // map (boxed)
                                      Extension>; // ext

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    Value() : data(Nil{}) {}

    explicit Value(std::nullptr_t) : data(Nil{}) {}

    explicit Value(bool value) : data(value) {}

    explicit Value(int value) : data(static_cast<int64_t>(value)) {}

    explicit Value(int64_t value) : data(value) {}

    /// Stored as `int64_t` when it fits, keeping one representation per number.
    explicit Value(uint64_t value) {
        if (value <= static_cast<uint64_t>(INT64_MAX)) {
            data.emplace<int64_t>(static_cast<int64_t>(value));
        } else {
            data.emplace<uint64_t>(value);
        }
    }

    explicit Value(float value) : data(value) {}

    explicit Value(double value) : data(value) {}

    explicit Value(const char* value) : data(std::string(value)) {}

    explicit Value(std::string value) : data(std::move(value)) {}

    explicit Value(std::string_view value) : data(std::string(value)) {}

    explicit Value(Binary value) : data(std::move(value)) {}

    explicit Value(Extension value) : data(std::move(value)) {}

    explicit Value(Array value) : data(make_box<Array>(std::move(value))) {}

    explicit Value(Map value) : data(make_box<Map>(std::move(value))) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_nil() const -> bool {
        return std::holds_alternative<Nil>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data) || std::holds_alternative<uint64_t>(data);
    }

    [[nodiscard]] auto is_float() const -> bool {
        return std::holds_alternative<float>(data) || std::holds_alternative<double>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_binary() const -> bool {
        return std::holds_alternative<Binary>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<Array>>(data);
    }

    [[nodiscard]] auto is_map() const -> bool {
        return std::holds_alternative<Box<Map>>(data);
    }

    [[nodiscard]] auto is_extension() const -> bool {
        return std::holds_alternative<Extension>(data);
    }

    /// Short name of the held kind ("nil", "integer", "map", ...).
    [[nodiscard]] auto type_name() const -> const char*;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_binary() const -> const Binary& {
        return std::get<Binary>(data);
    }

    [[nodiscard]] auto as_extension() const -> const Extension& {
        return std::get<Extension>(data);
    }

    [[nodiscard]] auto as_array() const -> const Array& {
        return *std::get<Box<Array>>(data);
    }

    [[nodiscard]] auto as_map() const -> const Map& {
        return *std::get<Box<Map>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> Array& {
        return *std::get<Box<Array>>(data);
    }

    [[nodiscard]] auto as_map_mut() -> Map& {
        return *std::get<Box<Map>>(data);
    }

    /// Signed view of an integer; empty for non-integers and values above
    /// `INT64_MAX`.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (auto* i = std::get_if<int64_t>(&data)) {
            return *i;
        }
        return std::nullopt;
    }

    /// Unsigned view of an integer; empty for non-integers and negative values.
    [[nodiscard]] auto try_as_u64() const -> std::optional<uint64_t> {
        if (auto* i = std::get_if<int64_t>(&data)) {
            if (*i >= 0) {
                return static_cast<uint64_t>(*i);
            }
            return std::nullopt;
        }
        if (auto* u = std::get_if<uint64_t>(&data)) {
            return *u;
        }
        return std::nullopt;
    }

    /// Floating view of a float or double; empty otherwise.
    [[nodiscard]] auto try_as_f64() const -> std::optional<double> {
        if (auto* f = std::get_if<float>(&data)) {
            return static_cast<double>(*f);
        }
        if (auto* d = std::get_if<double>(&data)) {
            return *d;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto as_i64() const -> int64_t {
        return std::get<int64_t>(data);
    }

    // ========================================================================
    // Container Access
    // ========================================================================

    /// Looks up a string key in a map; null if absent or not a map.
    [[nodiscard]] auto get(std::string_view key) const -> const Value*;

    /// Replaces the entry for a string key, or appends one.
    void set(std::string_view key, Value value);

    /// Element count of an array or map, 0 otherwise.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<Array>>(&data)) {
            return (*arr)->size();
        }
        if (auto* map = std::get_if<Box<Map>>(&data)) {
            return (*map)->size();
        }
        return 0;
    }

    void push(Value value) {
        as_array_mut().push_back(std::move(value));
    }

    // ========================================================================
    // Copy and Compare
    // ========================================================================

    /// Deep copy.
    [[nodiscard]] auto clone() const -> Value;

    [[nodiscard]] auto operator==(const Value& other) const -> bool;

    [[nodiscard]] auto operator!=(const Value& other) const -> bool {
        return !(*this == other);
    }

    /// Compact text form: `{"id": 1, "tags": ["a", "b"], "raw": bin(0a0b)}`.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Writes `value` at `index` with minimal format codes and returns the bytes
/// written.
[[nodiscard]] auto pack_value(Buffer& buf, size_t index, const Value& value)
    -> Result<size_t, MessageError>;

} // namespace msgcodec::msgpack
