//! # Type Descriptors
//!
//! A `TypeDescriptor` is an immutable structural description of a type: its
//! shape plus the descriptors nested in it. The codec factory derives codecs
//! from descriptors and uses them as cache keys, so equality and hashing are
//! structural.
//!
//! ## Shapes
//!
//! | Shape              | Nested descriptors     | Example               |
//! |--------------------|------------------------|-----------------------|
//! | `PrimitiveShape`   | none                   | `i32`, `string`       |
//! | `OptionShape`      | element                | `Option[i32]`         |
//! | `TupleShape`       | elements in order      | `Tuple[i32, string]`  |
//! | `EnumShape`        | none (symbols)         | `Color{red, green}`   |
//! | `SequenceShape`    | element                | `Seq[i32]`            |
//! | `ForeignListShape` | element                | `std::deque[i32]`     |
//! | `MapShape`         | key, value             | `Map[string, i32]`    |
//! | `ForeignMapShape`  | key, value             | `absl::flat_hash_map[string, i32]` |
//! | `RecordShape`      | field types in order   | `Person`              |
//! | `NamedShape`       | none (resolved by name) | `&Person`            |
//!
//! ## Recursive Types
//!
//! Descriptors are shared and never mutated, so they cannot point at
//! themselves. A record that refers to itself does so through a
//! `NamedShape`, which the factory resolves through a `TypeIntrospector`.

#ifndef MSGCODEC_TYPES_TYPE_DESCRIPTOR_HPP
#define MSGCODEC_TYPES_TYPE_DESCRIPTOR_HPP

#include "common.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace msgcodec::types {

// Forward declarations
struct TypeDescriptor;
using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

// Primitive kinds
enum class PrimitiveKind {
    Bool,
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    F32,
    F64,
    String,
    Binary,
    Any, // Any MessagePack value
};

// Scalar type
struct PrimitiveShape {
    PrimitiveKind kind;
};

// Optional value: Option[T]
struct OptionShape {
    TypeDescriptorPtr element;
};

// Fixed-arity heterogeneous tuple: Tuple[A, B, C]
struct TupleShape {
    std::vector<TypeDescriptorPtr> elements;
};

// Enumeration encoded by symbol name
struct EnumShape {
    std::string name;
    std::vector<std::string> symbols;
};

// Ordered sequence: Seq[T]; `indexed` marks random-access targets
struct SequenceShape {
    TypeDescriptorPtr element;
    bool indexed = false;
};

// List-like collection from another container library
struct ForeignListShape {
    std::string container; // e.g. "std::deque"
    TypeDescriptorPtr element;
};

// Native map: Map[K, V]
struct MapShape {
    TypeDescriptorPtr key;
    TypeDescriptorPtr value;
};

// Map-like collection from another container library
struct ForeignMapShape {
    std::string container;
    TypeDescriptorPtr key;
    TypeDescriptorPtr value;
};

// Named field of a record
struct FieldDescriptor {
    std::string name;
    TypeDescriptorPtr type;
};

// Record with named, typed fields in declaration order
struct RecordShape {
    std::string name;
    std::vector<FieldDescriptor> fields;
};

// Reference to a record by name, resolved through a TypeIntrospector
struct NamedShape {
    std::string name;
};

// Descriptor variant
struct TypeDescriptor {
    std::variant<PrimitiveShape, OptionShape, TupleShape, EnumShape, SequenceShape,
                 ForeignListShape, MapShape, ForeignMapShape, RecordShape, NamedShape>
        shape;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(shape);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(shape);
    }

    /// Nested descriptors in order: element, tuple elements, key and value,
    /// or record field types.
    [[nodiscard]] auto type_args() const -> std::vector<TypeDescriptorPtr>;
};

// Helper functions
[[nodiscard]] auto make_primitive(PrimitiveKind kind) -> TypeDescriptorPtr;
[[nodiscard]] auto make_bool() -> TypeDescriptorPtr;
[[nodiscard]] auto make_i32() -> TypeDescriptorPtr;
[[nodiscard]] auto make_i64() -> TypeDescriptorPtr;
[[nodiscard]] auto make_f64() -> TypeDescriptorPtr;
[[nodiscard]] auto make_string() -> TypeDescriptorPtr;
[[nodiscard]] auto make_option(TypeDescriptorPtr element) -> TypeDescriptorPtr;
[[nodiscard]] auto make_tuple(std::vector<TypeDescriptorPtr> elements) -> TypeDescriptorPtr;
[[nodiscard]] auto make_enum(std::string name, std::vector<std::string> symbols)
    -> TypeDescriptorPtr;
[[nodiscard]] auto make_sequence(TypeDescriptorPtr element, bool indexed = false)
    -> TypeDescriptorPtr;
[[nodiscard]] auto make_foreign_list(std::string container, TypeDescriptorPtr element)
    -> TypeDescriptorPtr;
[[nodiscard]] auto make_map(TypeDescriptorPtr key, TypeDescriptorPtr value) -> TypeDescriptorPtr;
[[nodiscard]] auto make_foreign_map(std::string container, TypeDescriptorPtr key,
                                    TypeDescriptorPtr value) -> TypeDescriptorPtr;
[[nodiscard]] auto make_record(std::string name, std::vector<FieldDescriptor> fields)
    -> TypeDescriptorPtr;
[[nodiscard]] auto make_named(std::string name) -> TypeDescriptorPtr;

// Structural comparison and hashing
[[nodiscard]] auto descriptors_equal(const TypeDescriptorPtr& a, const TypeDescriptorPtr& b)
    -> bool;
[[nodiscard]] auto hash_descriptor(const TypeDescriptorPtr& type) -> size_t;
[[nodiscard]] auto descriptor_to_string(const TypeDescriptorPtr& type) -> std::string;

// Helper to convert primitive kind to string name
[[nodiscard]] auto primitive_kind_to_string(PrimitiveKind kind) -> std::string;

/// Hash functor for unordered containers keyed by descriptor.
struct DescriptorHash {
    auto operator()(const TypeDescriptorPtr& type) const -> size_t {
        return hash_descriptor(type);
    }
};

/// Equality functor for unordered containers keyed by descriptor.
struct DescriptorEqual {
    auto operator()(const TypeDescriptorPtr& a, const TypeDescriptorPtr& b) const -> bool {
        return descriptors_equal(a, b);
    }
};

} // namespace msgcodec::types

#endif // MSGCODEC_TYPES_TYPE_DESCRIPTOR_HPP
