//! # Descriptors for C++ Types
//!
//! `describe<T>()` builds the descriptor of a C++ type at compile time. It
//! covers the standard library vocabulary types; applications add their own
//! records and enums by specializing `TypeOf`.
//!
//! | C++ type                          | Descriptor                 |
//! |-----------------------------------|----------------------------|
//! | `bool`, `int8_t`..`uint64_t`      | primitive                  |
//! | `float`, `double`                 | `f32`, `f64`               |
//! | `std::string`                     | `string`                   |
//! | `std::vector<uint8_t>`            | `binary`                   |
//! | `std::optional<T>`                | `Option[T]`                |
//! | `std::vector<T>`, `std::deque<T>` | `IndexedSeq[T]`            |
//! | `std::list<T>`                    | `Seq[T]`                   |
//! | `std::map<K, V>`, `std::unordered_map<K, V>` | `Map[K, V]`     |
//! | `std::tuple<Ts...>`, `std::pair<A, B>` | `Tuple[Ts...]`        |
//!
//! ## Example
//!
//! ```cpp
//! struct Point { int32_t x; int32_t y; };
//!
//! template <> struct msgcodec::types::TypeOf<Point> {
//!     static auto describe() -> TypeDescriptorPtr {
//!         return make_record("Point", {{"x", make_i32()}, {"y", make_i32()}});
//!     }
//! };
//!
//! auto codec = factory.of<std::vector<Point>>();
//! ```

#ifndef MSGCODEC_TYPES_TYPE_OF_HPP
#define MSGCODEC_TYPES_TYPE_OF_HPP

#include "types/type_descriptor.hpp"

#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace msgcodec::types {

/// Descriptor trait. Specialize with a static `describe()` for custom types.
template <typename T> struct TypeOf;

template <typename T> [[nodiscard]] auto describe() -> TypeDescriptorPtr {
    return TypeOf<T>::describe();
}

// ============================================================================
// Primitives
// ============================================================================

template <PrimitiveKind K> struct PrimitiveTypeOf {
    static auto describe() -> TypeDescriptorPtr {
        return make_primitive(K);
    }
};

template <> struct TypeOf<bool> : PrimitiveTypeOf<PrimitiveKind::Bool> {};
template <> struct TypeOf<int8_t> : PrimitiveTypeOf<PrimitiveKind::I8> {};
template <> struct TypeOf<int16_t> : PrimitiveTypeOf<PrimitiveKind::I16> {};
template <> struct TypeOf<int32_t> : PrimitiveTypeOf<PrimitiveKind::I32> {};
template <> struct TypeOf<int64_t> : PrimitiveTypeOf<PrimitiveKind::I64> {};
template <> struct TypeOf<uint8_t> : PrimitiveTypeOf<PrimitiveKind::U8> {};
template <> struct TypeOf<uint16_t> : PrimitiveTypeOf<PrimitiveKind::U16> {};
template <> struct TypeOf<uint32_t> : PrimitiveTypeOf<PrimitiveKind::U32> {};
template <> struct TypeOf<uint64_t> : PrimitiveTypeOf<PrimitiveKind::U64> {};
template <> struct TypeOf<float> : PrimitiveTypeOf<PrimitiveKind::F32> {};
template <> struct TypeOf<double> : PrimitiveTypeOf<PrimitiveKind::F64> {};
template <> struct TypeOf<std::string> : PrimitiveTypeOf<PrimitiveKind::String> {};
template <> struct TypeOf<std::vector<uint8_t>> : PrimitiveTypeOf<PrimitiveKind::Binary> {};

// ============================================================================
// Wrappers and collections
// ============================================================================

template <typename T> struct TypeOf<std::optional<T>> {
    static auto describe() -> TypeDescriptorPtr {
        return make_option(TypeOf<T>::describe());
    }
};

template <typename T> struct TypeOf<std::vector<T>> {
    static auto describe() -> TypeDescriptorPtr {
        return make_sequence(TypeOf<T>::describe(), true);
    }
};

template <typename T> struct TypeOf<std::deque<T>> {
    static auto describe() -> TypeDescriptorPtr {
        return make_sequence(TypeOf<T>::describe(), true);
    }
};

template <typename T> struct TypeOf<std::list<T>> {
    static auto describe() -> TypeDescriptorPtr {
        return make_sequence(TypeOf<T>::describe(), false);
    }
};

template <typename K, typename V> struct TypeOf<std::map<K, V>> {
    static auto describe() -> TypeDescriptorPtr {
        return make_map(TypeOf<K>::describe(), TypeOf<V>::describe());
    }
};

template <typename K, typename V> struct TypeOf<std::unordered_map<K, V>> {
    static auto describe() -> TypeDescriptorPtr {
        return make_map(TypeOf<K>::describe(), TypeOf<V>::describe());
    }
};

template <typename... Ts> struct TypeOf<std::tuple<Ts...>> {
    static auto describe() -> TypeDescriptorPtr {
        return make_tuple({TypeOf<Ts>::describe()...});
    }
};

template <typename A, typename B> struct TypeOf<std::pair<A, B>> {
    static auto describe() -> TypeDescriptorPtr {
        return make_tuple({TypeOf<A>::describe(), TypeOf<B>::describe()});
    }
};

} // namespace msgcodec::types

#endif // MSGCODEC_TYPES_TYPE_OF_HPP
