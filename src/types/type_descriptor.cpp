//! # Type Descriptor Implementation
//!
//! Factory functions, structural equality, hashing and display for
//! `TypeDescriptor`.
//!
//! ## Factory Functions
//!
//! | Function            | Creates                            |
//! |---------------------|------------------------------------|
//! | `make_primitive`    | Bool, I8-I64, U8-U64, F32, F64, ... |
//! | `make_i32`, etc.    | Convenience for common primitives  |
//! | `make_option`       | `Option[T]`                        |
//! | `make_sequence`     | `Seq[T]` / `IndexedSeq[T]`         |
//! | `make_record`       | Records with ordered fields         |
//! | `make_named`        | By-name record references          |
//!
//! ## Equality and Hashing
//!
//! `descriptors_equal()` and `hash_descriptor()` agree: structurally equal
//! descriptors hash equally, whether or not they share storage.

#include "types/type_descriptor.hpp"

#include <functional>
#include <sstream>
#include <type_traits>

namespace msgcodec::types {

namespace {

auto make_descriptor(auto shape) -> TypeDescriptorPtr {
    auto type = std::make_shared<TypeDescriptor>();
    type->shape = std::move(shape);
    return type;
}

auto hash_combine(size_t seed, size_t val) -> size_t {
    return seed ^ (val + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

auto lists_equal(const std::vector<TypeDescriptorPtr>& a, const std::vector<TypeDescriptorPtr>& b)
    -> bool {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!descriptors_equal(a[i], b[i]))
            return false;
    }
    return true;
}

} // namespace

auto make_primitive(PrimitiveKind kind) -> TypeDescriptorPtr {
    return make_descriptor(PrimitiveShape{kind});
}

auto make_bool() -> TypeDescriptorPtr {
    return make_primitive(PrimitiveKind::Bool);
}

auto make_i32() -> TypeDescriptorPtr {
    return make_primitive(PrimitiveKind::I32);
}

auto make_i64() -> TypeDescriptorPtr {
    return make_primitive(PrimitiveKind::I64);
}

auto make_f64() -> TypeDescriptorPtr {
    return make_primitive(PrimitiveKind::F64);
}

auto make_string() -> TypeDescriptorPtr {
    return make_primitive(PrimitiveKind::String);
}

auto make_option(TypeDescriptorPtr element) -> TypeDescriptorPtr {
    return make_descriptor(OptionShape{std::move(element)});
}

auto make_tuple(std::vector<TypeDescriptorPtr> elements) -> TypeDescriptorPtr {
    return make_descriptor(TupleShape{std::move(elements)});
}

auto make_enum(std::string name, std::vector<std::string> symbols) -> TypeDescriptorPtr {
    return make_descriptor(EnumShape{std::move(name), std::move(symbols)});
}

auto make_sequence(TypeDescriptorPtr element, bool indexed) -> TypeDescriptorPtr {
    return make_descriptor(SequenceShape{std::move(element), indexed});
}

auto make_foreign_list(std::string container, TypeDescriptorPtr element) -> TypeDescriptorPtr {
    return make_descriptor(ForeignListShape{std::move(container), std::move(element)});
}

auto make_map(TypeDescriptorPtr key, TypeDescriptorPtr value) -> TypeDescriptorPtr {
    return make_descriptor(MapShape{std::move(key), std::move(value)});
}

auto make_foreign_map(std::string container, TypeDescriptorPtr key, TypeDescriptorPtr value)
    -> TypeDescriptorPtr {
    return make_descriptor(
        ForeignMapShape{std::move(container), std::move(key), std::move(value)});
}

auto make_record(std::string name, std::vector<FieldDescriptor> fields) -> TypeDescriptorPtr {
    return make_descriptor(RecordShape{std::move(name), std::move(fields)});
}

auto make_named(std::string name) -> TypeDescriptorPtr {
    return make_descriptor(NamedShape{std::move(name)});
}

auto TypeDescriptor::type_args() const -> std::vector<TypeDescriptorPtr> {
    return std::visit(
        [](const auto& s) -> std::vector<TypeDescriptorPtr> {
            using T = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<T, OptionShape> || std::is_same_v<T, SequenceShape> ||
                          std::is_same_v<T, ForeignListShape>) {
                return {s.element};
            } else if constexpr (std::is_same_v<T, TupleShape>) {
                return s.elements;
            } else if constexpr (std::is_same_v<T, MapShape> ||
                                 std::is_same_v<T, ForeignMapShape>) {
                return {s.key, s.value};
            } else if constexpr (std::is_same_v<T, RecordShape>) {
                std::vector<TypeDescriptorPtr> args;
                args.reserve(s.fields.size());
                for (const auto& field : s.fields) {
                    args.push_back(field.type);
                }
                return args;
            } else {
                return {};
            }
        },
        shape);
}

auto descriptors_equal(const TypeDescriptorPtr& a, const TypeDescriptorPtr& b) -> bool {
    if (!a && !b)
        return true;
    if (!a || !b)
        return false;
    if (a == b)
        return true;

    return std::visit(
        [&b](const auto& sa) -> bool {
            using T = std::decay_t<decltype(sa)>;

            if (!std::holds_alternative<T>(b->shape))
                return false;
            const auto& sb = std::get<T>(b->shape);

            if constexpr (std::is_same_v<T, PrimitiveShape>) {
                return sa.kind == sb.kind;
            } else if constexpr (std::is_same_v<T, OptionShape>) {
                return descriptors_equal(sa.element, sb.element);
            } else if constexpr (std::is_same_v<T, TupleShape>) {
                return lists_equal(sa.elements, sb.elements);
            } else if constexpr (std::is_same_v<T, EnumShape>) {
                return sa.name == sb.name && sa.symbols == sb.symbols;
            } else if constexpr (std::is_same_v<T, SequenceShape>) {
                return sa.indexed == sb.indexed && descriptors_equal(sa.element, sb.element);
            } else if constexpr (std::is_same_v<T, ForeignListShape>) {
                return sa.container == sb.container && descriptors_equal(sa.element, sb.element);
            } else if constexpr (std::is_same_v<T, MapShape>) {
                return descriptors_equal(sa.key, sb.key) && descriptors_equal(sa.value, sb.value);
            } else if constexpr (std::is_same_v<T, ForeignMapShape>) {
                return sa.container == sb.container && descriptors_equal(sa.key, sb.key) &&
                       descriptors_equal(sa.value, sb.value);
            } else if constexpr (std::is_same_v<T, RecordShape>) {
                if (sa.name != sb.name || sa.fields.size() != sb.fields.size())
                    return false;
                for (size_t i = 0; i < sa.fields.size(); ++i) {
                    if (sa.fields[i].name != sb.fields[i].name ||
                        !descriptors_equal(sa.fields[i].type, sb.fields[i].type))
                        return false;
                }
                return true;
            } else if constexpr (std::is_same_v<T, NamedShape>) {
                return sa.name == sb.name;
            }
            return false;
        },
        a->shape);
}

auto hash_descriptor(const TypeDescriptorPtr& type) -> size_t {
    if (!type)
        return 0;

    std::hash<std::string> str_hash;
    size_t h = std::hash<size_t>{}(type->shape.index());
    std::visit(
        [&](const auto& s) {
            using T = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<T, PrimitiveShape>) {
                h = hash_combine(h, static_cast<size_t>(s.kind));
            } else if constexpr (std::is_same_v<T, EnumShape>) {
                h = hash_combine(h, str_hash(s.name));
                for (const auto& sym : s.symbols) {
                    h = hash_combine(h, str_hash(sym));
                }
            } else if constexpr (std::is_same_v<T, SequenceShape>) {
                h = hash_combine(h, s.indexed ? 1 : 0);
            } else if constexpr (std::is_same_v<T, ForeignListShape> ||
                                 std::is_same_v<T, ForeignMapShape>) {
                h = hash_combine(h, str_hash(s.container));
            } else if constexpr (std::is_same_v<T, RecordShape>) {
                h = hash_combine(h, str_hash(s.name));
                for (const auto& field : s.fields) {
                    h = hash_combine(h, str_hash(field.name));
                }
            } else if constexpr (std::is_same_v<T, NamedShape>) {
                h = hash_combine(h, str_hash(s.name));
            }
        },
        type->shape);

    for (const auto& arg : type->type_args()) {
        h = hash_combine(h, hash_descriptor(arg));
    }
    return h;
}

auto primitive_kind_to_string(PrimitiveKind kind) -> std::string {
    switch (kind) {
    case PrimitiveKind::Bool:
        return "bool";
    case PrimitiveKind::I8:
        return "i8";
    case PrimitiveKind::I16:
        return "i16";
    case PrimitiveKind::I32:
        return "i32";
    case PrimitiveKind::I64:
        return "i64";
    case PrimitiveKind::U8:
        return "u8";
    case PrimitiveKind::U16:
        return "u16";
    case PrimitiveKind::U32:
        return "u32";
    case PrimitiveKind::U64:
        return "u64";
    case PrimitiveKind::F32:
        return "f32";
    case PrimitiveKind::F64:
        return "f64";
    case PrimitiveKind::String:
        return "string";
    case PrimitiveKind::Binary:
        return "binary";
    case PrimitiveKind::Any:
        return "any";
    }
    return "primitive(" + std::to_string(static_cast<int>(kind)) + ")";
}

auto descriptor_to_string(const TypeDescriptorPtr& type) -> std::string {
    if (!type)
        return "<null>";

    auto join = [](const std::vector<TypeDescriptorPtr>& args) {
        std::ostringstream oss;
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << descriptor_to_string(args[i]);
        }
        return oss.str();
    };

    return std::visit(
        [&](const auto& s) -> std::string {
            using T = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<T, PrimitiveShape>) {
                return primitive_kind_to_string(s.kind);
            } else if constexpr (std::is_same_v<T, OptionShape>) {
                return "Option[" + descriptor_to_string(s.element) + "]";
            } else if constexpr (std::is_same_v<T, TupleShape>) {
                return "Tuple[" + join(s.elements) + "]";
            } else if constexpr (std::is_same_v<T, EnumShape>) {
                return s.name;
            } else if constexpr (std::is_same_v<T, SequenceShape>) {
                return (s.indexed ? "IndexedSeq[" : "Seq[") + descriptor_to_string(s.element) +
                       "]";
            } else if constexpr (std::is_same_v<T, ForeignListShape>) {
                return s.container + "[" + descriptor_to_string(s.element) + "]";
            } else if constexpr (std::is_same_v<T, MapShape>) {
                return "Map[" + descriptor_to_string(s.key) + ", " +
                       descriptor_to_string(s.value) + "]";
            } else if constexpr (std::is_same_v<T, ForeignMapShape>) {
                return s.container + "[" + descriptor_to_string(s.key) + ", " +
                       descriptor_to_string(s.value) + "]";
            } else if constexpr (std::is_same_v<T, RecordShape>) {
                return s.name;
            } else {
                return "&" + s.name;
            }
        },
        type->shape);
}

} // namespace msgcodec::types
