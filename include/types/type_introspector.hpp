//! # Type Introspection
//!
//! `TypeIntrospector` maps a type name to its descriptor. The codec factory
//! consults it to resolve `NamedShape` references and `of_type()` lookups.
//! How descriptors are discovered is up to the implementation; `TypeRegistry`
//! is the stock one, filled explicitly by the application.
//!
//! ## Example
//!
//! ```cpp
//! auto registry = std::make_shared<TypeRegistry>();
//! registry->register_type(make_record("Node", {
//!     {"value", make_i32()},
//!     {"next", make_option(make_named("Node"))},
//! }));
//!
//! MessageCodecFactory factory({}, registry);
//! auto codec = factory.of_type("Node");  // fails: recursive type
//! ```

#ifndef MSGCODEC_TYPES_TYPE_INTROSPECTOR_HPP
#define MSGCODEC_TYPES_TYPE_INTROSPECTOR_HPP

#include "types/type_descriptor.hpp"

#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace msgcodec::types {

/// Source of descriptors by type name.
class TypeIntrospector {
public:
    virtual ~TypeIntrospector() = default;

    /// Returns the descriptor registered under `name`, or null if unknown.
    [[nodiscard]] virtual auto describe(std::string_view name) const -> TypeDescriptorPtr = 0;
};

/// Thread-safe name-to-descriptor table.
class TypeRegistry : public TypeIntrospector {
public:
    TypeRegistry() = default;

    /// Registers a record or enum under its own name. Returns false if the
    /// descriptor has no name.
    auto register_type(TypeDescriptorPtr type) -> bool;

    /// Registers any descriptor under an explicit name, replacing a previous
    /// entry.
    void register_type(std::string name, TypeDescriptorPtr type);

    [[nodiscard]] auto describe(std::string_view name) const -> TypeDescriptorPtr override;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto size() const -> size_t;

    /// Registered names, sorted.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TypeDescriptorPtr> types_;
};

} // namespace msgcodec::types

#endif // MSGCODEC_TYPES_TYPE_INTROSPECTOR_HPP
