//! # Type Registry Implementation

#include "types/type_introspector.hpp"

#include <algorithm>
#include <mutex>

namespace msgcodec::types {

auto TypeRegistry::register_type(TypeDescriptorPtr type) -> bool {
    if (!type) {
        return false;
    }
    std::string name;
    if (type->is<RecordShape>()) {
        name = type->as<RecordShape>().name;
    } else if (type->is<EnumShape>()) {
        name = type->as<EnumShape>().name;
    }
    if (name.empty()) {
        return false;
    }
    register_type(std::move(name), std::move(type));
    return true;
}

void TypeRegistry::register_type(std::string name, TypeDescriptorPtr type) {
    std::unique_lock lock(mutex_);
    types_[std::move(name)] = std::move(type);
}

auto TypeRegistry::describe(std::string_view name) const -> TypeDescriptorPtr {
    std::shared_lock lock(mutex_);
    auto it = types_.find(std::string(name));
    if (it != types_.end()) {
        return it->second;
    }
    return nullptr;
}

auto TypeRegistry::contains(std::string_view name) const -> bool {
    std::shared_lock lock(mutex_);
    return types_.find(std::string(name)) != types_.end();
}

auto TypeRegistry::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return types_.size();
}

auto TypeRegistry::names() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(types_.size());
    for (const auto& [name, _] : types_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace msgcodec::types
