//! # Common Definitions
//!
//! Shared vocabulary of the wire layer (`msgpack/`), the type model
//! (`types/`) and the codec layer (`codec/`).
//!
//! | Item | Purpose |
//! |------|---------|
//! | `VERSION*` | Library version, reported by `msgdump --version` |
//! | `Result<T, E>` | Success value or error; nothing in the library throws |
//! | `Box<T>` | Unique ownership of nested containers and private state |
//!
//! Shared, immutable objects (type descriptors, codecs) are held through
//! `std::shared_ptr<const T>` aliases declared next to their types.

#ifndef MSGCODEC_COMMON_HPP
#define MSGCODEC_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace msgcodec {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// Either the value of a successful operation or the reason it failed.
///
/// ```cpp
/// auto written = msgpack::pack_array_header(buf, 0, n);
/// if (is_err(written)) {
///     return unwrap_err(written);
/// }
/// index += unwrap(written);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// The success value. Check `is_ok` first; an error result throws
/// `std::bad_variant_access`.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// The error value. Check `is_err` first.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace msgcodec

#endif // MSGCODEC_COMMON_HPP
