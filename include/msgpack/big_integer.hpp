//! # Arbitrary-Precision Integers
//!
//! `BigInteger` is a sign-magnitude integer of unbounded width. The packer only
//! needs enough of it to decide whether a value fits MessagePack's 64-bit
//! integer forms, so the type supports construction, parsing, equality and
//! narrowing, not arithmetic.
//!
//! ## Bit Length
//!
//! `bit_length()` follows two's-complement conventions: it is the minimal
//! number of bits, excluding the sign bit, needed to represent the value.
//!
//! | Value     | bit_length |
//! |-----------|------------|
//! | `0`       | 0          |
//! | `127`     | 7          |
//! | `-128`    | 7          |
//! | `2^63-1`  | 63         |
//! | `-2^63`   | 63         |
//! | `2^64-1`  | 64         |

#pragma once

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace msgcodec::msgpack {

class BigInteger {
public:
    /// Zero.
    BigInteger() = default;

    static auto from_i64(int64_t v) -> BigInteger;
    static auto from_u64(uint64_t v) -> BigInteger;

    /// Builds a value from a sign and a big-endian magnitude. Leading zero
    /// bytes are stripped; a zero magnitude is never negative.
    static auto from_magnitude(bool negative, std::vector<uint8_t> magnitude) -> BigInteger;

    /// Parses an optionally signed decimal literal ("-123", "+42", "0").
    static auto parse(std::string_view text) -> Result<BigInteger, std::string>;

    [[nodiscard]] auto is_negative() const -> bool {
        return negative_;
    }

    [[nodiscard]] auto is_zero() const -> bool {
        return magnitude_.empty();
    }

    /// Minimal two's-complement width excluding the sign bit.
    [[nodiscard]] auto bit_length() const -> size_t;

    /// Low 64 bits in two's complement. Exact when `bit_length() <= 63`.
    [[nodiscard]] auto to_i64() const -> int64_t;

    /// Low 64 bits of the magnitude. Exact for non-negative values with
    /// `bit_length() <= 64`.
    [[nodiscard]] auto to_u64() const -> uint64_t;

    /// Big-endian magnitude without leading zeros.
    [[nodiscard]] auto magnitude() const -> const std::vector<uint8_t>& {
        return magnitude_;
    }

    /// Decimal representation.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const BigInteger& other) const -> bool = default;

private:
    bool negative_ = false;
    std::vector<uint8_t> magnitude_;
};

} // namespace msgcodec::msgpack
