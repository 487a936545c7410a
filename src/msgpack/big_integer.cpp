//! # BigInteger Implementation
//!
//! Decimal parsing and formatting work directly on the big-endian magnitude
//! with schoolbook multiply-add and divide-by-10.

#include "msgpack/big_integer.hpp"

#include <algorithm>
#include <bit>

namespace msgcodec::msgpack {

namespace {

void strip_leading_zeros(std::vector<uint8_t>& mag) {
    auto first = std::find_if(mag.begin(), mag.end(), [](uint8_t b) { return b != 0; });
    mag.erase(mag.begin(), first);
}

auto magnitude_of(uint64_t v) -> std::vector<uint8_t> {
    std::vector<uint8_t> mag;
    while (v != 0) {
        mag.push_back(static_cast<uint8_t>(v & 0xff));
        v >>= 8;
    }
    std::reverse(mag.begin(), mag.end());
    return mag;
}

// mag = mag * 10 + digit
void multiply_add(std::vector<uint8_t>& mag, uint8_t digit) {
    uint32_t carry = digit;
    for (auto it = mag.rbegin(); it != mag.rend(); ++it) {
        uint32_t v = static_cast<uint32_t>(*it) * 10 + carry;
        *it = static_cast<uint8_t>(v & 0xff);
        carry = v >> 8;
    }
    while (carry != 0) {
        mag.insert(mag.begin(), static_cast<uint8_t>(carry & 0xff));
        carry >>= 8;
    }
}

// mag = mag / 10, returns the remainder
auto divide_by_ten(std::vector<uint8_t>& mag) -> uint8_t {
    uint32_t rem = 0;
    for (auto& b : mag) {
        uint32_t cur = (rem << 8) | b;
        b = static_cast<uint8_t>(cur / 10);
        rem = cur % 10;
    }
    strip_leading_zeros(mag);
    return static_cast<uint8_t>(rem);
}

} // namespace

auto BigInteger::from_i64(int64_t v) -> BigInteger {
    BigInteger result;
    result.negative_ = v < 0;
    // Negate in unsigned arithmetic so INT64_MIN stays well-defined
    uint64_t mag = v < 0 ? ~static_cast<uint64_t>(v) + 1 : static_cast<uint64_t>(v);
    result.magnitude_ = magnitude_of(mag);
    return result;
}

auto BigInteger::from_u64(uint64_t v) -> BigInteger {
    BigInteger result;
    result.magnitude_ = magnitude_of(v);
    return result;
}

auto BigInteger::from_magnitude(bool negative, std::vector<uint8_t> magnitude) -> BigInteger {
    BigInteger result;
    strip_leading_zeros(magnitude);
    result.magnitude_ = std::move(magnitude);
    result.negative_ = negative && !result.magnitude_.empty();
    return result;
}

auto BigInteger::parse(std::string_view text) -> Result<BigInteger, std::string> {
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::string("expected decimal digits");
    }

    std::vector<uint8_t> mag;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return "invalid decimal digit '" + std::string(1, c) + "'";
        }
        multiply_add(mag, static_cast<uint8_t>(c - '0'));
        strip_leading_zeros(mag);
    }
    return from_magnitude(negative, std::move(mag));
}

auto BigInteger::bit_length() const -> size_t {
    if (magnitude_.empty()) {
        return 0;
    }
    size_t bits = (magnitude_.size() - 1) * 8 + static_cast<size_t>(std::bit_width(magnitude_[0]));
    if (negative_) {
        // -2^k needs one bit less than its magnitude
        bool power_of_two =
            std::has_single_bit(magnitude_[0]) &&
            std::all_of(magnitude_.begin() + 1, magnitude_.end(), [](uint8_t b) { return b == 0; });
        if (power_of_two) {
            --bits;
        }
    }
    return bits;
}

auto BigInteger::to_u64() const -> uint64_t {
    uint64_t v = 0;
    size_t start = magnitude_.size() > 8 ? magnitude_.size() - 8 : 0;
    for (size_t i = start; i < magnitude_.size(); ++i) {
        v = (v << 8) | magnitude_[i];
    }
    return v;
}

auto BigInteger::to_i64() const -> int64_t {
    uint64_t mag = to_u64();
    return static_cast<int64_t>(negative_ ? ~mag + 1 : mag);
}

auto BigInteger::to_string() const -> std::string {
    if (magnitude_.empty()) {
        return "0";
    }
    std::vector<uint8_t> mag = magnitude_;
    std::string digits;
    while (!mag.empty()) {
        digits.push_back(static_cast<char>('0' + divide_by_ten(mag)));
    }
    if (negative_) {
        digits.push_back('-');
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace msgcodec::msgpack
