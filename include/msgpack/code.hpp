//! # MessagePack Format Codes
//!
//! The one-byte format tags of the MessagePack wire format. Values match the
//! MessagePack specification's code table byte-for-byte; any conforming
//! reader can consume what the packer writes.
//!
//! | Range       | Meaning               |
//! |-------------|-----------------------|
//! | `00..7f`    | positive fixint       |
//! | `80..8f`    | fixmap (0..15)        |
//! | `90..9f`    | fixarray (0..15)      |
//! | `a0..bf`    | fixstr (0..31 bytes)  |
//! | `c0`        | nil                   |
//! | `c1`        | never used            |
//! | `c2`/`c3`   | false / true          |
//! | `c4..c6`    | bin 8/16/32           |
//! | `c7..c9`    | ext 8/16/32           |
//! | `ca`/`cb`   | float 32 / float 64   |
//! | `cc..cf`    | uint 8/16/32/64       |
//! | `d0..d3`    | int 8/16/32/64        |
//! | `d4..d8`    | fixext 1/2/4/8/16     |
//! | `d9..db`    | str 8/16/32           |
//! | `dc`/`dd`   | array 16/32           |
//! | `de`/`df`   | map 16/32             |
//! | `e0..ff`    | negative fixint       |

#pragma once

#include <cstdint>

namespace msgcodec::msgpack::code {

constexpr uint8_t POSFIXINT_MASK = 0x80;

constexpr uint8_t FIXMAP_PREFIX = 0x80;
constexpr uint8_t FIXARRAY_PREFIX = 0x90;
constexpr uint8_t FIXSTR_PREFIX = 0xa0;

constexpr uint8_t NIL = 0xc0;
constexpr uint8_t NEVER_USED = 0xc1;
constexpr uint8_t BOOLEAN_FALSE = 0xc2;
constexpr uint8_t BOOLEAN_TRUE = 0xc3;
constexpr uint8_t BIN8 = 0xc4;
constexpr uint8_t BIN16 = 0xc5;
constexpr uint8_t BIN32 = 0xc6;
constexpr uint8_t EXT8 = 0xc7;
constexpr uint8_t EXT16 = 0xc8;
constexpr uint8_t EXT32 = 0xc9;
constexpr uint8_t FLOAT32 = 0xca;
constexpr uint8_t FLOAT64 = 0xcb;
constexpr uint8_t UINT8 = 0xcc;
constexpr uint8_t UINT16 = 0xcd;
constexpr uint8_t UINT32 = 0xce;
constexpr uint8_t UINT64 = 0xcf;

constexpr uint8_t INT8 = 0xd0;
constexpr uint8_t INT16 = 0xd1;
constexpr uint8_t INT32 = 0xd2;
constexpr uint8_t INT64 = 0xd3;

constexpr uint8_t FIXEXT1 = 0xd4;
constexpr uint8_t FIXEXT2 = 0xd5;
constexpr uint8_t FIXEXT4 = 0xd6;
constexpr uint8_t FIXEXT8 = 0xd7;
constexpr uint8_t FIXEXT16 = 0xd8;

constexpr uint8_t STR8 = 0xd9;
constexpr uint8_t STR16 = 0xda;
constexpr uint8_t STR32 = 0xdb;

constexpr uint8_t ARRAY16 = 0xdc;
constexpr uint8_t ARRAY32 = 0xdd;

constexpr uint8_t MAP16 = 0xde;
constexpr uint8_t MAP32 = 0xdf;

constexpr uint8_t NEGFIXINT_PREFIX = 0xe0;

constexpr bool is_pos_fixint(uint8_t b) {
    return (b & POSFIXINT_MASK) == 0;
}

constexpr bool is_neg_fixint(uint8_t b) {
    return (b & 0xe0) == NEGFIXINT_PREFIX;
}

constexpr bool is_fixstr(uint8_t b) {
    return (b & 0xe0) == FIXSTR_PREFIX;
}

constexpr bool is_fixed_array(uint8_t b) {
    return (b & 0xf0) == FIXARRAY_PREFIX;
}

constexpr bool is_fixed_map(uint8_t b) {
    return (b & 0xf0) == FIXMAP_PREFIX;
}

} // namespace msgcodec::msgpack::code
