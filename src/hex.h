#pragma once
#include <cstdint>
#include <string>

namespace dls {

// Parse a bare run of hex digits (no prefix, no sign). Returns false on an
// empty string, a non-hex character, or a value that does not fit 64 bits.
bool parse_hex_u64(const std::string& s, uint64_t& out);

// Parse an integer literal: decimal, or hexadecimal with a 0x/0X prefix.
bool parse_int_literal(const std::string& s, uint64_t& out);

// "0x%016x"
std::string format_key(uint64_t key);

// Lower-case, zero padded to `digits`.
std::string to_hex_digits(uint64_t v, size_t digits);

}
