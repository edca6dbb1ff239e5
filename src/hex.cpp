#include "hex.h"

#include <cctype>

namespace dls {

static inline int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
}

bool parse_hex_u64(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        int d = hex_val(c);
        if (d < 0) return false;
        if (v >> 60) return false;  // next shift would drop bits
        v = (v << 4) | static_cast<uint64_t>(d);
    }
    out = v;
    return true;
}

bool parse_int_literal(const std::string& s, uint64_t& out) {
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        return parse_hex_u64(s.substr(2), out);
    }
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

std::string to_hex_digits(uint64_t v, size_t digits) {
    static const char* hex = "0123456789abcdef";
    std::string s(digits, '0');
    for (size_t i = 0; i < digits && v; ++i) {
        s[digits - 1 - i] = hex[v & 0xF];
        v >>= 4;
    }
    return s;
}

std::string format_key(uint64_t key) {
    return "0x" + to_hex_digits(key, 16);
}

}
