#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace dls {

struct KeyRange {
    uint64_t min_key = 0;
    uint64_t max_key = 0;

    bool contains(uint64_t key) const { return key >= min_key && key <= max_key; }
};

// Derive the key range a block file is responsible for from the last two
// components of its path: <slot dir>/<bucket file>. Returns nullopt (after
// logging a warning) when the path has fewer than two components, when either
// component is not hexadecimal, or when the combined key does not fit 64 bits.
// A wrong component length is only warned about.
std::optional<KeyRange> resolve_key_range(const std::string& path);

// Integer value of the hex concatenation dir + file, as used by block filters.
bool block_key(const std::string& dirname, const std::string& filename, uint64_t& out);

// Inverse mapping: where a key is stored, relative to the channel directory.
std::string block_path_for_key(uint64_t key);

}
