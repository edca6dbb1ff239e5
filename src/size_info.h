#pragma once
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace dls {

class SizeInfoError : public std::runtime_error {
public:
    explicit SizeInfoError(const std::string& msg) : std::runtime_error(msg) {}
};

// Aggregate record count and payload bytes of a channel or part of one.
// Arithmetic is component-wise and wraps modulo 2^64.
class SizeInfo {
public:
    constexpr SizeInfo() = default;
    constexpr SizeInfo(uint64_t records, uint64_t size) : records_(records), size_(size) {}

    constexpr uint64_t records() const { return records_; }
    constexpr uint64_t size() const { return size_; }

    // One more record of `length` value bytes.
    constexpr SizeInfo with_record(uint64_t length) const {
        return SizeInfo(records_ + 1, size_ + length);
    }

    friend constexpr SizeInfo operator+(const SizeInfo& a, const SizeInfo& b) {
        return SizeInfo(a.records_ + b.records_, a.size_ + b.size_);
    }
    friend constexpr SizeInfo operator-(const SizeInfo& a, const SizeInfo& b) {
        return SizeInfo(a.records_ - b.records_, a.size_ - b.size_);
    }
    friend constexpr bool operator==(const SizeInfo& a, const SizeInfo& b) {
        return a.records_ == b.records_ && a.size_ == b.size_;
    }
    friend constexpr bool operator!=(const SizeInfo& a, const SizeInfo& b) {
        return !(a == b);
    }

    // "records=<r> size=<s>"
    std::string to_string() const;
    // Same, with both components read as signed; used for differences.
    std::string to_signed_string() const;

private:
    uint64_t records_ = 0;
    uint64_t size_ = 0;
};

std::ostream& operator<<(std::ostream& os, const SizeInfo& info);

// Sidecar codec: exactly [u64 records][u64 size], little-endian.
void encode_size_info(const SizeInfo& info, uint8_t out[16]);
SizeInfo decode_size_info(const uint8_t in[16]);

// Throws SizeInfoError when the file cannot be opened or holds fewer than 16 bytes.
SizeInfo read_size_info(const std::string& path);
// Truncates and rewrites path. Throws SizeInfoError on failure.
void write_size_info(const std::string& path, const SizeInfo& info);

}
