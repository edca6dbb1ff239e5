#pragma once
#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

#include "key_range.h"

namespace dls {

// On-disk record: [u64 key][u64 length][length bytes value], little-endian.
struct Record {
    uint64_t key = 0;
    std::vector<uint8_t> value;
};

inline void put_u64_le(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) p[i] = static_cast<uint8_t>(v >> (8 * i));
}

inline uint64_t get_u64_le(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
    return v;
}

// Append one encoded record. Returns false if the stream failed.
bool write_record(std::ostream& out, uint64_t key, const uint8_t* value, uint64_t length);
inline bool write_record(std::ostream& out, const Record& r) {
    return write_record(out, r.key, r.value.data(), r.value.size());
}

// =============================================================================
// Decoding
// =============================================================================

enum class DecodeStatus {
    OK,           // key in range, length and value read
    END,          // clean end of input: the key read returned no bytes
    OUT_OF_RANGE, // key decoded but outside the block's range; nothing else consumed
    MALFORMED,    // a field was shorter than expected
    UNREADABLE    // the stream itself failed; nothing further can be read
};

enum class DecodeField { NONE, KEY, LENGTH, VALUE };

struct DecodeResult {
    DecodeStatus status = DecodeStatus::END;
    DecodeField field = DecodeField::NONE;
    uint64_t offset = 0;  // where the attempt started
    uint64_t key = 0;
    uint64_t length = 0;
    uint64_t got = 0;     // bytes obtained for the failing field
};

// How a caller reacts to recoverable decode failures:
// STRICT_LOGGING warns and counts every one (consistency check),
// SILENT_SKIP drops them without a word (repair).
enum class DecodePolicy { STRICT_LOGGING, SILENT_SKIP };

// Reads records one at a time from a block file stream. An out-of-range key
// consumes only its own 8 bytes, so the next call re-tries the following
// word as a key.
class RecordDecoder {
public:
    RecordDecoder(std::istream& in, const KeyRange& range) : in_(in), range_(range) {}

    // With value == nullptr the value bytes are read and discarded.
    DecodeResult next(std::vector<uint8_t>* value);

private:
    // Returns bytes read; sets bad_ if the stream reported an I/O failure.
    size_t read_field(uint8_t* buf, size_t n);
    uint64_t read_value(uint64_t length, std::vector<uint8_t>* value);

    std::istream& in_;
    KeyRange range_;
    uint64_t pos_ = 0;
    bool bad_ = false;
};

}
