#include "record.h"
#include "constants.h"

#include <algorithm>

namespace dls {

static constexpr size_t VALUE_CHUNK = 64 * 1024;

bool write_record(std::ostream& out, uint64_t key, const uint8_t* value, uint64_t length) {
    uint8_t hdr[RECORD_HEADER_SIZE];
    put_u64_le(hdr, key);
    put_u64_le(hdr + FIELD_SIZE, length);
    out.write(reinterpret_cast<const char*>(hdr), sizeof(hdr));
    if (length) out.write(reinterpret_cast<const char*>(value), static_cast<std::streamsize>(length));
    return static_cast<bool>(out);
}

size_t RecordDecoder::read_field(uint8_t* buf, size_t n) {
    in_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(n));
    size_t got = static_cast<size_t>(in_.gcount());
    pos_ += got;
    if (in_.bad()) bad_ = true;
    return got;
}

uint64_t RecordDecoder::read_value(uint64_t length, std::vector<uint8_t>* value) {
    // Chunked so that a garbage length never turns into a huge allocation
    uint8_t chunk[VALUE_CHUNK];
    uint64_t total = 0;
    if (value) value->clear();
    while (total < length) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(VALUE_CHUNK, length - total));
        size_t got = read_field(chunk, want);
        if (value) value->insert(value->end(), chunk, chunk + got);
        total += got;
        if (got < want) break;
    }
    return total;
}

DecodeResult RecordDecoder::next(std::vector<uint8_t>* value) {
    DecodeResult r;
    r.offset = pos_;
    uint8_t buf[FIELD_SIZE];

    if (bad_) {
        r.status = DecodeStatus::UNREADABLE;
        r.field = DecodeField::KEY;
        return r;
    }

    size_t got = read_field(buf, FIELD_SIZE);
    if (bad_) {
        r.status = DecodeStatus::UNREADABLE;
        r.field = DecodeField::KEY;
        r.got = got;
        return r;
    }
    if (got == 0) {
        r.status = DecodeStatus::END;
        return r;
    }
    if (got < FIELD_SIZE) {
        r.status = DecodeStatus::MALFORMED;
        r.field = DecodeField::KEY;
        r.got = got;
        return r;
    }
    r.key = get_u64_le(buf);
    if (!range_.contains(r.key)) {
        r.status = DecodeStatus::OUT_OF_RANGE;
        r.field = DecodeField::KEY;
        return r;
    }

    got = read_field(buf, FIELD_SIZE);
    if (bad_ || got < FIELD_SIZE) {
        r.status = bad_ ? DecodeStatus::UNREADABLE : DecodeStatus::MALFORMED;
        r.field = DecodeField::LENGTH;
        r.got = got;
        return r;
    }
    r.length = get_u64_le(buf);

    uint64_t vgot = read_value(r.length, value);
    if (bad_ || vgot < r.length) {
        r.status = bad_ ? DecodeStatus::UNREADABLE : DecodeStatus::MALFORMED;
        r.field = DecodeField::VALUE;
        r.got = vgot;
        return r;
    }

    r.status = DecodeStatus::OK;
    return r;
}

}
