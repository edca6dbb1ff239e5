#include "size_info.h"
#include "constants.h"
#include "record.h"

#include <fstream>

namespace dls {

std::string SizeInfo::to_string() const {
    return "records=" + std::to_string(records_) + " size=" + std::to_string(size_);
}

std::string SizeInfo::to_signed_string() const {
    return "records=" + std::to_string(static_cast<int64_t>(records_)) +
           " size=" + std::to_string(static_cast<int64_t>(size_));
}

std::ostream& operator<<(std::ostream& os, const SizeInfo& info) {
    return os << info.to_string();
}

void encode_size_info(const SizeInfo& info, uint8_t out[16]) {
    put_u64_le(out, info.records());
    put_u64_le(out + FIELD_SIZE, info.size());
}

SizeInfo decode_size_info(const uint8_t in[16]) {
    return SizeInfo(get_u64_le(in), get_u64_le(in + FIELD_SIZE));
}

SizeInfo read_size_info(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw SizeInfoError("cannot open size info file " + path);

    uint8_t buf[SIZEINFO_FILE_SIZE];
    f.read(reinterpret_cast<char*>(buf), sizeof(buf));
    if (static_cast<size_t>(f.gcount()) != sizeof(buf)) {
        throw SizeInfoError(path + ": size info file is truncated (" +
                            std::to_string(f.gcount()) + " of " +
                            std::to_string(sizeof(buf)) + " bytes)");
    }
    return decode_size_info(buf);
}

void write_size_info(const std::string& path, const SizeInfo& info) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw SizeInfoError("cannot open size info file " + path + " for writing");

    uint8_t buf[SIZEINFO_FILE_SIZE];
    encode_size_info(info, buf);
    f.write(reinterpret_cast<const char*>(buf), sizeof(buf));
    f.flush();
    if (!f) throw SizeInfoError("error writing size info file " + path);
}

}
