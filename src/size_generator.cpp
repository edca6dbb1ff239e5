#include "size_generator.h"
#include "channel_walker.h"
#include "key_range.h"
#include "logging.h"
#include "record.h"

#include <fstream>

namespace dls {

SizeInfo scan_sizes(std::istream& in, const std::string& name) {
    SizeInfo info;
    uint8_t hdr[RECORD_HEADER_SIZE];
    uint64_t off = 0;

    in.seekg(0, std::ios::end);
    const std::streamoff end_pos = in.tellg();
    in.seekg(0, std::ios::beg);
    if (end_pos < 0 || !in) throw SizeScanError(name + ": cannot determine file size");
    const uint64_t file_size = static_cast<uint64_t>(end_pos);

    while (off < file_size) {
        in.read(reinterpret_cast<char*>(hdr), sizeof(hdr));
        if (static_cast<size_t>(in.gcount()) != sizeof(hdr)) {
            throw SizeScanError(name + ": truncated record header at offset " + std::to_string(off));
        }
        uint64_t length = get_u64_le(hdr + FIELD_SIZE);
        off += sizeof(hdr);
        if (length > file_size - off) {
            throw SizeScanError(name + ": value of " + std::to_string(length) +
                                " bytes at offset " + std::to_string(off) +
                                " runs past end of file (" + std::to_string(file_size) + " bytes)");
        }
        in.seekg(static_cast<std::streamoff>(length), std::ios::cur);
        if (!in) throw SizeScanError(name + ": seek failed at offset " + std::to_string(off));
        off += length;
        info = info.with_record(length);
    }
    return info;
}

void SizeGenerator::add_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw SizeScanError("cannot open " + path);
    info_ = info_ + scan_sizes(f, path);
    ++files_;
}

void SizeGenerator::process_dir(const std::string& dir) {
    for (const auto& e : list_block_files(dir, archive_suffix_)) {
        uint64_t key = 0;
        if (!block_key(e.dirname, e.fname, key)) {
            LOG_SIZEINFO(logging::Level::WARN, e.dirname + e.fname +
                         ": file name format unrecognized, not in hexa, skipping");
            continue;
        }
        if (!filter_admits(filter_, key, out_)) continue;
        add_file(e.path);
    }
}

SizeInfo SizeGenerator::generate(const std::string& channel) {
    for (const auto& dir : list_slot_dirs(channel)) {
        process_dir(dir);
    }
    LOG_SIZEINFO(logging::Level::DEBUG, channel + ": " + std::to_string(files_) +
                 " block files, " + info_.to_string());
    return info_;
}

}
