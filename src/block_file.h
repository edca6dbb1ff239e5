#pragma once
#include <cstdint>
#include <functional>
#include <istream>
#include <string>

#include "key_range.h"
#include "record.h"

namespace dls {

struct CheckResult {
    uint64_t records_read = 0;
    uint64_t errors = 0;
    bool aborted = false;     // the stream became unreadable before end of file
    bool unopenable = false;  // the file could not be opened at all; nothing was scanned
};

// Drive a RecordDecoder over one stream under the given policy, handing every
// valid in-range record to `sink` (may be empty). `name` is used in warnings.
CheckResult scan_block_stream(std::istream& in, const std::string& name, const KeyRange& range,
                              DecodePolicy policy,
                              const std::function<bool(const Record&)>& sink);

// Consistency check of one block file. Corrupt regions are warned about,
// counted and skipped. A file that cannot be opened is reported through
// `unopenable` with no records and no errors; the caller decides.
CheckResult check_block_file(const std::string& path, const KeyRange& range);

struct RepairResult {
    bool ok = false;
    uint64_t records_written = 0;
    std::string broken_path;  // where the pre-repair content now lives
};

// Rewrite a block file keeping only valid, in-range records in their original
// order. The original is renamed to <path>.broken (or the next free
// <path>.broken.N) and never deleted. On failure the original is left in place
// and err describes what went wrong.
RepairResult repair_block_file(const std::string& path, const KeyRange& range, std::string& err);

// Move path aside to the first free <path>.broken[.N] and put `repaired` in
// its place with path's permissions. If the second rename fails the original
// is renamed back; broken_path is set only when the original ends up there.
bool swap_repaired_file(const std::string& path, const std::string& repaired,
                        std::string& broken_path, std::string& err);

// First name in <path>.broken, <path>.broken.1, ... that does not exist yet.
std::string free_broken_path(const std::string& path);

}
