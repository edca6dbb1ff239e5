#include "block_file.h"
#include "constants.h"
#include "hex.h"
#include "logging.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace dls {

static const char* field_name(DecodeField f) {
    switch (f) {
        case DecodeField::KEY:    return "key";
        case DecodeField::LENGTH: return "value length";
        case DecodeField::VALUE:  return "value";
        default:                  return "record";
    }
}

static void warn_decode(const std::string& name, const DecodeResult& r,
                        uint64_t records_read, uint64_t last_key) {
    std::string msg = name + ": ";
    switch (r.status) {
        case DecodeStatus::OUT_OF_RANGE:
            msg += "key " + format_key(r.key) + " out of range at offset " +
                   std::to_string(r.offset) + ", " + std::to_string(records_read) +
                   " records read already";
            break;
        case DecodeStatus::MALFORMED:
            msg += std::string("error reading ") + field_name(r.field) + " at offset " +
                   std::to_string(r.offset) + " (got " + std::to_string(r.got) + " bytes";
            if (r.field == DecodeField::VALUE) msg += " of " + std::to_string(r.length);
            msg += ") after successfully reading " + std::to_string(records_read) +
                   " records (last read key was " + format_key(last_key) + ")";
            break;
        case DecodeStatus::UNREADABLE:
            msg += std::string("I/O error reading ") + field_name(r.field) + " at offset " +
                   std::to_string(r.offset) + ", skipping rest of file after successfully reading " +
                   std::to_string(records_read) + " records (last read key was " +
                   format_key(last_key) + ")";
            break;
        default:
            return;
    }
    LOG_SCAN(logging::Level::WARN, msg);
}

CheckResult scan_block_stream(std::istream& in, const std::string& name, const KeyRange& range,
                              DecodePolicy policy,
                              const std::function<bool(const Record&)>& sink) {
    CheckResult res;
    RecordDecoder dec(in, range);
    Record rec;
    uint64_t last_key = 0;

    while (true) {
        DecodeResult r = dec.next(sink ? &rec.value : nullptr);
        if (r.status == DecodeStatus::END) break;

        if (r.status == DecodeStatus::OK) {
            last_key = r.key;
            if (sink) {
                rec.key = r.key;
                if (!sink(rec)) {
                    res.aborted = true;
                    break;
                }
            }
            ++res.records_read;
            continue;
        }

        ++res.errors;
        if (policy == DecodePolicy::STRICT_LOGGING) {
            warn_decode(name, r, res.records_read, last_key);
        }
        if (r.status == DecodeStatus::UNREADABLE) {
            res.aborted = true;
            break;
        }
        // OUT_OF_RANGE and MALFORMED: resume at the next word
    }
    return res;
}

CheckResult check_block_file(const std::string& path, const KeyRange& range) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        CheckResult res;
        res.unopenable = true;
        return res;
    }
    return scan_block_stream(f, path, range, DecodePolicy::STRICT_LOGGING, nullptr);
}

std::string free_broken_path(const std::string& path) {
    std::string candidate = path + DLS_BROKEN_SUFFIX;
    std::error_code ec;
    for (int n = 1; fs::exists(candidate, ec); ++n) {
        candidate = path + DLS_BROKEN_SUFFIX + "." + std::to_string(n);
    }
    return candidate;
}

bool swap_repaired_file(const std::string& path, const std::string& repaired,
                        std::string& broken_path, std::string& err) {
    std::error_code ec;
    broken_path.clear();

    // The rewritten file takes over the original's mode bits
    const fs::perms mode = fs::status(path, ec).permissions();
    if (!ec) fs::permissions(repaired, mode, ec);
    if (ec) {
        err = "cannot copy permissions of " + path + " to " + repaired + ": " + ec.message();
        return false;
    }

    const std::string broken = free_broken_path(path);
    fs::rename(path, broken, ec);
    if (ec) {
        err = "cannot rename " + path + " to " + broken + ": " + ec.message();
        return false;
    }
    fs::rename(repaired, path, ec);
    if (ec) {
        err = "cannot rename " + repaired + " to " + path + ": " + ec.message();
        std::error_code back;
        fs::rename(broken, path, back);
        if (back) {
            broken_path = broken;
            err += " (original kept at " + broken + ")";
        }
        return false;
    }
    broken_path = broken;
    return true;
}

RepairResult repair_block_file(const std::string& path, const KeyRange& range, std::string& err) {
    RepairResult res;
    const std::string tmp_path = path + DLS_REPAIRING_SUFFIX;
    std::error_code ec;

    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            err = "cannot open " + path;
            return res;
        }
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            err = "cannot create " + tmp_path;
            return res;
        }

        CheckResult scan = scan_block_stream(in, path, range, DecodePolicy::SILENT_SKIP,
            [&out](const Record& r) { return write_record(out, r); });
        out.flush();

        if (scan.aborted || !out) {
            out.close();
            fs::remove(tmp_path, ec);
            err = scan.aborted && out ? "read error while repairing " + path
                                      : "write error on " + tmp_path;
            return res;
        }
        res.records_written = scan.records_read;
    }

    if (!swap_repaired_file(path, tmp_path, res.broken_path, err)) {
        fs::remove(tmp_path, ec);
        return res;
    }

    LOG_REPAIR(logging::Level::DEBUG, path + ": repaired, " + std::to_string(res.records_written) +
               " records kept, original moved to " + res.broken_path);
    res.ok = true;
    return res;
}

}
