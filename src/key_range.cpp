#include "key_range.h"
#include "constants.h"
#include "hex.h"
#include "logging.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace dls {

static bool check_hex_name(const std::string& path, const char* type,
                           const std::string& name, size_t length) {
    if (name.size() != length) {
        log_warn(path + ": the " + type + " name '" + name + "' should have length " +
                 std::to_string(length));
    }
    uint64_t ignored = 0;
    if (name.size() > TOTAL_DIGITS || !parse_hex_u64(name, ignored)) {
        log_warn(path + ": the " + type + " name '" + name + "' is not a valid base 16 number");
        return false;
    }
    return true;
}

std::optional<KeyRange> resolve_key_range(const std::string& path) {
    fs::path p(path);
    std::string fname = p.filename().string();
    std::string dirname = p.parent_path().filename().string();
    if (fname.empty() || dirname.empty() || dirname == "." || dirname == "..") {
        log_warn(path + ": the path must include the directory to check the range");
        return std::nullopt;
    }

    bool ok = true;
    ok &= check_hex_name(path, "directory", dirname, SLOT_DIGITS);
    ok &= check_hex_name(path, "file", fname, BUCKET_DIGITS);
    if (!ok) return std::nullopt;

    std::string digits = dirname + fname + std::string(KEY_DIGITS, '0');
    if (digits.size() > TOTAL_DIGITS) {
        log_warn(path + ": key prefix " + dirname + fname + " does not fit in 64 bits");
        return std::nullopt;
    }

    KeyRange r;
    if (!parse_hex_u64(digits, r.min_key)) return std::nullopt;
    r.max_key = r.min_key + BLOCK_KEY_MASK;
    return r;
}

bool block_key(const std::string& dirname, const std::string& filename, uint64_t& out) {
    return parse_hex_u64(dirname + filename, out);
}

std::string block_path_for_key(uint64_t key) {
    uint64_t slot = key >> ((BUCKET_DIGITS + KEY_DIGITS) * 4);
    uint64_t bucket = (key >> (KEY_DIGITS * 4)) & ((1ull << (BUCKET_DIGITS * 4)) - 1);
    return to_hex_digits(slot, SLOT_DIGITS) + "/" + to_hex_digits(bucket, BUCKET_DIGITS);
}

}
