#pragma once
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "block_file.h"
#include "block_filter.h"
#include "constants.h"
#include "key_range.h"

namespace dls {

// One candidate block file inside a channel: <channel>/<dirname>/<fname>
struct BlockEntry {
    std::string path;
    std::string dirname;
    std::string fname;
};

// Slot directories of a channel, sorted by name. Plain files (such as the
// sidecar) are not returned.
std::vector<std::string> list_slot_dirs(const std::string& channel);

// Regular files of one slot directory, sorted by name, without the ones
// carrying the archive suffix.
std::vector<BlockEntry> list_block_files(const std::string& slot_dir,
                                         const std::string& archive_suffix);

// Evaluate the filter for one block key, echoing "<key> <filter> TRUE|FALSE"
// to out when the filter is active.
bool filter_admits(const BlockFilter& filter, uint64_t key, std::ostream& out);

struct WalkOptions {
    bool repair = false;
    BlockFilter filter;
    std::string archive_suffix = DLS_ARCHIVE_SUFFIX;
    uint64_t progress_interval_ms = DLS_PROGRESS_INTERVAL_MS;
};

struct WalkTotals {
    uint64_t files = 0;
    uint64_t files_with_errors = 0;
    uint64_t records = 0;
    uint64_t errors = 0;

    WalkTotals& operator+=(const WalkTotals& o) {
        files += o.files;
        files_with_errors += o.files_with_errors;
        records += o.records;
        errors += o.errors;
        return *this;
    }

    double error_file_pct() const {
        return files ? 100.0 * static_cast<double>(files_with_errors) / static_cast<double>(files) : 0.0;
    }
};

// Consistency check (and optional repair) over a channel directory or a
// single block file. Report lines go to `out`, diagnostics to the logger.
class ConsistencyChecker {
public:
    explicit ConsistencyChecker(const WalkOptions& opts, std::ostream& out = std::cout)
        : opts_(opts), out_(out) {}

    // EXIT_OK; for a single file EXIT_UNRESOLVABLE when it has no usable key
    // range and EXIT_UNOPENABLE when it cannot be opened.
    int check(const std::string& path);

    WalkTotals process_dir(const std::string& dir);

    // Validate one file; in repair mode rewrite it if the check found errors.
    // Returns the checked (or, after repair, written) record count and errors.
    // An unopenable file is returned as such and never repaired.
    CheckResult process_file(const std::string& path, const KeyRange& range);

    const WalkTotals& totals() const { return totals_; }
    uint64_t repaired_files() const { return repaired_; }
    uint64_t failed_repairs() const { return failed_repairs_; }

private:
    WalkOptions opts_;
    std::ostream& out_;
    WalkTotals totals_;
    uint64_t repaired_ = 0;
    uint64_t failed_repairs_ = 0;
};

}
