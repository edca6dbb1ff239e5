#pragma once
#include <iostream>
#include <istream>
#include <stdexcept>
#include <string>

#include "block_filter.h"
#include "constants.h"
#include "size_info.h"

namespace dls {

class SizeScanError : public std::runtime_error {
public:
    explicit SizeScanError(const std::string& msg) : std::runtime_error(msg) {}
};

// Computes a channel's SizeInfo by a fast scan that trusts the files: keys are
// not range checked and values are skipped without being read. A record cut
// short anywhere raises SizeScanError.
class SizeGenerator {
public:
    explicit SizeGenerator(const BlockFilter& filter = BlockFilter(),
                           const std::string& archive_suffix = DLS_ARCHIVE_SUFFIX,
                           std::ostream& out = std::cout)
        : filter_(filter), archive_suffix_(archive_suffix), out_(out) {}

    // Scan every slot directory of the channel and return the accumulated total.
    SizeInfo generate(const std::string& channel);

    void process_dir(const std::string& dir);

    // Add a single block file, bypassing naming checks and the filter.
    void add_file(const std::string& path);

    const SizeInfo& info() const { return info_; }
    uint64_t files() const { return files_; }

private:
    BlockFilter filter_;
    std::string archive_suffix_;
    std::ostream& out_;
    SizeInfo info_;
    uint64_t files_ = 0;
};

// Size of the records in one stream. `name` is used in error messages.
SizeInfo scan_sizes(std::istream& in, const std::string& name);

}
