#pragma once
#include <string>

#include "size_generator.h"
#include "size_info.h"

namespace dls {

struct SizeAudit {
    bool match = false;
    SizeInfo expected;  // freshly generated
    SizeInfo current;   // read from the sidecar
    SizeInfo diff() const { return expected - current; }
};

// Compares a channel's sidecar against a fresh trusted scan.
class SizeChecker {
public:
    SizeChecker(const BlockFilter& filter, const std::string& archive_suffix,
                const std::string& sizeinfo_name, std::ostream& out = std::cout)
        : filter_(filter), archive_suffix_(archive_suffix), sizeinfo_name_(sizeinfo_name), out_(out) {}

    // Throws SizeScanError / SizeInfoError when either side cannot be obtained.
    SizeAudit audit(const std::string& channel) const;

    // Silent on match; logs expected, current and diff on mismatch.
    // Returns EXIT_OK or EXIT_SIZE_MISMATCH.
    int check(const std::string& channel) const;

    std::string sidecar_path(const std::string& channel) const;

private:
    BlockFilter filter_;
    std::string archive_suffix_;
    std::string sizeinfo_name_;
    std::ostream& out_;
};

// "<path>: expected=[..] current=[..] (diff=[..])"
std::string format_mismatch(const std::string& channel, const SizeAudit& a);

}
