#include "size_checker.h"
#include "constants.h"
#include "logging.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace dls {

std::string SizeChecker::sidecar_path(const std::string& channel) const {
    return (fs::path(channel) / sizeinfo_name_).string();
}

SizeAudit SizeChecker::audit(const std::string& channel) const {
    SizeAudit a;
    SizeGenerator gen(filter_, archive_suffix_, out_);
    a.expected = gen.generate(channel);
    a.current = read_size_info(sidecar_path(channel));
    a.match = (a.expected == a.current);
    return a;
}

std::string format_mismatch(const std::string& channel, const SizeAudit& a) {
    return channel + ": expected=[" + a.expected.to_string() + "] current=[" +
           a.current.to_string() + "] (diff=[" + a.diff().to_signed_string() + "])";
}

int SizeChecker::check(const std::string& channel) const {
    SizeAudit a = audit(channel);
    if (a.match) return EXIT_OK;
    LOG_SIZEINFO(logging::Level::ERROR, format_mismatch(channel, a));
    return EXIT_SIZE_MISMATCH;
}

}
