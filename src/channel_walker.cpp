#include "channel_walker.h"
#include "logging.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>

namespace fs = std::filesystem;

namespace dls {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> list_slot_dirs(const std::string& channel) {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::directory_iterator it(channel, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_directory(sec)) out.push_back(it->path().string());
    }
    if (ec) log_warn(channel + ": cannot list directory: " + ec.message());
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<BlockEntry> list_block_files(const std::string& slot_dir,
                                         const std::string& archive_suffix) {
    std::vector<BlockEntry> out;
    std::string dirname = fs::path(slot_dir).filename().string();
    std::error_code ec;
    for (fs::directory_iterator it(slot_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (!it->is_regular_file(sec)) continue;
        std::string fname = it->path().filename().string();
        if (!archive_suffix.empty() && ends_with(fname, archive_suffix)) continue;
        out.push_back({it->path().string(), dirname, fname});
    }
    if (ec) log_warn(slot_dir + ": cannot list directory: " + ec.message());
    std::sort(out.begin(), out.end(),
              [](const BlockEntry& a, const BlockEntry& b) { return a.fname < b.fname; });
    return out;
}

bool filter_admits(const BlockFilter& filter, uint64_t key, std::ostream& out) {
    if (!filter.active()) return true;
    bool ok = filter.matches(key);
    out << key << " " << filter.text() << " " << (ok ? "TRUE" : "FALSE") << "\n" << std::flush;
    return ok;
}

int ConsistencyChecker::check(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        auto range = resolve_key_range(path);
        if (!range) return EXIT_UNRESOLVABLE;
        CheckResult r = process_file(path, *range);
        if (r.unopenable) {
            LOG_SCAN(logging::Level::ERROR, path + ": cannot open file");
            return EXIT_UNOPENABLE;
        }
        totals_.files = 1;
        totals_.files_with_errors = r.errors ? 1 : 0;
        totals_.records = r.records_read;
        totals_.errors = r.errors;
        out_ << path << ": " << r.records_read << " records processed, "
             << r.errors << " errors\n" << std::flush;
        return EXIT_OK;
    }

    for (const auto& dir : list_slot_dirs(path)) {
        totals_ += process_dir(dir);
    }
    out_ << path << ": " << totals_.files << " files processed, "
         << totals_.files_with_errors << " files with errors ("
         << std::fixed << std::setprecision(2) << totals_.error_file_pct() << "%), "
         << totals_.records << " records processed in total ("
         << totals_.errors << " errors)\n" << std::flush;
    return EXIT_OK;
}

WalkTotals ConsistencyChecker::process_dir(const std::string& dir) {
    using clock = std::chrono::steady_clock;
    WalkTotals t;
    auto last_emit = clock::now();
    const auto interval = std::chrono::milliseconds(opts_.progress_interval_ms);

    for (const auto& e : list_block_files(dir, opts_.archive_suffix)) {
        auto range = resolve_key_range(e.path);
        if (!range) {
            LOG_SCAN(logging::Level::WARN, e.path + ": skipped");
            continue;
        }
        uint64_t key = 0;
        if (!block_key(e.dirname, e.fname, key)) {
            LOG_SCAN(logging::Level::WARN, e.path + ": skipped");
            continue;
        }
        if (!filter_admits(opts_.filter, key, out_)) continue;

        CheckResult r = process_file(e.path, *range);
        if (r.unopenable) {
            LOG_SCAN(logging::Level::WARN, e.path + ": skipped, cannot open file");
            continue;
        }
        t.records += r.records_read;
        t.errors += r.errors;
        t.files++;
        if (r.errors > 0) t.files_with_errors++;

        auto now = clock::now();
        if (now - last_emit > interval) {
            out_ << e.path << ": processing... (" << t.files << " files done)\n" << std::flush;
            last_emit = now;
        }
    }
    return t;
}

CheckResult ConsistencyChecker::process_file(const std::string& path, const KeyRange& range) {
    CheckResult r = check_block_file(path, range);
    if (r.unopenable || r.errors == 0 || !opts_.repair) return r;

    std::string err;
    RepairResult rep = repair_block_file(path, range, err);
    if (!rep.ok) {
        LOG_REPAIR(logging::Level::ERROR, path + ": repair failed: " + err);
        ++failed_repairs_;
        return r;
    }
    ++repaired_;
    r.records_read = rep.records_written;
    return r;
}

}
