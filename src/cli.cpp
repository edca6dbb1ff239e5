#include "cli.h"
#include "block_filter.h"
#include "channel_walker.h"
#include "config.h"
#include "constants.h"
#include "logging.h"
#include "size_checker.h"
#include "size_generator.h"
#include "size_info.h"

namespace dls {

// ============================================================================
// Usage and argument parsing
// ============================================================================

void print_usage(std::ostream& os) {
    os << R"(
dls-audit - DLS channel consistency & size info tool

USAGE:
  dls-audit <mode> [options]

MODES (exactly one):
  -c, --consistency-check PATH  Check block files for consistency. PATH is a
                                channel directory or a single block file; a
                                single file must be given with its slot
                                directory so its key range can be derived
  -R, --repair PATH             Repair files the consistency check finds
                                errors in (original kept as <file>.broken)
  -s, --size-check PATH         Check that PATH/sizeinfo matches the channel
  -g, --generate PATH           Generate the size info of the channel at PATH
  -r, --read SIZEINFO           Read the size info from a SIZEINFO file

OPTIONS:
  -w, --write SIZEINFO          Write the generated/read size info to SIZEINFO
  -a, --add-from SIZEINFO       Add the contents of SIZEINFO to the
                                generated/read size info
  -f, --block-filter FILTER     Only process files matching FILTER: an operator
                                (< <= > >= == !=) and an integer, compared with
                                the slot and file names read as one hex number.
                                "> 0x52123" matches chan/0000000052/125 but not
                                chan/0000000052/123
  --conf=<path>                 Configuration file (key=value format)
  --log-file=<path>             Also append log lines to <path>
  -v, --verbose                 Debug logging
  -h, --help                    Show this help

EXIT CODES:
  0 success, 1 size mismatch or size info error, 2 usage error,
  3 single block file whose key range cannot be derived,
  4 single block file that cannot be opened

)";
}

// Accepts "-x VALUE", "--long VALUE" and "--long=VALUE".
static bool take_value(const std::vector<std::string>& args, size_t& i,
                       const char* shrt, const char* lng,
                       std::string& out, bool& bad, std::ostream& err) {
    const std::string& arg = args[i];
    std::string l(lng);
    if (arg.rfind(l + "=", 0) == 0) {
        out = arg.substr(l.size() + 1);
        return true;
    }
    if (arg == shrt || arg == l) {
        if (i + 1 >= args.size()) {
            err << "ERROR: " << arg << " requires a value\n";
            bad = true;
            return true;
        }
        out = args[++i];
        return true;
    }
    return false;
}

bool parse_cli_args(const std::vector<std::string>& args, CliArgs& a, std::ostream& err) {
    bool bad = false;
    for (size_t i = 0; i < args.size() && !bad; ++i) {
        const std::string& arg = args[i];

        if (take_value(args, i, "-c", "--consistency-check", a.check_path, bad, err)) continue;
        if (take_value(args, i, "-R", "--repair", a.repair_path, bad, err)) continue;
        if (take_value(args, i, "-s", "--size-check", a.size_check_path, bad, err)) continue;
        if (take_value(args, i, "-g", "--generate", a.generate_path, bad, err)) continue;
        if (take_value(args, i, "-r", "--read", a.read_path, bad, err)) continue;
        if (take_value(args, i, "-w", "--write", a.write_path, bad, err)) continue;
        if (take_value(args, i, "-a", "--add-from", a.add_from, bad, err)) continue;
        if (take_value(args, i, "-f", "--block-filter", a.block_filter, bad, err)) {
            a.have_filter = true;
            continue;
        }

        if (arg.rfind("--conf=", 0) == 0) {
            a.conf = arg.substr(7);
        } else if (arg.rfind("--log-file=", 0) == 0) {
            a.log_file = arg.substr(11);
        } else if (arg == "--verbose" || arg == "-v") {
            a.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            a.help = true;
        } else {
            err << "ERROR: Unknown argument: " << arg << "\n";
            bad = true;
        }
    }
    return !bad;
}

// ============================================================================
// Commands
// ============================================================================

static int cmd_consistency(const std::string& path, const WalkOptions& opts, std::ostream& out) {
    ConsistencyChecker checker(opts, out);
    int rc = checker.check(path);
    if (opts.repair && (checker.repaired_files() || checker.failed_repairs())) {
        LOG_REPAIR(logging::Level::INFO, path + ": " + std::to_string(checker.repaired_files()) +
                   " files repaired, " + std::to_string(checker.failed_repairs()) +
                   " repairs failed");
    }
    return rc;
}

static int cmd_size_check(const std::string& path, const Config& cfg, const BlockFilter& filter,
                          std::ostream& out) {
    SizeChecker checker(filter, cfg.archive_suffix, cfg.sizeinfo_name, out);
    try {
        return checker.check(path);
    } catch (const SizeScanError& e) {
        LOG_SIZEINFO(logging::Level::ERROR, std::string("size check failed: ") + e.what());
    } catch (const SizeInfoError& e) {
        LOG_SIZEINFO(logging::Level::ERROR, std::string("size check failed: ") + e.what());
    }
    return EXIT_SIZE_MISMATCH;
}

static int cmd_size_info(const CliArgs& a, const Config& cfg, const BlockFilter& filter,
                         std::ostream& out) {
    try {
        SizeInfo info;
        if (!a.generate_path.empty()) {
            SizeGenerator gen(filter, cfg.archive_suffix, out);
            info = gen.generate(a.generate_path);
        } else {
            info = read_size_info(a.read_path);
        }

        if (!a.add_from.empty()) {
            info = info + read_size_info(a.add_from);
        }

        if (!a.write_path.empty()) {
            write_size_info(a.write_path, info);
        }
        out << info << "\n" << std::flush;
        return EXIT_OK;
    } catch (const SizeScanError& e) {
        LOG_SIZEINFO(logging::Level::ERROR, e.what());
    } catch (const SizeInfoError& e) {
        LOG_SIZEINFO(logging::Level::ERROR, e.what());
    }
    return EXIT_SIZE_MISMATCH;
}

// ============================================================================
// Entry
// ============================================================================

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    CliArgs a;
    if (!parse_cli_args(args, a, err)) {
        print_usage(err);
        return EXIT_USAGE;
    }
    if (a.help) {
        print_usage(out);
        return EXIT_OK;
    }
    if (a.modes() != 1) {
        err << "ERROR: exactly one of -c, -R, -s, -g, -r is required\n";
        print_usage(err);
        return EXIT_USAGE;
    }

    Config cfg;
    try {
        if (!a.conf.empty()) load_config(a.conf, cfg);
    } catch (const ConfigError& e) {
        LOG_CONFIG(logging::Level::ERROR, e.what());
        return EXIT_USAGE;
    }
    if (a.have_filter) cfg.block_filter = a.block_filter;
    if (!a.log_file.empty()) cfg.log_file = a.log_file;
    if (a.verbose) cfg.log_level = logging::Level::DEBUG;

    std::string log_err;
    if (!apply_logging_config(cfg, log_err)) {
        LOG_CONFIG(logging::Level::ERROR, log_err);
        return EXIT_USAGE;
    }
    if (!a.conf.empty()) LOG_CONFIG(logging::Level::DEBUG, "loaded " + a.conf);

    BlockFilter filter;
    if (!cfg.block_filter.empty()) {
        try {
            filter = BlockFilter::parse(cfg.block_filter);
        } catch (const BlockFilterError& e) {
            LOG_FILTER(logging::Level::ERROR, e.what());
            return EXIT_USAGE;
        }
        LOG_FILTER(logging::Level::DEBUG, "processing only blocks with key " + filter.text());
    }

    if (!a.check_path.empty() || !a.repair_path.empty()) {
        WalkOptions opts;
        opts.repair = !a.repair_path.empty();
        opts.filter = filter;
        opts.archive_suffix = cfg.archive_suffix;
        opts.progress_interval_ms = cfg.progress_interval_ms;
        return cmd_consistency(opts.repair ? a.repair_path : a.check_path, opts, out);
    }

    if (!a.size_check_path.empty()) {
        return cmd_size_check(a.size_check_path, cfg, filter, out);
    }

    return cmd_size_info(a, cfg, filter, out);
}

}
