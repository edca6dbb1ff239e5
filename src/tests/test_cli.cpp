// test_cli.cpp - dls-audit command line: mode selection, options, exit codes

#include "test_framework.h"
#include "test_util.h"
#include "../cli.h"
#include "../constants.h"
#include "../size_info.h"

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace dls {
namespace test {

DLS_TEST_SUITE(Cli);

// chan/0000000052/125  2 records, 10 + 20 bytes
// chan/0000000052/126  1 record, 0 bytes
// chan/0000000053/000  1 record, 5 bytes
static fs::path make_cli_channel(const std::string& name) {
    fs::path chan = temp_dir(name);
    BlockBuilder a;
    a.record(0x0000000052125000ull, 10, 1).record(0x0000000052125001ull, 20, 2);
    a.write(chan / "0000000052" / "125");

    BlockBuilder b;
    b.record(0x0000000052126000ull, 0, 0);
    b.write(chan / "0000000052" / "126");

    BlockBuilder c;
    c.record(0x0000000053000000ull, 5, 3);
    c.write(chan / "0000000053" / "000");
    return chan;
}

struct CliRun {
    int rc = -1;
    std::string out;
    std::string err;
};

static CliRun run(const std::vector<std::string>& args) {
    std::ostringstream out, err;
    CliRun r;
    r.rc = run_cli(args, out, err);
    r.out = out.str();
    r.err = err.str();
    return r;
}

static bool has(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// =============================================================================
// Size info modes
// =============================================================================

DLS_TEST(Cli, GenerateWritesSidecar) {
    fs::path chan = make_cli_channel("cli_generate");
    std::string sidecar = (chan / DLS_SIZEINFO_NAME).string();

    CliRun r = run({"-g", chan.string(), "-w", sidecar});
    DLS_TEST_ASSERT_EQ(r.rc, EXIT_OK);
    DLS_TEST_ASSERT_EQ(r.out, std::string("records=4 size=35\n"));
    DLS_TEST_ASSERT_EQ(read_size_info(sidecar), SizeInfo(4, 35));

    // the written sidecar now passes a size check
    DLS_TEST_ASSERT_EQ(run({"-s", chan.string()}).rc, EXIT_OK);
}

DLS_TEST(Cli, AddFromIsSummedBeforeWrite) {
    fs::path dir = temp_dir("cli_add");
    std::string a = (dir / "a").string();
    std::string b = (dir / "b").string();
    std::string sum = (dir / "sum").string();
    write_size_info(a, SizeInfo(1, 10));
    write_size_info(b, SizeInfo(2, 5));

    CliRun r = run({"-r", a, "-a", b, "-w", sum});
    DLS_TEST_ASSERT_EQ(r.rc, EXIT_OK);
    DLS_TEST_ASSERT_EQ(r.out, std::string("records=3 size=15\n"));
    DLS_TEST_ASSERT_EQ(read_size_info(sum), SizeInfo(3, 15));
    DLS_TEST_ASSERT_EQ(read_size_info(a), SizeInfo(1, 10));

    fs::path chan = make_cli_channel("cli_add_generate");
    CliRun g = run({"--generate", chan.string(), "--add-from", b});
    DLS_TEST_ASSERT_EQ(g.rc, EXIT_OK);
    DLS_TEST_ASSERT_EQ(g.out, std::string("records=6 size=40\n"));
}

DLS_TEST(Cli, EqualsSpellings) {
    fs::path chan = make_cli_channel("cli_equals");
    std::string sidecar = (chan.parent_path() / "cli_equals.sizeinfo").string();

    CliRun r = run({"--generate=" + chan.string(), "--write=" + sidecar,
                    "--block-filter=<= 0x52125"});
    DLS_TEST_ASSERT_EQ(r.rc, EXIT_OK);
    DLS_TEST_ASSERT(has(r.out, "336165 <= 0x52125 TRUE"));
    DLS_TEST_ASSERT(has(r.out, "records=2 size=30\n"));
    DLS_TEST_ASSERT_EQ(read_size_info(sidecar), SizeInfo(2, 30));

    CliRun read = run({"--read=" + sidecar});
    DLS_TEST_ASSERT_EQ(read.rc, EXIT_OK);
    DLS_TEST_ASSERT_EQ(read.out, std::string("records=2 size=30\n"));
}

DLS_TEST(Cli, UnreadableSidecarFails) {
    fs::path dir = temp_dir("cli_unreadable");
    std::string missing = (dir / "missing").string();
    LogCapture logs;

    CliRun r = run({"-r", missing});
    DLS_TEST_ASSERT_EQ(r.rc, EXIT_SIZE_MISMATCH);
    DLS_TEST_ASSERT(r.out.empty());
    DLS_TEST_ASSERT(logs.contains("cannot open size info file"));

    // a bad -a source aborts before anything is written
    fs::path chan = make_cli_channel("cli_unreadable_add");
    std::string target = (dir / "target").string();
    CliRun g = run({"-g", chan.string(), "-a", missing, "-w", target});
    DLS_TEST_ASSERT_EQ(g.rc, EXIT_SIZE_MISMATCH);
    DLS_TEST_ASSERT(!fs::exists(target));

    write_bytes(dir / "short", std::vector<uint8_t>(9, 0));
    DLS_TEST_ASSERT_EQ(run({"-r", (dir / "short").string()}).rc, EXIT_SIZE_MISMATCH);
}

DLS_TEST(Cli, SizeCheckExitCodes) {
    fs::path chan = make_cli_channel("cli_size_check");
    LogCapture logs;

    // no sidecar yet
    DLS_TEST_ASSERT_EQ(run({"-s", chan.string()}).rc, EXIT_SIZE_MISMATCH);

    write_size_info((chan / DLS_SIZEINFO_NAME).string(), SizeInfo(4, 35));
    DLS_TEST_ASSERT_EQ(run({"--size-check", chan.string()}).rc, EXIT_OK);

    write_size_info((chan / DLS_SIZEINFO_NAME).string(), SizeInfo(4, 36));
    logs.messages.clear();
    DLS_TEST_ASSERT_EQ(run({"-s", chan.string()}).rc, EXIT_SIZE_MISMATCH);
    DLS_TEST_ASSERT(!logs.messages.empty());
}

// =============================================================================
// Consistency modes
// =============================================================================

DLS_TEST(Cli, ConsistencyCheckAndRepair) {
    fs::path chan = make_cli_channel("cli_consistency");
    BlockBuilder bad;
    bad.record(0x0000000053001010ull, 8, 4).word(0x0000000052125010ull).record(0x0000000053001011ull, 8, 5);
    bad.write(chan / "0000000053" / "001");
    LogCapture logs;

    CliRun c = run({"-c", chan.string()});
    DLS_TEST_ASSERT_EQ(c.rc, EXIT_OK);
    DLS_TEST_ASSERT(has(c.out, "4 files processed, 1 files with errors"));
    DLS_TEST_ASSERT(!fs::exists(chan / "0000000053" / "001.broken"));

    CliRun r = run({"-R", chan.string()});
    DLS_TEST_ASSERT_EQ(r.rc, EXIT_OK);
    DLS_TEST_ASSERT(fs::exists(chan / "0000000053" / "001.broken"));
    // the repair summary is a log line, never part of the report
    DLS_TEST_ASSERT(!has(r.out, "files repaired"));

    CliRun missing = run({"-c", (chan / "0000000052" / "124").string()});
    DLS_TEST_ASSERT_EQ(missing.rc, EXIT_UNOPENABLE);
    DLS_TEST_ASSERT(missing.out.empty());

    CliRun unresolvable = run({"-c", (chan / "0000000052" / "zzz").string()});
    DLS_TEST_ASSERT_EQ(unresolvable.rc, EXIT_UNRESOLVABLE);
}

// =============================================================================
// Usage errors
// =============================================================================

DLS_TEST(Cli, ExactlyOneMode) {
    fs::path chan = make_cli_channel("cli_modes");

    CliRun none = run({});
    DLS_TEST_ASSERT_EQ(none.rc, EXIT_USAGE);
    DLS_TEST_ASSERT(has(none.err, "exactly one of"));
    DLS_TEST_ASSERT(none.out.empty());

    CliRun only_write = run({"-w", (chan / "x").string()});
    DLS_TEST_ASSERT_EQ(only_write.rc, EXIT_USAGE);

    CliRun two = run({"-c", chan.string(), "-g", chan.string()});
    DLS_TEST_ASSERT_EQ(two.rc, EXIT_USAGE);
    DLS_TEST_ASSERT(two.out.empty());
}

DLS_TEST(Cli, BadArgumentsAreUsageErrors) {
    CliRun unknown = run({"-g", "chan", "--bogus"});
    DLS_TEST_ASSERT_EQ(unknown.rc, EXIT_USAGE);
    DLS_TEST_ASSERT(has(unknown.err, "Unknown argument: --bogus"));
    DLS_TEST_ASSERT(has(unknown.err, "USAGE"));

    CliRun dangling = run({"-g"});
    DLS_TEST_ASSERT_EQ(dangling.rc, EXIT_USAGE);
    DLS_TEST_ASSERT(has(dangling.err, "-g requires a value"));
}

DLS_TEST(Cli, BadFilterIsUsageError) {
    fs::path chan = make_cli_channel("cli_bad_filter");
    std::string sidecar = (chan / DLS_SIZEINFO_NAME).string();
    LogCapture logs;

    CliRun r = run({"-g", chan.string(), "-f", "~ 0x52125", "-w", sidecar});
    DLS_TEST_ASSERT_EQ(r.rc, EXIT_USAGE);
    DLS_TEST_ASSERT(logs.contains("block filter '~ 0x52125'"));
    DLS_TEST_ASSERT(!fs::exists(sidecar));

    DLS_TEST_ASSERT_EQ(run({"-c", chan.string(), "--block-filter", "> 0x52125 extra"}).rc, EXIT_USAGE);
}

DLS_TEST(Cli, BadConfigIsUsageError) {
    fs::path dir = temp_dir("cli_bad_conf");
    write_bytes(dir / "dlsaudit.conf", {'r', 'e', 'p', 'a', 'i', 'r', '=', '1', '\n'});
    LogCapture logs;

    CliRun r = run({"-r", (dir / "x").string(), "--conf=" + (dir / "dlsaudit.conf").string()});
    DLS_TEST_ASSERT_EQ(r.rc, EXIT_USAGE);
    DLS_TEST_ASSERT(!logs.messages.empty());
}

DLS_TEST(Cli, HelpGoesToStdout) {
    CliRun r = run({"--help"});
    DLS_TEST_ASSERT_EQ(r.rc, EXIT_OK);
    DLS_TEST_ASSERT(has(r.out, "USAGE"));
    DLS_TEST_ASSERT(has(r.out, "4 single block file that cannot be opened"));
    DLS_TEST_ASSERT(r.err.empty());
}

} // namespace test
} // namespace dls
