// test_logging.cpp - console routing and level handling of the logger

#include "test_framework.h"
#include "../config.h"
#include "../logging.h"

#include <iostream>
#include <sstream>

namespace dls {
namespace test {

DLS_TEST_SUITE(Logging);

// Swaps the buffers of std::cout and std::cerr for string buffers and turns
// console output on while in scope.
class ConsoleCapture {
public:
    ConsoleCapture()
        : old_out_(std::cout.rdbuf(out.rdbuf())), old_err_(std::cerr.rdbuf(err.rdbuf())) {
        logging::Logger::instance().set_console_output(true);
    }
    ~ConsoleCapture() {
        logging::Logger::instance().set_console_output(false);
        std::cout.rdbuf(old_out_);
        std::cerr.rdbuf(old_err_);
    }

    std::ostringstream out;
    std::ostringstream err;

private:
    std::streambuf* old_out_;
    std::streambuf* old_err_;
};

DLS_TEST(Logging, ConsoleLinesGoToStderr) {
    std::string out, err;
    {
        ConsoleCapture console;
        LOG_REPAIR(logging::Level::INFO, "chan: 1 files repaired, 0 repairs failed");
        log_warn("chan/0000000052/zzz: skipped");
        out = console.out.str();
        err = console.err.str();
    }
    DLS_TEST_ASSERT(out.empty());
    DLS_TEST_ASSERT(err.find("[INFO] [repair] chan: 1 files repaired") != std::string::npos);
    DLS_TEST_ASSERT(err.find("[WARN] chan/0000000052/zzz: skipped") != std::string::npos);
}

DLS_TEST(Logging, LevelFiltersEntries) {
    std::string err;
    {
        ConsoleCapture console;
        logging::Logger::instance().set_level(logging::Level::WARN);
        LOG_SCAN(logging::Level::INFO, "dropped");
        LOG_SCAN(logging::Level::ERROR, "kept");
        err = console.err.str();
    }
    DLS_TEST_ASSERT(err.find("dropped") == std::string::npos);
    DLS_TEST_ASSERT(err.find("[ERROR] [scan] kept") != std::string::npos);
}

DLS_TEST(Logging, ConfigSetsLevel) {
    Config cfg;
    cfg.log_level = logging::Level::DEBUG;
    std::string err;
    DLS_TEST_ASSERT(apply_logging_config(cfg, err));
    DLS_TEST_ASSERT(logging::Logger::instance().get_level() == logging::Level::DEBUG);

    cfg.log_file = "/nonexistent-dir/dlsaudit.log";
    DLS_TEST_ASSERT(!apply_logging_config(cfg, err));
    DLS_TEST_ASSERT(err.find("cannot open log file") != std::string::npos);
}

} // namespace test
} // namespace dls
