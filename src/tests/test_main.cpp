// test_main.cpp - runs the registered suites, optionally filtered by name

#include "test_framework.h"
#include "../logging.h"

int main(int argc, char** argv) {
    // Suites observe diagnostics through callbacks; keep the console readable
    dls::logging::Logger::instance().set_console_output(false);
    return dls::test::TestRunner::instance().run_all(argc, argv);
}
