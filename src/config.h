#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

#include "constants.h"
#include "logging.h"

namespace dls {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct Config {
    // logging
    logging::Level log_level = logging::Level::INFO;
    std::string log_file;
    bool log_json = false;
    bool color = false;
    bool timestamps = false;

    // scanning
    std::string block_filter;
    std::string archive_suffix = DLS_ARCHIVE_SUFFIX;
    std::string sizeinfo_name = DLS_SIZEINFO_NAME;
    uint64_t progress_interval_ms = DLS_PROGRESS_INTERVAL_MS;
};

// Apply one key=value pair. Throws ConfigError on an unknown key or bad value.
void apply_config_value(const std::string& key, const std::string& value, Config& cfg);

// Load a key=value file into cfg. '#' starts a comment, blank lines are skipped.
// Throws ConfigError naming the offending line.
void load_config(const std::string& path, Config& cfg);

// Push the logging part of cfg into the global logger.
bool apply_logging_config(const Config& cfg, std::string& err);

}
