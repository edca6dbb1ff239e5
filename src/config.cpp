#include "config.h"
#include "hex.h"

#include <fstream>

namespace dls {

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static bool parse_bool(const std::string& v, bool& out) {
    if (v == "1" || v == "true" || v == "yes" || v == "on")  { out = true;  return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

void apply_config_value(const std::string& key, const std::string& value, Config& cfg) {
    auto bad = [&]() {
        return ConfigError("invalid value '" + value + "' for " + key);
    };

    if (key == "log_level") {
        if (!logging::level_from_string(value, cfg.log_level)) throw bad();
    } else if (key == "log_file") {
        cfg.log_file = value;
    } else if (key == "log_json") {
        if (!parse_bool(value, cfg.log_json)) throw bad();
    } else if (key == "color") {
        if (!parse_bool(value, cfg.color)) throw bad();
    } else if (key == "timestamps") {
        if (!parse_bool(value, cfg.timestamps)) throw bad();
    } else if (key == "block_filter") {
        cfg.block_filter = value;
    } else if (key == "archive_suffix") {
        if (value.empty()) throw bad();
        cfg.archive_suffix = value;
    } else if (key == "sizeinfo_name") {
        if (value.empty() || value.find('/') != std::string::npos) throw bad();
        cfg.sizeinfo_name = value;
    } else if (key == "progress_interval_ms") {
        if (!parse_int_literal(value, cfg.progress_interval_ms)) throw bad();
    } else {
        throw ConfigError("unknown config key '" + key + "'");
    }
}

void load_config(const std::string& path, Config& cfg) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open config file " + path);

    std::string raw;
    int lineno = 0;
    while (std::getline(f, raw)) {
        ++lineno;
        size_t hash = raw.find('#');
        std::string line = trim(hash == std::string::npos ? raw : raw.substr(0, hash));
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError(path + ":" + std::to_string(lineno) + ": expected key=value");
        }
        try {
            apply_config_value(trim(line.substr(0, eq)), trim(line.substr(eq + 1)), cfg);
        } catch (const ConfigError& e) {
            throw ConfigError(path + ":" + std::to_string(lineno) + ": " + e.what());
        }
    }
    if (f.bad()) throw ConfigError("error reading config file " + path);
}

bool apply_logging_config(const Config& cfg, std::string& err) {
    auto& logger = logging::Logger::instance();
    logger.set_level(cfg.log_level);
    logger.set_color_output(cfg.color);
    logger.set_timestamps(cfg.timestamps);
    logger.set_json_format(cfg.log_json);
    if (!cfg.log_file.empty() && !logger.open_log_file(cfg.log_file)) {
        err = "cannot open log file " + cfg.log_file;
        return false;
    }
    return true;
}

}
