// test_util.h - Block file fixtures shared by the dlsaudit test suites
#ifndef DLS_TEST_UTIL_H
#define DLS_TEST_UTIL_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "../logging.h"
#include "../record.h"

namespace dls {
namespace test {

inline std::filesystem::path temp_dir(const std::string& name) {
    const auto root = std::filesystem::temp_directory_path() / "dlsaudit-tests" / name;
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

inline std::vector<uint8_t> read_bytes(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

inline void write_bytes(const std::filesystem::path& p, const std::vector<uint8_t>& bytes) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

// Builds the raw bytes of a block file one record (or raw word) at a time.
class BlockBuilder {
public:
    BlockBuilder& record(uint64_t key, const std::vector<uint8_t>& value) {
        word(key);
        word(value.size());
        bytes_.insert(bytes_.end(), value.begin(), value.end());
        return *this;
    }

    BlockBuilder& record(uint64_t key, size_t len, uint8_t fill) {
        return record(key, std::vector<uint8_t>(len, fill));
    }

    BlockBuilder& word(uint64_t v) {
        uint8_t b[8];
        put_u64_le(b, v);
        bytes_.insert(bytes_.end(), b, b + 8);
        return *this;
    }

    BlockBuilder& raw(const std::vector<uint8_t>& b) {
        bytes_.insert(bytes_.end(), b.begin(), b.end());
        return *this;
    }

    const std::vector<uint8_t>& bytes() const { return bytes_; }

    void write(const std::filesystem::path& p) const { write_bytes(p, bytes_); }

private:
    std::vector<uint8_t> bytes_;
};

// Collects every logged entry at or above WARN while in scope.
class LogCapture {
public:
    LogCapture() {
        logging::Logger::instance().add_callback([this](const logging::LogEntry& e) {
            if (e.level >= logging::Level::WARN) messages.push_back(e.message);
        });
    }
    ~LogCapture() { logging::Logger::instance().clear_callbacks(); }

    bool contains(const std::string& needle) const {
        for (const auto& m : messages) {
            if (m.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::string> messages;
};

} // namespace test
} // namespace dls

#endif // DLS_TEST_UTIL_H
