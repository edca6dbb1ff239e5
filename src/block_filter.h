#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dls {

class BlockFilterError : public std::runtime_error {
public:
    explicit BlockFilterError(const std::string& msg) : std::runtime_error(msg) {}
};

// A relational predicate over a block key: "<op> <literal>", where op is one of
// < <= > >= == != and the literal is decimal or 0x-prefixed hexadecimal.
// e.g. "> 0x52123" matches chan/0000000052/125 but not chan/0000000052/120.
class BlockFilter {
public:
    enum class Op { LT, LE, GT, GE, EQ, NE };

    BlockFilter() = default;

    // Throws BlockFilterError when the text does not match the grammar.
    static BlockFilter parse(const std::string& text);

    bool active() const { return active_; }
    bool matches(uint64_t block_key) const;

    const std::string& text() const { return text_; }
    Op op() const { return op_; }
    uint64_t operand() const { return operand_; }

private:
    bool active_ = false;
    Op op_ = Op::EQ;
    uint64_t operand_ = 0;
    std::string text_;
};

}
