#include "block_filter.h"
#include "hex.h"

#include <cctype>

namespace dls {

BlockFilter BlockFilter::parse(const std::string& text) {
    size_t i = 0;
    auto skip_ws = [&]() {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    };

    skip_ws();
    BlockFilter f;
    auto starts = [&](const char* tok) { return text.compare(i, std::string(tok).size(), tok) == 0; };
    // two-character operators first
    if      (starts("<=")) { f.op_ = Op::LE; i += 2; }
    else if (starts(">=")) { f.op_ = Op::GE; i += 2; }
    else if (starts("==")) { f.op_ = Op::EQ; i += 2; }
    else if (starts("!=")) { f.op_ = Op::NE; i += 2; }
    else if (starts("<"))  { f.op_ = Op::LT; i += 1; }
    else if (starts(">"))  { f.op_ = Op::GT; i += 1; }
    else {
        throw BlockFilterError("block filter '" + text +
                               "' must start with one of < <= > >= == !=");
    }

    skip_ws();
    size_t start = i;
    while (i < text.size() && std::isalnum(static_cast<unsigned char>(text[i]))) ++i;
    std::string literal = text.substr(start, i - start);
    skip_ws();
    if (i != text.size()) {
        throw BlockFilterError("block filter '" + text + "' has trailing input");
    }
    if (!parse_int_literal(literal, f.operand_)) {
        throw BlockFilterError("block filter '" + text + "': '" + literal +
                               "' is not a decimal or 0x-prefixed integer");
    }

    f.active_ = true;
    f.text_ = text;
    return f;
}

bool BlockFilter::matches(uint64_t block_key) const {
    if (!active_) return true;
    switch (op_) {
        case Op::LT: return block_key <  operand_;
        case Op::LE: return block_key <= operand_;
        case Op::GT: return block_key >  operand_;
        case Op::GE: return block_key >= operand_;
        case Op::EQ: return block_key == operand_;
        case Op::NE: return block_key != operand_;
    }
    return false;
}

}
