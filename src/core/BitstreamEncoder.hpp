#pragma once
#include <vector>
#include "Types.hpp"

class BitstreamEncoder {
public:
    // 按顺序拼接每个符号的编码（高位在前）
    // 符号没有编码时抛出MissingCodeError
    static EncodedPayload encode(const std::vector<Symbol>& symbols, const CodeTable& codes);
};
