#pragma once
#include <vector>
#include "HuffmanTree.hpp"
#include "Types.hpp"

class BitstreamDecoder {
public:
    // 按比特遍历哈夫曼树，到达叶子时输出符号
    // 负载被截断、有多余字节或在编码中间结束时抛出MalformedStreamError
    static std::vector<Symbol> decode(const EncodedPayload& payload, const HuffmanTree& tree);
};
