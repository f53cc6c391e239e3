#pragma once
#include "HuffmanTree.hpp"
#include "Types.hpp"

class CodeTableDeriver {
public:
    // 从根到叶子的路径，左为0，右为1
    // 空树得到空编码表；根节点是叶子时，该符号的编码固定为 "0"
    static CodeTable derive(const HuffmanTree& tree);
};
