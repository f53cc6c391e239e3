#pragma once
#include <string>
#include <vector>
#include "../core/Types.hpp"

class Digest {
public:
    // 计算符号序列的SHA-256，每个符号按16位小端输入
    static Sha256Digest sha256(const std::vector<Symbol>& symbols);

    // 小写十六进制字符串，用于调试日志
    static std::string toHex(const Sha256Digest& digest);

private:
    static bool sha256Bytes(const std::vector<uint8_t>& data, Sha256Digest& out);
};
