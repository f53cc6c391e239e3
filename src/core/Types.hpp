#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "../utils/BitBuffer.hpp"

// 字母表中的一个符号，文件压缩时每个字节对应一个符号
using Symbol = uint16_t;

// 符号 -> 出现次数，按符号升序遍历
using FrequencyTable = std::map<Symbol, uint64_t>;

// 符号 -> 前缀编码
using CodeTable = std::map<Symbol, BitBuffer>;

using Sha256Digest = std::array<uint8_t, 32>;

// 打包后的编码比特（高位在前），只有前 bitLength 个比特有效
// 最后一个字节的剩余部分补零
struct EncodedPayload {
    std::vector<uint8_t> bytes;
    uint64_t bitLength = 0;
};

// 压缩与解压之间传递的持久化单元
struct Container {
    FrequencyTable frequencies;
    EncodedPayload payload;
    bool hasDigest = false;
    Sha256Digest digest{};
};

enum class TaskStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

inline std::string toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "PENDING";
        case TaskStatus::RUNNING: return "RUNNING";
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}
