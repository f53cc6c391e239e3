#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// 按高位在前打包的比特序列，最后一个字节未使用的低位始终为0
class BitBuffer {
public:
    BitBuffer() = default;

    // 包装已打包的字节，字节数与 bitCount 向上取整后不一致时抛出std::invalid_argument
    static BitBuffer fromBytes(std::vector<uint8_t> bytes, uint64_t bitCount);

    // 从 '0' 和 '1' 组成的字符串构建
    static BitBuffer fromString(const std::string& bits);

    void pushBit(bool bit);

    void append(const BitBuffer& other);

    bool bit(uint64_t index) const;

    uint64_t size() const { return bitCount; }

    bool empty() const { return bitCount == 0; }

    size_t byteSize() const { return data.size(); }

    const std::vector<uint8_t>& bytes() const { return data; }

    // 取出打包后的字节，缓冲区变为空
    std::vector<uint8_t> releaseBytes();

    void clear();

    // 当前序列是否为 other 的前缀（或与之相等）
    bool isPrefixOf(const BitBuffer& other) const;

    std::string toString() const;

    bool operator==(const BitBuffer& other) const;
    bool operator!=(const BitBuffer& other) const { return !(*this == other); }

private:
    std::vector<uint8_t> data;
    uint64_t bitCount = 0;
};
