#include "BitBuffer.hpp"
#include <stdexcept>
#include <utility>

BitBuffer BitBuffer::fromBytes(std::vector<uint8_t> bytes, uint64_t bitCount) {
    uint64_t expectedBytes = (bitCount + 7) / 8;
    if (bytes.size() != expectedBytes) {
        throw std::invalid_argument("BitBuffer: " + std::to_string(bytes.size()) +
                                    " bytes cannot hold exactly " + std::to_string(bitCount) + " bits");
    }

    BitBuffer buffer;
    buffer.data = std::move(bytes);
    buffer.bitCount = bitCount;

    // 填充位清零，比较时只看有效比特
    int usedBits = static_cast<int>(bitCount % 8);
    if (usedBits != 0) {
        buffer.data.back() &= static_cast<uint8_t>(0xFF << (8 - usedBits));
    }
    return buffer;
}

BitBuffer BitBuffer::fromString(const std::string& bits) {
    BitBuffer buffer;
    for (char c : bits) {
        if (c != '0' && c != '1') {
            throw std::invalid_argument("BitBuffer: invalid bit character '" + std::string(1, c) + "'");
        }
        buffer.pushBit(c == '1');
    }
    return buffer;
}

void BitBuffer::pushBit(bool bit) {
    int offset = static_cast<int>(bitCount % 8);
    if (offset == 0) {
        data.push_back(0);
    }
    if (bit) {
        data.back() |= static_cast<uint8_t>(0x80 >> offset);
    }
    ++bitCount;
}

void BitBuffer::append(const BitBuffer& other) {
    // 字节对齐时直接拷贝
    if (bitCount % 8 == 0) {
        data.insert(data.end(), other.data.begin(), other.data.end());
        bitCount += other.bitCount;
        return;
    }
    for (uint64_t i = 0; i < other.bitCount; ++i) {
        pushBit(other.bit(i));
    }
}

bool BitBuffer::bit(uint64_t index) const {
    if (index >= bitCount) {
        throw std::out_of_range("BitBuffer: bit index " + std::to_string(index) +
                                " out of range (size " + std::to_string(bitCount) + ")");
    }
    return (data[index / 8] >> (7 - index % 8)) & 1u;
}

std::vector<uint8_t> BitBuffer::releaseBytes() {
    std::vector<uint8_t> out = std::move(data);
    clear();
    return out;
}

void BitBuffer::clear() {
    data.clear();
    bitCount = 0;
}

bool BitBuffer::isPrefixOf(const BitBuffer& other) const {
    if (bitCount > other.bitCount) {
        return false;
    }
    for (uint64_t i = 0; i < bitCount; ++i) {
        if (bit(i) != other.bit(i)) {
            return false;
        }
    }
    return true;
}

std::string BitBuffer::toString() const {
    std::string out;
    out.reserve(bitCount);
    for (uint64_t i = 0; i < bitCount; ++i) {
        out += bit(i) ? '1' : '0';
    }
    return out;
}

bool BitBuffer::operator==(const BitBuffer& other) const {
    return bitCount == other.bitCount && data == other.data;
}
