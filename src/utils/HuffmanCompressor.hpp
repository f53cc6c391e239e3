#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "../core/Types.hpp"

// 压缩流程：统计频率 -> 构建哈夫曼树 -> 生成编码 -> 编码
// 解压时根据存储的频率表重建哈夫曼树
// 错误以异常抛出（见 core/CodecErrors.hpp），除最近一次文件操作的统计外不保存状态
class HuffmanCompressor {
public:
    struct Stats {
        uint64_t inputBytes = 0;
        uint64_t outputBytes = 0;
        size_t distinctSymbols = 0;
        uint64_t payloadBits = 0;
        // 内容的SHA-256（十六进制），容器没有摘要时为空
        std::string contentDigest;
    };

    explicit HuffmanCompressor(bool verifyDigest = true);

    Container compress(const std::vector<Symbol>& symbols) const;
    Container compress(const std::string& text) const;

    // 解码出的符号数与频率表总数不一致时抛出MalformedStreamError
    // 摘要不匹配时抛出CorruptContainerError
    std::vector<Symbol> decompress(const Container& container) const;

    // 同上，用于所有符号都是字节的容器
    std::string decompressToString(const Container& container) const;

    // 压缩文件
    void compressFile(const std::string& inputFilePath, const std::string& outputFilePath);

    // 解压文件
    void decompressFile(const std::string& inputFilePath, const std::string& outputFilePath);

    const Stats& getLastStats() const { return lastStats; }

    static std::vector<Symbol> toSymbols(const std::string& text);
    static std::vector<Symbol> toSymbols(const std::vector<uint8_t>& bytes);

private:
    // 存在大于0xFF的符号时抛出CorruptContainerError
    static void requireByteSymbols(const FrequencyTable& table);

    bool verifyDigest;
    Stats lastStats;
};
