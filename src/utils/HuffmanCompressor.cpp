#include "HuffmanCompressor.hpp"
#include "ContainerCodec.hpp"
#include "Digest.hpp"
#include "FileSystem.hpp"
#include "../core/BitstreamDecoder.hpp"
#include "../core/BitstreamEncoder.hpp"
#include "../core/CodeTable.hpp"
#include "../core/CodecErrors.hpp"
#include "../core/FrequencyCounter.hpp"
#include "../core/HuffmanTree.hpp"

HuffmanCompressor::HuffmanCompressor(bool verifyDigest) : verifyDigest(verifyDigest) {}

std::vector<Symbol> HuffmanCompressor::toSymbols(const std::string& text) {
    std::vector<Symbol> symbols;
    symbols.reserve(text.size());
    for (char ch : text) {
        symbols.push_back(static_cast<unsigned char>(ch));
    }
    return symbols;
}

std::vector<Symbol> HuffmanCompressor::toSymbols(const std::vector<uint8_t>& bytes) {
    return std::vector<Symbol>(bytes.begin(), bytes.end());
}

Container HuffmanCompressor::compress(const std::vector<Symbol>& symbols) const {
    Container container;
    container.frequencies = FrequencyCounter::count(symbols);

    HuffmanTree tree = HuffmanTreeBuilder::build(container.frequencies);
    CodeTable codes = CodeTableDeriver::derive(tree);
    container.payload = BitstreamEncoder::encode(symbols, codes);

    container.digest = Digest::sha256(symbols);
    container.hasDigest = true;
    return container;
}

Container HuffmanCompressor::compress(const std::string& text) const {
    return compress(toSymbols(text));
}

std::vector<Symbol> HuffmanCompressor::decompress(const Container& container) const {
    // 哈夫曼树不存储，按压缩时的方式重建
    HuffmanTree tree = HuffmanTreeBuilder::build(container.frequencies);
    std::vector<Symbol> symbols = BitstreamDecoder::decode(container.payload, tree);

    uint64_t expected = FrequencyCounter::totalCount(container.frequencies);
    if (symbols.size() != expected) {
        throw MalformedStreamError("decoded " + std::to_string(symbols.size()) + " symbols but the table counts " +
                                   std::to_string(expected),
                                   container.payload.bitLength);
    }

    if (verifyDigest && container.hasDigest && Digest::sha256(symbols) != container.digest) {
        throw CorruptContainerError("content digest mismatch after decoding", 0);
    }
    return symbols;
}

void HuffmanCompressor::requireByteSymbols(const FrequencyTable& table) {
    // 序列化记录中第一个条目的偏移
    uint64_t offset = 12;
    for (const auto& entry : table) {
        if (entry.first > 0xFF) {
            throw CorruptContainerError("symbol " + std::to_string(entry.first) + " does not fit in a byte", offset);
        }
        offset += 10;
    }
}

std::string HuffmanCompressor::decompressToString(const Container& container) const {
    requireByteSymbols(container.frequencies);
    std::vector<Symbol> symbols = decompress(container);

    std::string text;
    text.reserve(symbols.size());
    for (Symbol s : symbols) {
        text += static_cast<char>(static_cast<unsigned char>(s));
    }
    return text;
}

void HuffmanCompressor::compressFile(const std::string& inputFilePath, const std::string& outputFilePath) {
    lastStats = Stats();

    // 1. 读取输入文件内容
    std::vector<uint8_t> inputData = FileSystem::readAllBytes(inputFilePath);

    // 2. 构建压缩容器
    Container container = compress(toSymbols(inputData));

    // 3. 写入压缩文件
    std::vector<uint8_t> record = ContainerCodec::serialize(container);
    FileSystem::writeAllBytes(outputFilePath, record);

    lastStats.inputBytes = inputData.size();
    lastStats.outputBytes = record.size();
    lastStats.distinctSymbols = container.frequencies.size();
    lastStats.payloadBits = container.payload.bitLength;
    lastStats.contentDigest = Digest::toHex(container.digest);
}

void HuffmanCompressor::decompressFile(const std::string& inputFilePath, const std::string& outputFilePath) {
    lastStats = Stats();

    std::vector<uint8_t> record = FileSystem::readAllBytes(inputFilePath);
    Container container = ContainerCodec::deserialize(record);

    requireByteSymbols(container.frequencies);
    std::vector<Symbol> symbols = decompress(container);

    std::vector<uint8_t> outputData;
    outputData.reserve(symbols.size());
    for (Symbol s : symbols) {
        outputData.push_back(static_cast<uint8_t>(s));
    }
    FileSystem::writeAllBytes(outputFilePath, outputData);

    lastStats.inputBytes = record.size();
    lastStats.outputBytes = outputData.size();
    lastStats.distinctSymbols = container.frequencies.size();
    lastStats.payloadBits = container.payload.bitLength;
    if (container.hasDigest) {
        lastStats.contentDigest = Digest::toHex(container.digest);
    }
}
