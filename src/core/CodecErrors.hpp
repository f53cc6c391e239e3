#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

// 压缩/解压流程中所有错误的基类
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message) : std::runtime_error(message) {}

    virtual std::string kind() const = 0;
};

// 输入中出现了编码表中没有的符号
class MissingCodeError : public CodecError {
public:
    MissingCodeError(uint16_t symbol, uint64_t position)
        : CodecError("no code for symbol " + std::to_string(symbol) +
                     " at input position " + std::to_string(position)),
          symbol(symbol), position(position) {}

    std::string kind() const override { return "MissingCodeError"; }

    uint16_t getSymbol() const { return symbol; }
    uint64_t getPosition() const { return position; }

private:
    uint16_t symbol;
    uint64_t position;
};

// 负载损坏或被截断；bitPosition 为解码停止的位置
class MalformedStreamError : public CodecError {
public:
    MalformedStreamError(const std::string& message, uint64_t bitPosition)
        : CodecError(message + " (bit " + std::to_string(bitPosition) + ")"),
          bitPosition(bitPosition) {}

    std::string kind() const override { return "MalformedStreamError"; }

    uint64_t getBitPosition() const { return bitPosition; }

private:
    uint64_t bitPosition;
};

// 容器记录无法解析
class CorruptContainerError : public CodecError {
public:
    CorruptContainerError(const std::string& message, uint64_t byteOffset)
        : CodecError(message + " (offset " + std::to_string(byteOffset) + ")"),
          byteOffset(byteOffset) {}

    std::string kind() const override { return "CorruptContainerError"; }

    uint64_t getByteOffset() const { return byteOffset; }

private:
    uint64_t byteOffset;
};

// 文件读写失败，与编解码错误分开
class IOError : public std::runtime_error {
public:
    IOError(const std::string& message, const std::string& path)
        : std::runtime_error(message + ": " + path), path(path) {}

    const std::string& getPath() const { return path; }

private:
    std::string path;
};

// 生成日志用的 "类型: 消息" 字符串
inline std::string describeError(const std::exception& e) {
    if (auto codecError = dynamic_cast<const CodecError*>(&e)) {
        return codecError->kind() + ": " + e.what();
    }
    if (dynamic_cast<const IOError*>(&e)) {
        return std::string("IOError: ") + e.what();
    }
    return e.what();
}
