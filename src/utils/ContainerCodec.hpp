#pragma once
#include <cstdint>
#include <vector>
#include "../core/Types.hpp"

// 容器记录格式，所有整数均为小端：
//
//   魔数 "HUFP"                          4 字节
//   版本                                 u16
//   标志 (bit0: 含摘要)                  u16
//   条目数 N                             u32
//   N x (符号 u16, 计数 u64)             符号升序，计数 >= 1
//   原始内容的SHA-256                    32 字节，仅当 bit0 置位
//   比特长度                             u64
//   负载                                 记录剩余部分
//
// 字段逐个写入，不直接转储结构体
class ContainerCodec {
public:
    static constexpr uint16_t kVersion = 1;
    static constexpr uint16_t kFlagDigest = 0x0001;

    static std::vector<uint8_t> serialize(const Container& container);

    // 记录无法解析时抛出CorruptContainerError
    // 负载大小与比特长度是否一致由解码器检查
    static Container deserialize(const std::vector<uint8_t>& bytes);
};
