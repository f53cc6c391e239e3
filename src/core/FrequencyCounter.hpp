#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "Types.hpp"

class FrequencyCounter {
public:
    // 输入长度达到该值时使用覆盖整个字母表的数组计数
    static constexpr size_t kDenseThreshold = 1u << 16;

    // 统计输入中每个符号的出现次数
    static FrequencyTable count(const std::vector<Symbol>& symbols);

    // 字节版本，每个字节一个符号
    static FrequencyTable count(const std::string& text);

    // 所有计数之和，即输入长度
    static uint64_t totalCount(const FrequencyTable& table);
};
