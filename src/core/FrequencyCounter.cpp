#include "FrequencyCounter.hpp"
#include <array>
#include <limits>
#include <stdexcept>

FrequencyTable FrequencyCounter::count(const std::vector<Symbol>& symbols) {
    FrequencyTable table;
    if (symbols.size() < kDenseThreshold) {
        for (Symbol s : symbols) {
            table[s]++;
        }
        return table;
    }

    // 在整个16位字母表上计数，再保留出现过的符号
    std::vector<uint64_t> counts(std::numeric_limits<Symbol>::max() + 1, 0);
    for (Symbol s : symbols) {
        counts[s]++;
    }

    for (size_t s = 0; s < counts.size(); ++s) {
        if (counts[s] > 0) {
            table.emplace_hint(table.end(), static_cast<Symbol>(s), counts[s]);
        }
    }
    return table;
}

FrequencyTable FrequencyCounter::count(const std::string& text) {
    std::array<uint64_t, 256> counts{};
    for (char ch : text) {
        counts[static_cast<unsigned char>(ch)]++;
    }

    FrequencyTable table;
    for (size_t s = 0; s < counts.size(); ++s) {
        if (counts[s] > 0) {
            table.emplace_hint(table.end(), static_cast<Symbol>(s), counts[s]);
        }
    }
    return table;
}

uint64_t FrequencyCounter::totalCount(const FrequencyTable& table) {
    uint64_t total = 0;
    for (const auto& entry : table) {
        if (total > std::numeric_limits<uint64_t>::max() - entry.second) {
            throw std::overflow_error("frequency table total exceeds 64 bits");
        }
        total += entry.second;
    }
    return total;
}
