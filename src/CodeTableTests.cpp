#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/CodeTable.hpp"
#include "core/CodecErrors.hpp"
#include "core/FrequencyCounter.hpp"
#include "core/HuffmanTree.hpp"

namespace {

CodeTable codesFor(const FrequencyTable& table) {
    return CodeTableDeriver::derive(HuffmanTreeBuilder::build(table));
}

std::vector<FrequencyTable> sampleTables() {
    return {
        FrequencyCounter::count(std::string("abracadabra")),
        FrequencyCounter::count(std::string("the quick brown fox jumps over the lazy dog")),
        {{'a', 2}, {'b', 2}, {'c', 1}, {'d', 1}},
        {{'x', 1}, {'y', 1}},
        // 斐波那契频率会生成最深的树
        {{0, 1}, {1, 1}, {2, 2}, {3, 3}, {4, 5}, {5, 8}, {6, 13}, {7, 21}, {8, 34}, {9, 55}},
        {{7, 100}, {300, 1}, {65535, 50}},
    };
}

} // namespace

TEST(CodeTableTest, EqualWeightCodesArePinned) {
    CodeTable codes = codesFor({{'a', 2}, {'b', 2}, {'c', 1}, {'d', 1}});

    ASSERT_EQ(codes.size(), 4u);
    EXPECT_EQ(codes.at('c').toString(), "00");
    EXPECT_EQ(codes.at('d').toString(), "01");
    EXPECT_EQ(codes.at('a').toString(), "10");
    EXPECT_EQ(codes.at('b').toString(), "11");
}

TEST(CodeTableTest, RebuiltTreeGivesSameCodes) {
    FrequencyTable table = {{'a', 2}, {'b', 2}, {'c', 1}, {'d', 1}};
    CodeTable compressSide = codesFor(table);
    CodeTable decompressSide = codesFor(table);

    ASSERT_EQ(compressSide.size(), decompressSide.size());
    for (const auto& entry : compressSide) {
        EXPECT_EQ(entry.second.size(), decompressSide.at(entry.first).size());
        EXPECT_EQ(entry.second, decompressSide.at(entry.first));
    }
}

TEST(CodeTableTest, AbracadabraCodes) {
    CodeTable codes = codesFor(FrequencyCounter::count(std::string("abracadabra")));

    EXPECT_EQ(codes.at('a').toString(), "0");
    EXPECT_EQ(codes.at('c').toString(), "100");
    EXPECT_EQ(codes.at('d').toString(), "101");
    EXPECT_EQ(codes.at('b').toString(), "110");
    EXPECT_EQ(codes.at('r').toString(), "111");
}

TEST(CodeTableTest, SingleSymbolGetsOneBitCode) {
    CodeTable codes = codesFor(FrequencyCounter::count(std::string("aaaa")));

    ASSERT_EQ(codes.size(), 1u);
    EXPECT_EQ(codes.at('a').toString(), "0");
}

TEST(CodeTableTest, EmptyTreeGivesNoCodes) {
    EXPECT_TRUE(codesFor(FrequencyTable()).empty());
}

TEST(CodeTableTest, EverySymbolHasCode) {
    for (const auto& table : sampleTables()) {
        CodeTable codes = codesFor(table);
        ASSERT_EQ(codes.size(), table.size());
        for (const auto& entry : table) {
            ASSERT_TRUE(codes.count(entry.first)) << "symbol " << entry.first;
            EXPECT_FALSE(codes.at(entry.first).empty());
        }
    }
}

TEST(CodeTableTest, CodesArePrefixFree) {
    for (const auto& table : sampleTables()) {
        CodeTable codes = codesFor(table);
        for (const auto& a : codes) {
            for (const auto& b : codes) {
                if (a.first == b.first) {
                    continue;
                }
                EXPECT_FALSE(a.second.isPrefixOf(b.second))
                    << a.second.toString() << " is a prefix of " << b.second.toString();
            }
        }
    }
}

TEST(CodeTableTest, MoreFrequentSymbolsNeverGetLongerCodes) {
    for (const auto& table : sampleTables()) {
        CodeTable codes = codesFor(table);
        for (const auto& a : table) {
            for (const auto& b : table) {
                if (a.second > b.second) {
                    EXPECT_LE(codes.at(a.first).size(), codes.at(b.first).size())
                        << "symbols " << a.first << " and " << b.first;
                }
            }
        }
    }
}

TEST(CodeTableTest, FibonacciCountsGiveDeepTree) {
    CodeTable codes = codesFor(sampleTables()[4]);
    EXPECT_EQ(codes.at(9).size(), 1u);
    EXPECT_EQ(codes.at(0).size(), 9u);
    EXPECT_EQ(codes.at(1).size(), 9u);
}

TEST(CodeTableTest, SingleChildNodeRejected) {
    HuffmanNode leaf;
    leaf.symbol = 'a';
    leaf.weight = 1;
    HuffmanNode parent;
    parent.weight = 1;
    parent.left = NodeId(0);

    HuffmanTree tree({leaf, parent}, NodeId(1));
    EXPECT_THROW(CodeTableDeriver::derive(tree), MalformedStreamError);
}
