#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include "Types.hpp"

using NodeId = size_t;

// 节点数组中的节点。叶子没有子节点并携带符号；内部节点有两个子节点，符号无意义
struct HuffmanNode {
    uint64_t weight = 0;
    Symbol symbol = 0;
    std::optional<NodeId> left;
    std::optional<NodeId> right;

    bool isLeaf() const { return !left && !right; }
};

// 哈夫曼树，节点保存在按编号索引的数组中，构建后不再修改
class HuffmanTree {
public:
    HuffmanTree() = default;

    // 使用已准备好的节点数组，根节点或子节点编号越界时抛出std::invalid_argument
    HuffmanTree(std::vector<HuffmanNode> nodes, std::optional<NodeId> root);

    bool empty() const { return !rootId; }

    std::optional<NodeId> root() const { return rootId; }

    const HuffmanNode& node(NodeId id) const;

    size_t nodeCount() const { return nodes.size(); }

    size_t leafCount() const;

    // 根节点存在且本身是叶子（只有一个符号）
    bool rootIsLeaf() const;

private:
    std::vector<HuffmanNode> nodes;
    std::optional<NodeId> rootId;
};

class HuffmanTreeBuilder {
public:
    // 贪心合并最小权重节点。叶子按符号升序编号，合并出的节点使用下一个编号
    // 权重相同时编号小者先取出，先取出的节点作为左子节点
    // 同一频率表总是得到同一棵树
    static HuffmanTree build(const FrequencyTable& table);
};
