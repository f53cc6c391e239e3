#include "HuffmanTree.hpp"
#include <functional>
#include <limits>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>

HuffmanTree::HuffmanTree(std::vector<HuffmanNode> nodeList, std::optional<NodeId> root)
    : nodes(std::move(nodeList)), rootId(root) {
    if (rootId && *rootId >= nodes.size()) {
        throw std::invalid_argument("HuffmanTree: root id " + std::to_string(*rootId) + " out of range");
    }
    for (const auto& n : nodes) {
        if ((n.left && *n.left >= nodes.size()) || (n.right && *n.right >= nodes.size())) {
            throw std::invalid_argument("HuffmanTree: child id out of range");
        }
    }
}

const HuffmanNode& HuffmanTree::node(NodeId id) const {
    if (id >= nodes.size()) {
        throw std::out_of_range("HuffmanTree: node id " + std::to_string(id) + " out of range");
    }
    return nodes[id];
}

size_t HuffmanTree::leafCount() const {
    size_t leaves = 0;
    for (const auto& n : nodes) {
        if (n.isLeaf()) {
            leaves++;
        }
    }
    return leaves;
}

bool HuffmanTree::rootIsLeaf() const {
    return rootId && nodes[*rootId].isLeaf();
}

HuffmanTree HuffmanTreeBuilder::build(const FrequencyTable& table) {
    if (table.empty()) {
        return HuffmanTree();
    }

    std::vector<HuffmanNode> nodes;
    nodes.reserve(table.size() * 2 - 1);

    // 按 (权重, 编号) 排序的最小堆
    using HeapEntry = std::pair<uint64_t, NodeId>;
    std::priority_queue<HeapEntry, std::vector<HeapEntry>, std::greater<HeapEntry>> minHeap;

    // 先按符号升序加入叶子节点
    for (const auto& entry : table) {
        if (entry.second == 0) {
            throw std::invalid_argument("HuffmanTreeBuilder: symbol " + std::to_string(entry.first) +
                                        " has a zero count");
        }
        HuffmanNode leaf;
        leaf.weight = entry.second;
        leaf.symbol = entry.first;
        minHeap.push({leaf.weight, nodes.size()});
        nodes.push_back(leaf);
    }

    // 不断合并权重最小的两个节点，直到只剩根节点
    // 只有一个符号时循环不执行，叶子即为根节点
    while (minHeap.size() > 1) {
        HeapEntry left = minHeap.top();
        minHeap.pop();
        HeapEntry right = minHeap.top();
        minHeap.pop();

        if (left.first > std::numeric_limits<uint64_t>::max() - right.first) {
            throw std::overflow_error("HuffmanTreeBuilder: node weight exceeds 64 bits");
        }

        HuffmanNode parent;
        parent.weight = left.first + right.first;
        parent.left = left.second;
        parent.right = right.second;
        minHeap.push({parent.weight, nodes.size()});
        nodes.push_back(parent);
    }

    NodeId root = minHeap.top().second;
    return HuffmanTree(std::move(nodes), root);
}
