#include "CodeTable.hpp"
#include "CodecErrors.hpp"
#include <utility>
#include <vector>

CodeTable CodeTableDeriver::derive(const HuffmanTree& tree) {
    CodeTable codes;
    if (tree.empty()) {
        return codes;
    }

    NodeId root = *tree.root();
    if (tree.rootIsLeaf()) {
        codes.emplace(tree.node(root).symbol, BitBuffer::fromString("0"));
        return codes;
    }

    // 迭代深度优先遍历，先压入右子节点，保证先访问左子节点
    std::vector<std::pair<NodeId, BitBuffer>> stack;
    stack.emplace_back(root, BitBuffer());

    while (!stack.empty()) {
        NodeId id = stack.back().first;
        BitBuffer path = std::move(stack.back().second);
        stack.pop_back();

        const HuffmanNode& current = tree.node(id);
        if (current.isLeaf()) {
            codes.emplace(current.symbol, std::move(path));
            continue;
        }
        if (!current.left || !current.right) {
            throw MalformedStreamError("huffman tree node " + std::to_string(id) + " has a single child",
                                       path.size());
        }

        BitBuffer rightPath = path;
        rightPath.pushBit(true);
        stack.emplace_back(*current.right, std::move(rightPath));

        path.pushBit(false);
        stack.emplace_back(*current.left, std::move(path));
    }

    return codes;
}
