#include "BitstreamDecoder.hpp"
#include "CodecErrors.hpp"
#include <string>

namespace {

void checkPayloadSize(const EncodedPayload& payload) {
    uint64_t neededBytes = (payload.bitLength + 7) / 8;
    uint64_t availableBits = static_cast<uint64_t>(payload.bytes.size()) * 8;
    if (payload.bytes.size() < neededBytes) {
        throw MalformedStreamError("payload truncated: " + std::to_string(payload.bitLength) +
                                   " bits declared but only " + std::to_string(availableBits) + " present",
                                   availableBits);
    }
    if (payload.bytes.size() > neededBytes) {
        throw MalformedStreamError("payload has " + std::to_string(payload.bytes.size() - neededBytes) +
                                   " bytes beyond the declared bit length",
                                   payload.bitLength);
    }
}

} // namespace

std::vector<Symbol> BitstreamDecoder::decode(const EncodedPayload& payload, const HuffmanTree& tree) {
    std::vector<Symbol> output;

    checkPayloadSize(payload);

    if (tree.empty()) {
        if (payload.bitLength != 0) {
            throw MalformedStreamError("payload bits present but the frequency table is empty", 0);
        }
        return output;
    }

    NodeId root = *tree.root();

    // 只有一个符号：每个比特代表一次出现
    if (tree.rootIsLeaf()) {
        output.assign(payload.bitLength, tree.node(root).symbol);
        return output;
    }

    BitBuffer bits = BitBuffer::fromBytes(payload.bytes, payload.bitLength);
    NodeId current = root;
    for (uint64_t i = 0; i < payload.bitLength; ++i) {
        const HuffmanNode& n = tree.node(current);
        const auto& next = bits.bit(i) ? n.right : n.left;
        if (!next) {
            throw MalformedStreamError("huffman tree node " + std::to_string(current) + " is missing a child", i);
        }
        current = *next;

        const HuffmanNode& landed = tree.node(current);
        if (landed.isLeaf()) {
            output.push_back(landed.symbol);
            current = root;
        }
    }

    if (current != root) {
        throw MalformedStreamError("payload ends in the middle of a code", payload.bitLength);
    }
    return output;
}
