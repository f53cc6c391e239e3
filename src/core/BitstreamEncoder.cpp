#include "BitstreamEncoder.hpp"
#include "CodecErrors.hpp"

EncodedPayload BitstreamEncoder::encode(const std::vector<Symbol>& symbols, const CodeTable& codes) {
    BitBuffer bits;
    for (size_t position = 0; position < symbols.size(); ++position) {
        auto it = codes.find(symbols[position]);
        if (it == codes.end()) {
            throw MissingCodeError(symbols[position], position);
        }
        bits.append(it->second);
    }

    EncodedPayload payload;
    payload.bitLength = bits.size();
    payload.bytes = bits.releaseBytes();
    return payload;
}
