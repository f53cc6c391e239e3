#include "ContainerCodec.hpp"
#include "../core/CodecErrors.hpp"
#include <cstddef>
#include <cstring>
#include <string>
#include <utility>

namespace {

const char kMagic[4] = {'H', 'U', 'F', 'P'};

class ByteWriter {
public:
    void writeU8(uint8_t v) { buf.push_back(v); }
    void writeU16(uint16_t v) {
        writeU8(static_cast<uint8_t>(v & 0xFF));
        writeU8(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void writeU32(uint32_t v) {
        writeU16(static_cast<uint16_t>(v & 0xFFFF));
        writeU16(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void writeU64(uint64_t v) {
        writeU32(static_cast<uint32_t>(v & 0xFFFFFFFFu));
        writeU32(static_cast<uint32_t>(v >> 32));
    }
    void writeBytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf.insert(buf.end(), b, b + n);
    }
    std::vector<uint8_t> take() { return std::move(buf); }

private:
    std::vector<uint8_t> buf;
};

class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data) : buf(data) {}

    uint16_t readU16(const char* field) {
        need(2, field);
        uint16_t lo = buf[pos];
        uint16_t hi = buf[pos + 1];
        pos += 2;
        return static_cast<uint16_t>(lo | (hi << 8));
    }
    uint32_t readU32(const char* field) {
        need(4, field);
        uint32_t v = 0;
        for (int i = 3; i >= 0; --i) {
            v = (v << 8) | buf[pos + i];
        }
        pos += 4;
        return v;
    }
    uint64_t readU64(const char* field) {
        need(8, field);
        uint64_t v = 0;
        for (int i = 7; i >= 0; --i) {
            v = (v << 8) | buf[pos + i];
        }
        pos += 8;
        return v;
    }
    void readBytes(void* out, size_t n, const char* field) {
        need(n, field);
        std::memcpy(out, buf.data() + pos, n);
        pos += n;
    }
    std::vector<uint8_t> readRest() {
        std::vector<uint8_t> rest(buf.begin() + static_cast<std::ptrdiff_t>(pos), buf.end());
        pos = buf.size();
        return rest;
    }
    size_t offset() const { return pos; }
    size_t remaining() const { return buf.size() - pos; }

private:
    void need(size_t n, const char* field) {
        if (n > remaining()) {
            throw CorruptContainerError(std::string("container ends inside field '") + field + "'", pos);
        }
    }

    const std::vector<uint8_t>& buf;
    size_t pos = 0;
};

} // namespace

std::vector<uint8_t> ContainerCodec::serialize(const Container& container) {
    ByteWriter w;
    w.writeBytes(kMagic, sizeof(kMagic));
    w.writeU16(kVersion);
    w.writeU16(container.hasDigest ? kFlagDigest : 0);

    w.writeU32(static_cast<uint32_t>(container.frequencies.size()));
    for (const auto& entry : container.frequencies) {
        w.writeU16(entry.first);
        w.writeU64(entry.second);
    }

    if (container.hasDigest) {
        w.writeBytes(container.digest.data(), container.digest.size());
    }

    w.writeU64(container.payload.bitLength);
    w.writeBytes(container.payload.bytes.data(), container.payload.bytes.size());
    return w.take();
}

Container ContainerCodec::deserialize(const std::vector<uint8_t>& bytes) {
    ByteReader r(bytes);
    Container container;

    char magic[4];
    r.readBytes(magic, sizeof(magic), "magic");
    if (std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw CorruptContainerError("bad magic", 0);
    }

    uint16_t version = r.readU16("version");
    if (version != kVersion) {
        throw CorruptContainerError("unsupported container version " + std::to_string(version), 4);
    }

    uint16_t flags = r.readU16("flags");
    if ((flags & ~kFlagDigest) != 0) {
        throw CorruptContainerError("unknown container flags " + std::to_string(flags), 6);
    }

    uint32_t entryCount = r.readU32("entry count");
    // 每个条目10字节
    if (static_cast<uint64_t>(entryCount) * 10 > r.remaining()) {
        throw CorruptContainerError("entry count " + std::to_string(entryCount) + " exceeds record size",
                                    r.offset());
    }

    bool first = true;
    Symbol previous = 0;
    for (uint32_t i = 0; i < entryCount; ++i) {
        size_t entryOffset = r.offset();
        Symbol symbol = r.readU16("symbol");
        uint64_t count = r.readU64("count");
        if (count == 0) {
            throw CorruptContainerError("symbol " + std::to_string(symbol) + " has a zero count", entryOffset);
        }
        if (!first && symbol <= previous) {
            throw CorruptContainerError("frequency table symbols not strictly ascending", entryOffset);
        }
        container.frequencies.emplace_hint(container.frequencies.end(), symbol, count);
        previous = symbol;
        first = false;
    }

    if (flags & kFlagDigest) {
        r.readBytes(container.digest.data(), container.digest.size(), "digest");
        container.hasDigest = true;
    }

    container.payload.bitLength = r.readU64("bit length");
    container.payload.bytes = r.readRest();
    return container;
}
