#include "Digest.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// 通过EVP接口计算字节缓冲区的SHA-256
bool Digest::sha256Bytes(const std::vector<uint8_t>& data, Sha256Digest& out) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return false;
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return false;
    }

    if (EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        return false;
    }

    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1 || len != SHA256_DIGEST_LENGTH) {
        EVP_MD_CTX_free(ctx);
        return false;
    }

    EVP_MD_CTX_free(ctx);
    return true;
}

Sha256Digest Digest::sha256(const std::vector<Symbol>& symbols) {
    std::vector<uint8_t> serialized;
    serialized.reserve(symbols.size() * 2);
    for (Symbol s : symbols) {
        serialized.push_back(static_cast<uint8_t>(s & 0xFF));
        serialized.push_back(static_cast<uint8_t>((s >> 8) & 0xFF));
    }

    Sha256Digest digest{};
    if (!sha256Bytes(serialized, digest)) {
        throw std::runtime_error("Failed to compute SHA-256 digest");
    }
    return digest;
}

std::string Digest::toHex(const Sha256Digest& digest) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : digest) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}
