// TRIBUTARY - Hash Functions Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/core/hash.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace tributary {

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 out{};
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    unsigned int outLen = 0;
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, len) == 1 &&
              EVP_DigestFinal_ex(ctx, out.data(), &outLen) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok || outLen != out.size()) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return out;
}

} // namespace tributary
