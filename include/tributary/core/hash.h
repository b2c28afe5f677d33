// TRIBUTARY - Hash Functions
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#ifndef TRIBUTARY_CORE_HASH_H
#define TRIBUTARY_CORE_HASH_H

#include "tributary/core/types.h"

#include <array>
#include <cstddef>
#include <vector>

namespace tributary {

using Hash256 = std::array<Byte, 32>;

/// SHA-256 of a byte range (OpenSSL EVP)
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace tributary

#endif // TRIBUTARY_CORE_HASH_H
