// TRIBUTARY - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/core/hex.h"

namespace tributary {

namespace {
    constexpr char HEX_DIGITS[] = "0123456789abcdef";

    inline int NibbleOf(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string StripHexPrefix(const std::string& str) {
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        return str.substr(2);
    }
    return str;
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> HexToBytes(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(digits.length() / 2);
    for (size_t i = 0; i < digits.length(); i += 2) {
        int high = NibbleOf(digits[i]);
        int low = NibbleOf(digits[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    std::string digits = StripHexPrefix(str);
    if (digits.empty() || digits.length() % 2 != 0) {
        return false;
    }
    for (char c : digits) {
        if (NibbleOf(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace tributary
