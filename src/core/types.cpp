// TRIBUTARY - Core Types Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/core/types.h"
#include "tributary/core/hash.h"
#include "tributary/core/hex.h"

#include <cctype>
#include <stdexcept>

namespace tributary {

const Amount PRECISION = Pow10(18);

const Amount MAX_UINT192 = (Amount(1) << 192) - 1;

Amount Pow10(unsigned exp) {
    Amount result = 1;
    for (unsigned i = 0; i < exp; ++i) {
        result *= 10;
    }
    return result;
}

Amount ToAmount(int64_t value) {
    if (value < 0) {
        throw std::range_error("negative value cannot be an amount");
    }
    return Amount(static_cast<uint64_t>(value));
}

// ============================================================================
// Amount Parsing / Formatting
// ============================================================================

namespace {

bool AllDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    std::string mantissa = str;
    unsigned exponent = 0;

    size_t ePos = str.find_first_of("eE");
    if (ePos != std::string::npos) {
        mantissa = str.substr(0, ePos);
        std::string expStr = str.substr(ePos + 1);
        if (!AllDigits(expStr) || expStr.size() > 2) {
            return std::nullopt;
        }
        exponent = static_cast<unsigned>(std::stoul(expStr));
        if (exponent > 77) {
            return std::nullopt;
        }
    }

    std::string whole = mantissa;
    std::string frac;
    size_t dot = mantissa.find('.');
    if (dot != std::string::npos) {
        whole = mantissa.substr(0, dot);
        frac = mantissa.substr(dot + 1);
        while (!frac.empty() && frac.back() == '0') {
            frac.pop_back();
        }
        if (whole.empty()) whole = "0";
        if (!frac.empty() && !AllDigits(frac)) {
            return std::nullopt;
        }
    }
    if (!AllDigits(whole) || frac.size() > exponent) {
        return std::nullopt;
    }

    try {
        Amount value(whole + frac);
        return value * Pow10(exponent - static_cast<unsigned>(frac.size()));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string FormatUnits(const Amount& value, unsigned decimals) {
    if (decimals == 0) {
        return value.str();
    }
    Amount unit = Pow10(decimals);
    std::string whole = Amount(value / unit).str();
    std::string frac = Amount(value % unit).str();
    if (frac == "0") {
        return whole;
    }
    frac.insert(0, decimals - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0') {
        frac.pop_back();
    }
    return whole + "." + frac;
}

// ============================================================================
// Address
// ============================================================================

Address Address::FromId(uint64_t id) {
    Address addr;
    for (size_t i = 0; i < 8; ++i) {
        addr.data_[SIZE - 1 - i] = static_cast<Byte>(id >> (8 * i));
    }
    return addr;
}

Address Address::FromHex(const std::string& hex) {
    auto bytes = HexToBytes(hex);
    if (!bytes || bytes->size() != SIZE) {
        return Address();
    }
    return Address(bytes->data(), bytes->size());
}

std::string Address::ToHex() const {
    return "0x" + BytesToHex(data_.data(), SIZE);
}

std::string Address::ToShortString() const {
    std::string hex = BytesToHex(data_.data(), SIZE);
    return "0x" + hex.substr(0, 4) + ".." + hex.substr(hex.size() - 4);
}

Address DeriveAddress(const Address& owner, ComponentTag tag, uint64_t index) {
    std::vector<Byte> preimage(owner.data(), owner.data() + Address::SIZE);
    preimage.push_back(static_cast<Byte>(tag));
    for (int shift = 56; shift >= 0; shift -= 8) {
        preimage.push_back(static_cast<Byte>(index >> shift));
    }
    Hash256 digest = SHA256Hash(preimage);
    return Address(digest.data() + digest.size() - Address::SIZE, Address::SIZE);
}

} // namespace tributary
