// TRIBUTARY - Core Types Header
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// This file defines fundamental types used throughout TRIBUTARY:
// 256-bit token amounts, timestamps and 160-bit account addresses.

#ifndef TRIBUTARY_CORE_TYPES_H
#define TRIBUTARY_CORE_TYPES_H

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace tributary {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest units (18-decimal fixed point for most tokens).
/// Checked arithmetic: overflow throws std::overflow_error and a negative
/// result throws std::range_error.
using Amount = boost::multiprecision::checked_uint256_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Fixed-point scale used by every accumulator (1e18)
extern const Amount PRECISION;

/// Basis-point divisor for split ratios
constexpr uint32_t BPS_DIVISOR = 10000;

/// Largest value representable in 192 bits (upper bound for auction prices)
extern const Amount MAX_UINT192;

/// 10^exp as an Amount
Amount Pow10(unsigned exp);

/// Convert a non-negative duration or timestamp to an Amount
Amount ToAmount(int64_t value);

/**
 * Parse a decimal amount string.
 *
 * Accepts plain integers ("1500"), decimals scaled by an exponent
 * ("1.5e18") and integer exponents ("3e6"). The result must be integral.
 * @return std::nullopt on malformed input or fractional result
 */
std::optional<Amount> ParseAmount(const std::string& str);

/// Format an amount with the given number of decimals ("1.5" for 1.5e18, 18)
std::string FormatUnits(const Amount& value, unsigned decimals = 18);

// ============================================================================
// Address
// ============================================================================

/**
 * 160-bit account identifier.
 *
 * Addresses identify token holders, tokens and ledger components alike.
 * The null address is never a valid participant.
 */
class Address {
public:
    static constexpr size_t SIZE = 20;

    /// Default constructor - creates null address
    Address() noexcept { data_.fill(0); }

    /// Construct from raw bytes (short input is zero padded)
    Address(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Deterministic address whose low 8 bytes hold id (big-endian)
    static Address FromId(uint64_t id);

    /// Parse from hex, with or without 0x prefix. Null address on error.
    static Address FromHex(const std::string& hex);

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    bool operator==(const Address& other) const noexcept {
        return data_ == other.data_;
    }
    bool operator!=(const Address& other) const noexcept {
        return !(*this == other);
    }
    bool operator<(const Address& other) const noexcept {
        return data_ < other.data_;
    }

    /// 0x-prefixed lowercase hex
    std::string ToHex() const;

    /// Abbreviated form for log output ("0x1234..abcd")
    std::string ToShortString() const;

private:
    std::array<Byte, SIZE> data_;
};

/// Tags for addresses of components created by the voting ledger
enum class ComponentTag : Byte {
    Auction = 0xA1,
    RewardStream = 0xB1,
    BribeRouter = 0xB2,
    Router = 0xC1,
};

/**
 * Derive the address of a ledger-owned component: the low 20 bytes of
 * SHA-256(owner || tag || index as 8 big-endian bytes).
 */
Address DeriveAddress(const Address& owner, ComponentTag tag, uint64_t index);

} // namespace tributary

#endif // TRIBUTARY_CORE_TYPES_H
