// TRIBUTARY - Protocol Parameters Header
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Fixed parameters of a ledger deployment: the epoch clock, reward stream
// duration, bribe split bounds and the bounds every auction is registered
// within.

#ifndef TRIBUTARY_PROTOCOL_PARAMS_H
#define TRIBUTARY_PROTOCOL_PARAMS_H

#include "tributary/core/types.h"
#include "tributary/util/config.h"

#include <cstdint>
#include <optional>
#include <string>

namespace tributary {
namespace protocol {

// ============================================================================
// Bribe Dust Policy
// ============================================================================

/**
 * What a BribeRouter does with a balance too small to stream.
 *
 * A reward batch below rewardDuration units yields rewardRate == 0, which
 * the stream rejects. Such a batch is either kept for a later batch, paid
 * to the strategy's receiver, or sent to the treasury.
 */
enum class BribeDustPolicy : uint8_t {
    Accumulate = 0,
    Receiver = 1,
    Treasury = 2,
};

const char* BribeDustPolicyToString(BribeDustPolicy policy);

std::optional<BribeDustPolicy> BribeDustPolicyFromString(const std::string& str);

// ============================================================================
// Protocol Parameters
// ============================================================================

struct Params {
    /// Network name (main, regtest)
    std::string networkId;

    // ========================================================================
    // Clocks
    // ========================================================================

    /// Epoch-clock period gating vote/reset (one week)
    int64_t epochDuration;

    /// Reward stream duration (one week)
    int64_t rewardDuration;

    // ========================================================================
    // Bribe Split
    // ========================================================================

    /// Upper bound for the bribe split in basis points (strictly below 100%)
    uint32_t maxBribeSplitBps;

    /// Split applied when a ledger is created
    uint32_t defaultBribeSplitBps;

    /// Handling of sub-streamable bribe balances
    BribeDustPolicy bribeDustPolicy;

    // ========================================================================
    // Auction Bounds
    // ========================================================================

    int64_t minEpochPeriod;
    int64_t maxEpochPeriod;

    /// Multiplier bounds, scaled by PRECISION (1.1x .. 3x)
    Amount minPriceMultiplier;
    Amount maxPriceMultiplier;

    /// Absolute bounds for minInitPrice and initPrice
    Amount absMinInitPrice;
    Amount absMaxInitPrice;

    // ========================================================================
    // Helpers
    // ========================================================================

    /// Check internal consistency. On failure sets error.
    bool IsValid(std::string& error) const;

    /// Main deployment parameters
    static Params Main();

    /// Regression-test parameters (tiny auction prices allowed)
    static Params Regtest();
};

/**
 * Build parameters from configuration.
 *
 * Starts from Main() or Regtest() per the "network" key and applies the
 * [protocol] overrides. Fails on malformed values or inconsistent results.
 */
util::ConfigParseResult LoadParams(const util::ConfigManager& config, Params& out);

/// Register the [protocol] keys as allowed for ConfigManager::Validate()
void AllowProtocolKeys(util::ConfigManager& config);

} // namespace protocol
} // namespace tributary

#endif // TRIBUTARY_PROTOCOL_PARAMS_H
