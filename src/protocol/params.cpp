// TRIBUTARY - Protocol Parameters Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/protocol/params.h"
#include "tributary/util/logging.h"
#include "tributary/util/time.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace tributary {
namespace protocol {

const char* BribeDustPolicyToString(BribeDustPolicy policy) {
    switch (policy) {
        case BribeDustPolicy::Accumulate: return "accumulate";
        case BribeDustPolicy::Receiver: return "receiver";
        case BribeDustPolicy::Treasury: return "treasury";
        default: return "unknown";
    }
}

std::optional<BribeDustPolicy> BribeDustPolicyFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "accumulate") return BribeDustPolicy::Accumulate;
    if (lower == "receiver") return BribeDustPolicy::Receiver;
    if (lower == "treasury") return BribeDustPolicy::Treasury;
    return std::nullopt;
}

// ============================================================================
// Network Configurations
// ============================================================================

Params Params::Main() {
    Params p;
    p.networkId = "main";
    p.epochDuration = util::SECONDS_PER_WEEK;
    p.rewardDuration = util::SECONDS_PER_WEEK;
    p.maxBribeSplitBps = 5000;
    p.defaultBribeSplitBps = 2000;
    p.bribeDustPolicy = BribeDustPolicy::Accumulate;
    p.minEpochPeriod = util::SECONDS_PER_HOUR;
    p.maxEpochPeriod = util::SECONDS_PER_YEAR;
    p.minPriceMultiplier = PRECISION * 11 / 10;
    p.maxPriceMultiplier = PRECISION * 3;
    p.absMinInitPrice = Pow10(6);
    p.absMaxInitPrice = MAX_UINT192;
    return p;
}

Params Params::Regtest() {
    Params p = Main();
    p.networkId = "regtest";
    p.absMinInitPrice = 1;
    return p;
}

bool Params::IsValid(std::string& error) const {
    if (epochDuration <= 0) {
        error = "epochduration must be positive";
        return false;
    }
    if (rewardDuration <= 0) {
        error = "rewardduration must be positive";
        return false;
    }
    if (maxBribeSplitBps >= BPS_DIVISOR) {
        error = "maxbribesplit must be below " + std::to_string(BPS_DIVISOR);
        return false;
    }
    if (defaultBribeSplitBps > maxBribeSplitBps) {
        error = "bribesplit exceeds maxbribesplit";
        return false;
    }
    if (minEpochPeriod <= 0 || minEpochPeriod > maxEpochPeriod) {
        error = "epoch period bounds are inconsistent";
        return false;
    }
    if (minPriceMultiplier < PRECISION || minPriceMultiplier > maxPriceMultiplier) {
        error = "price multiplier bounds are inconsistent";
        return false;
    }
    if (absMinInitPrice == 0 || absMinInitPrice > absMaxInitPrice) {
        error = "init price bounds are inconsistent";
        return false;
    }
    return true;
}

// ============================================================================
// Configuration Loading
// ============================================================================

util::ConfigParseResult LoadParams(const util::ConfigManager& config, Params& out) {
    namespace Keys = util::ConfigKeys;
    const std::string section = util::ConfigSections::PROTOCOL;

    std::string network = config.GetString(Keys::NETWORK, "main");
    Params p;
    if (network == "main") {
        p = Params::Main();
    } else if (network == "regtest") {
        p = Params::Regtest();
    } else {
        return util::ConfigParseResult::Error("Unknown network: " + network);
    }

    auto bad = [](const char* key) {
        return util::ConfigParseResult::Error(
            std::string("Invalid value for protocol.") + key);
    };

    if (config.HasKey(Keys::EPOCH_DURATION, section)) {
        auto v = config.TryGetDuration(Keys::EPOCH_DURATION, section);
        if (!v) return bad(Keys::EPOCH_DURATION);
        p.epochDuration = *v;
    }
    if (config.HasKey(Keys::REWARD_DURATION, section)) {
        auto v = config.TryGetDuration(Keys::REWARD_DURATION, section);
        if (!v) return bad(Keys::REWARD_DURATION);
        p.rewardDuration = *v;
    }
    if (config.HasKey(Keys::MAX_BRIBE_SPLIT, section)) {
        auto v = config.TryGetUInt(Keys::MAX_BRIBE_SPLIT, section);
        if (!v || *v >= BPS_DIVISOR) return bad(Keys::MAX_BRIBE_SPLIT);
        p.maxBribeSplitBps = static_cast<uint32_t>(*v);
    }
    if (config.HasKey(Keys::BRIBE_SPLIT, section)) {
        auto v = config.TryGetUInt(Keys::BRIBE_SPLIT, section);
        if (!v || *v >= BPS_DIVISOR) return bad(Keys::BRIBE_SPLIT);
        p.defaultBribeSplitBps = static_cast<uint32_t>(*v);
    }
    if (config.HasKey(Keys::MIN_EPOCH_PERIOD, section)) {
        auto v = config.TryGetDuration(Keys::MIN_EPOCH_PERIOD, section);
        if (!v) return bad(Keys::MIN_EPOCH_PERIOD);
        p.minEpochPeriod = *v;
    }
    if (config.HasKey(Keys::MAX_EPOCH_PERIOD, section)) {
        auto v = config.TryGetDuration(Keys::MAX_EPOCH_PERIOD, section);
        if (!v) return bad(Keys::MAX_EPOCH_PERIOD);
        p.maxEpochPeriod = *v;
    }
    if (config.HasKey(Keys::MIN_PRICE_MULTIPLIER, section)) {
        auto v = config.TryGetAmount(Keys::MIN_PRICE_MULTIPLIER, section);
        if (!v) return bad(Keys::MIN_PRICE_MULTIPLIER);
        p.minPriceMultiplier = *v;
    }
    if (config.HasKey(Keys::MAX_PRICE_MULTIPLIER, section)) {
        auto v = config.TryGetAmount(Keys::MAX_PRICE_MULTIPLIER, section);
        if (!v) return bad(Keys::MAX_PRICE_MULTIPLIER);
        p.maxPriceMultiplier = *v;
    }
    if (config.HasKey(Keys::ABS_MIN_INIT_PRICE, section)) {
        auto v = config.TryGetAmount(Keys::ABS_MIN_INIT_PRICE, section);
        if (!v) return bad(Keys::ABS_MIN_INIT_PRICE);
        p.absMinInitPrice = *v;
    }
    if (config.HasKey(Keys::BRIBE_DUST_POLICY, section)) {
        auto policy = BribeDustPolicyFromString(
            config.GetString(Keys::BRIBE_DUST_POLICY, "", section));
        if (!policy) return bad(Keys::BRIBE_DUST_POLICY);
        p.bribeDustPolicy = *policy;
    }

    std::string error;
    if (!p.IsValid(error)) {
        return util::ConfigParseResult::Error("Inconsistent protocol parameters: " + error);
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded " << p.networkId
        << " parameters: epoch=" << util::FormatDuration(util::Seconds{p.epochDuration})
        << " reward=" << util::FormatDuration(util::Seconds{p.rewardDuration})
        << " split=" << p.defaultBribeSplitBps << "/" << p.maxBribeSplitBps
        << " dust=" << BribeDustPolicyToString(p.bribeDustPolicy);

    out = p;
    return util::ConfigParseResult::Success();
}

void AllowProtocolKeys(util::ConfigManager& config) {
    namespace Keys = util::ConfigKeys;
    const std::string section = util::ConfigSections::PROTOCOL;
    for (const char* key : {Keys::EPOCH_DURATION, Keys::REWARD_DURATION,
                            Keys::MAX_BRIBE_SPLIT, Keys::BRIBE_SPLIT,
                            Keys::MIN_EPOCH_PERIOD, Keys::MAX_EPOCH_PERIOD,
                            Keys::MIN_PRICE_MULTIPLIER, Keys::MAX_PRICE_MULTIPLIER,
                            Keys::ABS_MIN_INIT_PRICE, Keys::BRIBE_DUST_POLICY}) {
        config.AllowKey(key, section);
    }
    config.AllowKey(Keys::NETWORK);
}

} // namespace protocol
} // namespace tributary
