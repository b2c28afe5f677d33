// TRIBUTARY - Protocol Parameters Tests
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include <gtest/gtest.h>

#include "tributary/protocol/params.h"
#include "tributary/util/time.h"

namespace tributary {
namespace protocol {
namespace {

TEST(ParamsTest, MainValues) {
    Params p = Params::Main();
    EXPECT_EQ(p.networkId, "main");
    EXPECT_EQ(p.epochDuration, util::SECONDS_PER_WEEK);
    EXPECT_EQ(p.rewardDuration, 604800);
    EXPECT_EQ(p.maxBribeSplitBps, 5000u);
    EXPECT_EQ(p.defaultBribeSplitBps, 2000u);
    EXPECT_EQ(p.bribeDustPolicy, BribeDustPolicy::Accumulate);
    EXPECT_EQ(p.minEpochPeriod, 3600);
    EXPECT_EQ(p.maxEpochPeriod, 365 * 86400);
    EXPECT_EQ(p.minPriceMultiplier, Amount("1100000000000000000"));
    EXPECT_EQ(p.maxPriceMultiplier, Amount("3000000000000000000"));
    EXPECT_EQ(p.absMinInitPrice, 1000000);
    EXPECT_EQ(p.absMaxInitPrice, MAX_UINT192);

    std::string error;
    EXPECT_TRUE(p.IsValid(error)) << error;
}

TEST(ParamsTest, RegtestAllowsTinyPrices) {
    Params p = Params::Regtest();
    EXPECT_EQ(p.networkId, "regtest");
    EXPECT_EQ(p.absMinInitPrice, 1);
    EXPECT_EQ(p.epochDuration, Params::Main().epochDuration);
    std::string error;
    EXPECT_TRUE(p.IsValid(error));
}

TEST(ParamsTest, IsValidRejectsInconsistencies) {
    std::string error;

    Params p = Params::Main();
    p.maxBribeSplitBps = 10000;
    EXPECT_FALSE(p.IsValid(error));
    EXPECT_NE(error.find("maxbribesplit"), std::string::npos);

    p = Params::Main();
    p.defaultBribeSplitBps = 6000;
    EXPECT_FALSE(p.IsValid(error));

    p = Params::Main();
    p.epochDuration = 0;
    EXPECT_FALSE(p.IsValid(error));

    p = Params::Main();
    p.minEpochPeriod = p.maxEpochPeriod + 1;
    EXPECT_FALSE(p.IsValid(error));

    p = Params::Main();
    p.minPriceMultiplier = PRECISION / 2;
    EXPECT_FALSE(p.IsValid(error));

    p = Params::Main();
    p.absMinInitPrice = 0;
    EXPECT_FALSE(p.IsValid(error));
}

TEST(DustPolicyTest, Names) {
    EXPECT_STREQ(BribeDustPolicyToString(BribeDustPolicy::Receiver), "receiver");
    EXPECT_EQ(*BribeDustPolicyFromString("TREASURY"), BribeDustPolicy::Treasury);
    EXPECT_EQ(*BribeDustPolicyFromString("accumulate"), BribeDustPolicy::Accumulate);
    EXPECT_FALSE(BribeDustPolicyFromString("burn").has_value());
}

// ============================================================================
// LoadParams
// ============================================================================

TEST(LoadParamsTest, DefaultsToMain) {
    util::ConfigManager config;
    Params p = Params::Regtest();
    ASSERT_TRUE(LoadParams(config, p).success);
    EXPECT_EQ(p.networkId, "main");
}

TEST(LoadParamsTest, AppliesOverrides) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(
        "network=regtest\n"
        "[protocol]\n"
        "epochduration=1d\n"
        "rewardduration=2d\n"
        "bribesplit=1500\n"
        "maxpricemultiplier=2e18\n"
        "bribedustpolicy=treasury\n").success);

    Params p;
    auto result = LoadParams(config, p);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(p.networkId, "regtest");
    EXPECT_EQ(p.epochDuration, 86400);
    EXPECT_EQ(p.rewardDuration, 172800);
    EXPECT_EQ(p.defaultBribeSplitBps, 1500u);
    EXPECT_EQ(p.maxPriceMultiplier, PRECISION * 2);
    EXPECT_EQ(p.bribeDustPolicy, BribeDustPolicy::Treasury);
}

TEST(LoadParamsTest, RejectsUnknownNetwork) {
    util::ConfigManager config;
    config.Set("network", "testnet");
    Params p;
    auto result = LoadParams(config, p);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("testnet"), std::string::npos);
}

TEST(LoadParamsTest, RejectsMalformedValue) {
    util::ConfigManager config;
    config.Set("epochduration", "soon", "protocol");
    Params p;
    auto result = LoadParams(config, p);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("protocol.epochduration"), std::string::npos);
}

TEST(LoadParamsTest, RejectsInconsistentResult) {
    util::ConfigManager config;
    config.Set("bribesplit", "6000", "protocol");
    Params before = Params::Regtest();
    Params p = before;
    EXPECT_FALSE(LoadParams(config, p).success);
    EXPECT_EQ(p.networkId, before.networkId);
}

TEST(LoadParamsTest, SplitAtDivisorRejected) {
    util::ConfigManager config;
    config.Set("maxbribesplit", "10000", "protocol");
    Params p;
    EXPECT_FALSE(LoadParams(config, p).success);
}

TEST(LoadParamsTest, AllowProtocolKeysSilencesValidation) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString("network=main\n[protocol]\nbribesplit=100\n").success);
    AllowProtocolKeys(config);
    EXPECT_TRUE(config.Validate().empty());

    config.Set("unknown", "1", "protocol");
    EXPECT_EQ(config.Validate().size(), 1u);
}

} // namespace
} // namespace protocol
} // namespace tributary
