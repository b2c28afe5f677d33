// TRIBUTARY - Voting Ledger Test Fixture
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Shared setup for the governance and router suites: a regtest ledger with
// a revenue token, a payment token and a handful of voters.

#ifndef TRIBUTARY_TESTS_LEDGER_TEST_FIXTURE_H
#define TRIBUTARY_TESTS_LEDGER_TEST_FIXTURE_H

#include <gtest/gtest.h>

#include "tributary/asset/asset_ledger.h"
#include "tributary/governance/voting_ledger.h"
#include "tributary/governance/voting_power.h"
#include "tributary/market/auction.h"
#include "tributary/protocol/params.h"
#include "tributary/util/time.h"

#include <memory>
#include <vector>

namespace tributary {
namespace test {

constexpr int64_t LEDGER_TEST_START = 1700000000;

class LedgerTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        util::EnableMockTime();
        util::SetMockTime(LEDGER_TEST_START);

        ASSERT_TRUE(assets_.RegisterToken(revenue_, "REV"));
        ASSERT_TRUE(assets_.RegisterToken(payment_, "PAY"));

        params_ = protocol::Params::Regtest();
        ledger_ = std::make_unique<governance::VotingLedger>(
            params_, assets_, power_, ledgerAddr_, owner_, revenue_, treasury_);
    }

    void TearDown() override {
        ledger_.reset();
        util::DisableMockTime();
    }

    market::AuctionConfig DefaultAuction() const {
        market::AuctionConfig config;
        config.initPrice = 1000;
        config.epochPeriod = 3600;
        config.priceMultiplier = PRECISION * 2;
        config.minInitPrice = 1;
        return config;
    }

    /// Register a strategy owned by the test; null on failure
    Address AddStrategy(const Address& receiver) {
        auto result = ledger_->AddStrategy(owner_, payment_, receiver, DefaultAuction());
        EXPECT_TRUE(result.IsSuccess()) << ResultCodeToString(result.code);
        return result.strategy;
    }

    /// Mint revenue to the owner and notify it into the ledger
    ResultCode Notify(const Amount& amount) {
        EXPECT_EQ(assets_.Mint(revenue_, owner_, amount), ResultCode::Success);
        EXPECT_EQ(assets_.Approve(revenue_, owner_, ledgerAddr_, amount), ResultCode::Success);
        return ledger_->NotifyRevenue(owner_, amount);
    }

    ResultCode VoteFor(const Address& account, const std::vector<Address>& strategies,
                       const std::vector<Amount>& weights) {
        return ledger_->Vote(account, strategies, weights);
    }

    void AdvanceToNextEpoch() {
        util::SetMockTime(util::NextEpochStart(util::GetTime(), params_.epochDuration));
    }

    Amount AuctionBalance(const Address& strategy) const {
        return assets_.BalanceOf(revenue_, strategy);
    }

    protocol::Params params_;
    asset::MemoryAssetLedger assets_;
    governance::VotingPowerTracker power_;
    std::unique_ptr<governance::VotingLedger> ledger_;

    Address owner_ = Address::FromId(1);
    Address treasury_ = Address::FromId(2);
    Address ledgerAddr_ = Address::FromId(3);
    Address revenue_ = Address::FromId(100);
    Address payment_ = Address::FromId(101);
    Address alice_ = Address::FromId(10);
    Address bob_ = Address::FromId(11);
    Address carol_ = Address::FromId(12);
    Address receiver_ = Address::FromId(20);
};

} // namespace test
} // namespace tributary

#endif // TRIBUTARY_TESTS_LEDGER_TEST_FIXTURE_H
