// TRIBUTARY - Revenue Distribution Tests
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "ledger_test_fixture.h"

#include <algorithm>
#include <vector>

namespace tributary {
namespace governance {
namespace {

class DistributionTest : public test::LedgerTestBase {
protected:
    /// Three strategies weighted 100/200/300 by three voters
    void SetUpThreeStrategies() {
        for (int i = 0; i < 3; ++i) {
            strategies_.push_back(AddStrategy(receiver_));
        }
        power_.UpdateVotingPower(alice_, 100);
        power_.UpdateVotingPower(bob_, 200);
        power_.UpdateVotingPower(carol_, 300);
        ASSERT_EQ(VoteFor(alice_, {strategies_[0]}, {1}), ResultCode::Success);
        ASSERT_EQ(VoteFor(bob_, {strategies_[1]}, {1}), ResultCode::Success);
        ASSERT_EQ(VoteFor(carol_, {strategies_[2]}, {1}), ResultCode::Success);
    }

    Amount TotalDistributed() const {
        Amount total;
        for (const auto& s : strategies_) {
            total += AuctionBalance(s);
        }
        return total;
    }

    std::vector<Address> strategies_;
};

TEST_F(DistributionTest, ThreeWayScenario) {
    SetUpThreeStrategies();
    EXPECT_EQ(ledger_->GetTotalWeight(), 600);
    ASSERT_EQ(Notify(600), ResultCode::Success);

    ASSERT_EQ(ledger_->Distribute(strategies_[1]), ResultCode::Success);
    ASSERT_EQ(ledger_->Distribute(strategies_[0]), ResultCode::Success);
    ASSERT_EQ(ledger_->Distribute(strategies_[2]), ResultCode::Success);

    EXPECT_EQ(AuctionBalance(strategies_[0]), 100);
    EXPECT_EQ(AuctionBalance(strategies_[1]), 200);
    EXPECT_EQ(AuctionBalance(strategies_[2]), 300);
    EXPECT_EQ(assets_.BalanceOf(revenue_, ledgerAddr_), 0);
    EXPECT_EQ(ledger_->GetAuction(strategies_[0])->GetRevenueBalance(), 100);
}

TEST_F(DistributionTest, Idempotent) {
    SetUpThreeStrategies();
    ASSERT_EQ(Notify(600), ResultCode::Success);
    ASSERT_EQ(ledger_->Distribute(strategies_[2]), ResultCode::Success);
    ASSERT_EQ(ledger_->Distribute(strategies_[2]), ResultCode::Success);
    EXPECT_EQ(AuctionBalance(strategies_[2]), 300);
    EXPECT_EQ(ledger_->PendingClaimable(strategies_[2]), 0);
}

TEST_F(DistributionTest, ConservationWithDust) {
    SetUpThreeStrategies();
    const std::vector<Amount> batches = {7, 1000003, 599, 1, 123456789};
    Amount notified;
    for (size_t i = 0; i < batches.size(); ++i) {
        ASSERT_EQ(Notify(batches[i]), ResultCode::Success);
        notified += batches[i];
        ASSERT_EQ(ledger_->Distribute(strategies_[i % 3]), ResultCode::Success);
    }
    ASSERT_EQ(ledger_->DistributeAll(), ResultCode::Success);

    Amount distributed = TotalDistributed();
    EXPECT_LE(distributed, notified);
    // at most one unit per strategy per catch-up
    EXPECT_LE(notified - distributed, Amount(3 * (batches.size() + 1)));
    EXPECT_EQ(assets_.BalanceOf(revenue_, ledgerAddr_), notified - distributed);
}

TEST_F(DistributionTest, Proportionality) {
    for (int i = 0; i < 3; ++i) {
        strategies_.push_back(AddStrategy(receiver_));
    }
    power_.UpdateVotingPower(alice_, 7);
    ASSERT_EQ(VoteFor(alice_, strategies_, {1, 2, 4}), ResultCode::Success);
    // alice: 1, 2, 4 out of 7
    const Amount revenue = 1000000;
    ASSERT_EQ(Notify(revenue), ResultCode::Success);
    ASSERT_EQ(ledger_->DistributeAll(), ResultCode::Success);

    const std::vector<Amount> weights = {1, 2, 4};
    for (size_t i = 0; i < 3; ++i) {
        Amount expected = revenue * weights[i] / 7;
        Amount got = AuctionBalance(strategies_[i]);
        EXPECT_LE(got, expected);
        EXPECT_LE(expected - got, 1) << "strategy " << i;
    }
}

/// Build a fresh three-strategy ledger, notify twice and distribute in `order`.
/// Strategy 0 is also caught up between the notifications, for every order.
std::vector<Amount> RunDistributionOrder(const std::vector<size_t>& order) {
    asset::MemoryAssetLedger assets;
    VotingPowerTracker power;
    const Address owner = Address::FromId(1);
    const Address ledgerAddr = Address::FromId(3);
    const Address revenue = Address::FromId(100);
    const Address payment = Address::FromId(101);
    EXPECT_TRUE(assets.RegisterToken(revenue, "REV"));
    EXPECT_TRUE(assets.RegisterToken(payment, "PAY"));
    VotingLedger ledger(protocol::Params::Regtest(), assets, power, ledgerAddr, owner,
                        revenue, Address::FromId(2));

    market::AuctionConfig config;
    config.initPrice = 1000;
    config.epochPeriod = 3600;
    config.priceMultiplier = PRECISION * 2;
    config.minInitPrice = 1;

    std::vector<Address> strategies;
    for (uint64_t i = 0; i < 3; ++i) {
        auto added = ledger.AddStrategy(owner, payment, Address::FromId(20), config);
        EXPECT_TRUE(added.IsSuccess());
        strategies.push_back(added.strategy);
        Address voter = Address::FromId(10 + i);
        power.UpdateVotingPower(voter, Amount(100) * (i + 1));
        EXPECT_EQ(ledger.Vote(voter, {strategies.back()}, {1}), ResultCode::Success);
    }

    auto notify = [&](const Amount& amount) {
        EXPECT_EQ(assets.Mint(revenue, owner, amount), ResultCode::Success);
        EXPECT_EQ(assets.Approve(revenue, owner, ledgerAddr, amount), ResultCode::Success);
        EXPECT_EQ(ledger.NotifyRevenue(owner, amount), ResultCode::Success);
    };

    notify(1001);
    EXPECT_EQ(ledger.Distribute(strategies[0]), ResultCode::Success);
    notify(77);
    for (size_t i : order) {
        EXPECT_EQ(ledger.Distribute(strategies[i]), ResultCode::Success);
    }

    std::vector<Amount> balances;
    for (const auto& s : strategies) {
        balances.push_back(assets.BalanceOf(revenue, s));
    }
    return balances;
}

TEST_F(DistributionTest, OrderIndependence) {
    std::vector<size_t> order = {0, 1, 2};
    const std::vector<Amount> reference = RunDistributionOrder(order);
    while (std::next_permutation(order.begin(), order.end())) {
        EXPECT_EQ(RunDistributionOrder(order), reference);
    }
}

TEST_F(DistributionTest, ClaimableSurvivesWeightChange) {
    SetUpThreeStrategies();
    ASSERT_EQ(Notify(600), ResultCode::Success);

    AdvanceToNextEpoch();
    ASSERT_EQ(ledger_->Reset(carol_), ResultCode::Success);
    EXPECT_EQ(ledger_->GetStrategy(strategies_[2])->claimable, 300);

    ASSERT_EQ(Notify(300), ResultCode::Success);
    ASSERT_EQ(ledger_->DistributeAll(), ResultCode::Success);
    EXPECT_EQ(AuctionBalance(strategies_[0]), 200);
    EXPECT_EQ(AuctionBalance(strategies_[1]), 400);
    EXPECT_EQ(AuctionBalance(strategies_[2]), 300);
}

TEST_F(DistributionTest, DeadStrategyDistributesNothing) {
    SetUpThreeStrategies();
    ASSERT_EQ(Notify(600), ResultCode::Success);
    ASSERT_EQ(ledger_->KillStrategy(owner_, strategies_[0]), ResultCode::Success);
    ASSERT_EQ(ledger_->Distribute(strategies_[0]), ResultCode::Success);
    EXPECT_EQ(AuctionBalance(strategies_[0]), 0);
    EXPECT_EQ(assets_.BalanceOf(revenue_, treasury_), 100);
}

TEST_F(DistributionTest, RangeDistribution) {
    SetUpThreeStrategies();
    ASSERT_EQ(Notify(600), ResultCode::Success);
    ASSERT_EQ(ledger_->DistributeRange(1, 3), ResultCode::Success);
    EXPECT_EQ(AuctionBalance(strategies_[0]), 0);
    EXPECT_EQ(AuctionBalance(strategies_[1]), 200);
    EXPECT_EQ(AuctionBalance(strategies_[2]), 300);
    EXPECT_EQ(ledger_->PendingClaimable(strategies_[0]), 100);
}

} // namespace
} // namespace governance
} // namespace tributary
