// TRIBUTARY - Snapshot View Tests
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "../governance/ledger_test_fixture.h"

#include "tributary/router/atomic_router.h"
#include "tributary/router/views.h"

namespace tributary {
namespace router {
namespace {

class ViewsTest : public test::LedgerTestBase {
protected:
    void SetUp() override {
        test::LedgerTestBase::SetUp();
        first_ = AddStrategy(receiver_);
        second_ = AddStrategy(receiver_);
        power_.UpdateVotingPower(alice_, 100);
        power_.UpdateVotingPower(bob_, 300);
        ASSERT_EQ(VoteFor(alice_, {first_}, {1}), ResultCode::Success);
        ASSERT_EQ(VoteFor(bob_, {second_}, {1}), ResultCode::Success);
    }

    Address first_;
    Address second_;
};

TEST_F(ViewsTest, StrategySnapshot) {
    ASSERT_EQ(Notify(400), ResultCode::Success);

    auto snap = GetStrategySnapshot(*ledger_, first_, alice_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->strategy, first_);
    EXPECT_EQ(snap->index, 0u);
    EXPECT_EQ(snap->paymentToken, payment_);
    EXPECT_EQ(snap->receiver, receiver_);
    EXPECT_TRUE(snap->isAlive);
    EXPECT_EQ(snap->weight, 100);
    EXPECT_EQ(snap->votePercent, PRECISION * 25);
    EXPECT_EQ(snap->claimable, 100);
    EXPECT_EQ(snap->revenueBalance, 0);
    EXPECT_EQ(snap->epochId, 0u);
    EXPECT_EQ(snap->epochStart, test::LEDGER_TEST_START);
    EXPECT_EQ(snap->initPrice, 1000);
    EXPECT_EQ(snap->price, 1000);
    EXPECT_EQ(snap->accountVote, 100);

    ASSERT_EQ(ledger_->Distribute(first_), ResultCode::Success);
    snap = GetStrategySnapshot(*ledger_, first_, bob_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->claimable, 0);
    EXPECT_EQ(snap->revenueBalance, 100);
    EXPECT_EQ(snap->accountVote, 0);

    std::string text = snap->ToString();
    EXPECT_NE(text.find("[alive]"), std::string::npos);
    EXPECT_NE(text.find("(25%)"), std::string::npos);
}

TEST_F(ViewsTest, PriceDecaysInSnapshot) {
    util::SetMockTime(test::LEDGER_TEST_START + 900);
    auto snap = GetStrategySnapshot(*ledger_, second_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->price, 750);
    EXPECT_EQ(snap->votePercent, PRECISION * 75);
    EXPECT_EQ(snap->accountVote, 0);
}

TEST_F(ViewsTest, UnknownStrategy) {
    EXPECT_FALSE(GetStrategySnapshot(*ledger_, Address::FromId(77)).has_value());
    EXPECT_FALSE(GetRewardSnapshot(*ledger_, Address::FromId(77)).has_value());
}

TEST_F(ViewsTest, AllSnapshotsInRegistrationOrder) {
    ASSERT_EQ(ledger_->KillStrategy(owner_, second_), ResultCode::Success);
    auto all = GetAllStrategySnapshots(*ledger_, bob_);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].strategy, first_);
    EXPECT_EQ(all[1].strategy, second_);
    EXPECT_EQ(all[1].index, 1u);
    EXPECT_FALSE(all[1].isAlive);
    EXPECT_EQ(all[1].accountVote, 300);
    EXPECT_NE(all[1].ToString().find("[dead]"), std::string::npos);
}

TEST_F(ViewsTest, NoWeightNoPercent) {
    // reset is epoch gated like voting
    EXPECT_EQ(ledger_->Reset(alice_), ResultCode::AlreadyResetThisEpoch);
    EXPECT_EQ(GetStrategySnapshot(*ledger_, first_)->weight, 100);

    AdvanceToNextEpoch();
    ASSERT_EQ(ledger_->Reset(alice_), ResultCode::Success);
    ASSERT_EQ(ledger_->Reset(bob_), ResultCode::Success);
    auto snap = GetStrategySnapshot(*ledger_, first_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->weight, 0);
    EXPECT_EQ(snap->votePercent, 0);
}

TEST_F(ViewsTest, RewardSnapshot) {
    const Address buyer = Address::FromId(30);
    const Address routerAddr = Address::FromId(50);
    AtomicRouter router(routerAddr, *ledger_, assets_);
    ASSERT_EQ(Notify(400), ResultCode::Success);
    ASSERT_EQ(assets_.Mint(payment_, buyer, 1000), ResultCode::Success);
    ASSERT_EQ(assets_.Approve(payment_, buyer, routerAddr, 1000), ResultCode::Success);
    ASSERT_TRUE(router.DistributeAndBuy(buyer, first_, 0, util::GetTime(), 1000).IsSuccess());

    auto snap = GetRewardSnapshot(*ledger_, first_, alice_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->strategy, first_);
    EXPECT_EQ(snap->totalSupply, 100);
    EXPECT_EQ(snap->accountBalance, 100);
    // 20% of 1000 is below one unit per second of the reward period
    EXPECT_EQ(snap->bribeHeld, 200);
    ASSERT_EQ(snap->tokens.size(), 1u);
    EXPECT_EQ(snap->tokens[0].token, payment_);
    EXPECT_EQ(snap->tokens[0].rewardRate, 0);
    EXPECT_EQ(snap->tokens[0].periodFinish, 0);
    EXPECT_EQ(snap->tokens[0].earned, 0);

    auto anonymous = GetRewardSnapshot(*ledger_, first_);
    ASSERT_TRUE(anonymous.has_value());
    EXPECT_EQ(anonymous->accountBalance, 0);
}

TEST_F(ViewsTest, AccountSnapshot) {
    AccountSnapshot snap = GetAccountSnapshot(*ledger_, alice_);
    EXPECT_EQ(snap.account, alice_);
    EXPECT_EQ(snap.votingPower, 100);
    EXPECT_EQ(snap.usedWeight, 100);
    ASSERT_TRUE(snap.lastVoted.has_value());
    EXPECT_EQ(*snap.lastVoted, test::LEDGER_TEST_START);
    EXPECT_FALSE(snap.canVote);
    ASSERT_EQ(snap.votes.size(), 1u);
    EXPECT_EQ(snap.votes[0].first, first_);
    EXPECT_EQ(snap.votes[0].second, 100);

    AdvanceToNextEpoch();
    EXPECT_TRUE(GetAccountSnapshot(*ledger_, alice_).canVote);

    AccountSnapshot stranger = GetAccountSnapshot(*ledger_, carol_);
    EXPECT_EQ(stranger.votingPower, 0);
    EXPECT_EQ(stranger.usedWeight, 0);
    EXPECT_FALSE(stranger.lastVoted.has_value());
    EXPECT_TRUE(stranger.canVote);
    EXPECT_TRUE(stranger.votes.empty());
}

} // namespace
} // namespace router
} // namespace tributary
