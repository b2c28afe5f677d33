// TRIBUTARY - Reward Stream Tests
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include <gtest/gtest.h>

#include "tributary/asset/asset_ledger.h"
#include "tributary/economics/reward_stream.h"
#include "tributary/util/time.h"

namespace tributary {
namespace economics {
namespace {

constexpr int64_t WEEK = 604800;
constexpr int64_t START = 1700000000;

class RewardStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::EnableMockTime();
        util::SetMockTime(START);
        ASSERT_TRUE(assets_.RegisterToken(token_, "BRIBE"));
        ASSERT_EQ(stream_.AddRewardToken(ledger_, token_), ResultCode::Success);
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    /// Mint `amount` to the funder and notify it into the stream
    ResultCode Fund(const Amount& amount) {
        EXPECT_EQ(assets_.Mint(token_, funder_, amount), ResultCode::Success);
        EXPECT_EQ(assets_.Approve(token_, funder_, streamAddr_, amount), ResultCode::Success);
        return stream_.NotifyRewardAmount(funder_, token_, amount);
    }

    asset::MemoryAssetLedger assets_;
    Address token_ = Address::FromId(500);
    Address ledger_ = Address::FromId(10);
    Address streamAddr_ = Address::FromId(11);
    Address funder_ = Address::FromId(12);
    Address alice_ = Address::FromId(1);
    Address bob_ = Address::FromId(2);
    RewardStream stream_{streamAddr_, ledger_, assets_, WEEK};
};

// ============================================================================
// Registration and Balances
// ============================================================================

TEST_F(RewardStreamTest, OnlyLedgerMovesBalances) {
    EXPECT_EQ(stream_.Deposit(alice_, alice_, 100), ResultCode::NotAuthorized);
    EXPECT_EQ(stream_.Withdraw(alice_, alice_, 100), ResultCode::NotAuthorized);
    EXPECT_EQ(stream_.AddRewardToken(alice_, Address::FromId(501)), ResultCode::NotAuthorized);
}

TEST_F(RewardStreamTest, AddRewardTokenRules) {
    EXPECT_EQ(stream_.AddRewardToken(ledger_, token_),
              ResultCode::RewardTokenAlreadyRegistered);
    EXPECT_EQ(stream_.AddRewardToken(ledger_, Address()), ResultCode::ZeroAddress);
    EXPECT_TRUE(stream_.IsRewardToken(token_));
    EXPECT_EQ(stream_.GetRewardTokens().size(), 1u);
}

TEST_F(RewardStreamTest, DepositWithdraw) {
    ASSERT_EQ(stream_.Deposit(ledger_, alice_, 300), ResultCode::Success);
    ASSERT_EQ(stream_.Deposit(ledger_, bob_, 100), ResultCode::Success);
    EXPECT_EQ(stream_.TotalSupply(), 400);
    EXPECT_EQ(stream_.BalanceOf(alice_), 300);

    EXPECT_EQ(stream_.Withdraw(ledger_, alice_, 301), ResultCode::InsufficientBalance);
    EXPECT_EQ(stream_.Withdraw(ledger_, alice_, 0), ResultCode::InvalidAmount);
    EXPECT_EQ(stream_.Deposit(ledger_, Address(), 1), ResultCode::ZeroAddress);
    ASSERT_EQ(stream_.Withdraw(ledger_, alice_, 300), ResultCode::Success);
    EXPECT_EQ(stream_.TotalSupply(), 100);
    EXPECT_EQ(stream_.BalanceOf(alice_), 0);
}

// ============================================================================
// Notification
// ============================================================================

TEST_F(RewardStreamTest, NotifySetsRateWithTruncation) {
    ASSERT_EQ(stream_.Deposit(ledger_, alice_, 1), ResultCode::Success);
    ASSERT_EQ(Fund(WEEK * 2 + 7), ResultCode::Success);

    auto data = stream_.GetRewardData(token_);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->rewardRate, 2);
    EXPECT_EQ(data->periodFinish, START + WEEK);
    EXPECT_EQ(data->lastUpdateTime, START);
    EXPECT_EQ(stream_.Left(token_), WEEK * 2);
    EXPECT_EQ(assets_.BalanceOf(token_, streamAddr_), WEEK * 2 + 7);
}

TEST_F(RewardStreamTest, NotifyRejectsRateZero) {
    EXPECT_EQ(Fund(WEEK - 1), ResultCode::RewardTooSmall);
    // nothing pulled
    EXPECT_EQ(assets_.BalanceOf(token_, streamAddr_), 0);
    EXPECT_EQ(stream_.Left(token_), 0);
}

TEST_F(RewardStreamTest, NotifyRejectsBelowRemainder) {
    ASSERT_EQ(Fund(WEEK * 10), ResultCode::Success);
    util::AdvanceMockTime(util::Seconds{WEEK / 2});
    EXPECT_EQ(stream_.Left(token_), (WEEK / 2) * 10);
    EXPECT_EQ(Fund((WEEK / 2) * 10 - 1), ResultCode::RewardTooSmall);
}

TEST_F(RewardStreamTest, NotifyRollsRemainderIntoNewRate) {
    ASSERT_EQ(Fund(WEEK * 10), ResultCode::Success);
    util::AdvanceMockTime(util::Seconds{WEEK / 2});
    ASSERT_EQ(Fund(WEEK * 10), ResultCode::Success);

    auto data = stream_.GetRewardData(token_);
    EXPECT_EQ(data->rewardRate, 15);    // (10w + 5w) / w
    EXPECT_EQ(data->periodFinish, START + WEEK / 2 + WEEK);
}

TEST_F(RewardStreamTest, NotifyUnknownTokenOrZero) {
    EXPECT_EQ(stream_.NotifyRewardAmount(funder_, Address::FromId(999), WEEK),
              ResultCode::RewardTokenNotRegistered);
    EXPECT_EQ(stream_.NotifyRewardAmount(funder_, token_, 0), ResultCode::InvalidAmount);
}

TEST_F(RewardStreamTest, NotifyWithoutAllowanceFails) {
    ASSERT_EQ(assets_.Mint(token_, funder_, WEEK), ResultCode::Success);
    EXPECT_EQ(stream_.NotifyRewardAmount(funder_, token_, WEEK),
              ResultCode::InsufficientAllowance);
    EXPECT_EQ(stream_.GetRewardData(token_)->periodFinish, 0);
}

// ============================================================================
// Accrual
// ============================================================================

TEST_F(RewardStreamTest, ProportionalAccrual) {
    ASSERT_EQ(stream_.Deposit(ledger_, alice_, 300), ResultCode::Success);
    ASSERT_EQ(stream_.Deposit(ledger_, bob_, 100), ResultCode::Success);
    ASSERT_EQ(Fund(WEEK * 4), ResultCode::Success);

    util::AdvanceMockTime(util::Seconds{WEEK});
    EXPECT_EQ(stream_.Earned(alice_, token_), WEEK * 3);
    EXPECT_EQ(stream_.Earned(bob_, token_), WEEK);

    // no accrual past periodFinish
    util::AdvanceMockTime(util::Seconds{WEEK});
    EXPECT_EQ(stream_.Earned(alice_, token_), WEEK * 3);
    EXPECT_EQ(stream_.LastTimeRewardApplicable(token_), START + WEEK);
}

TEST_F(RewardStreamTest, LateDepositOnlyEarnsFromEntry) {
    ASSERT_EQ(stream_.Deposit(ledger_, alice_, 100), ResultCode::Success);
    ASSERT_EQ(Fund(WEEK * 2), ResultCode::Success);

    util::AdvanceMockTime(util::Seconds{WEEK / 2});
    ASSERT_EQ(stream_.Deposit(ledger_, bob_, 100), ResultCode::Success);
    util::AdvanceMockTime(util::Seconds{WEEK / 2});

    EXPECT_EQ(stream_.Earned(alice_, token_), WEEK + WEEK / 2);
    EXPECT_EQ(stream_.Earned(bob_, token_), WEEK / 2);
}

TEST_F(RewardStreamTest, WithdrawKeepsEarned) {
    ASSERT_EQ(stream_.Deposit(ledger_, alice_, 100), ResultCode::Success);
    ASSERT_EQ(Fund(WEEK), ResultCode::Success);
    util::AdvanceMockTime(util::Seconds{WEEK / 4});
    ASSERT_EQ(stream_.Withdraw(ledger_, alice_, 100), ResultCode::Success);
    util::AdvanceMockTime(util::Seconds{WEEK});
    EXPECT_EQ(stream_.Earned(alice_, token_), WEEK / 4);
}

TEST_F(RewardStreamTest, NoSupplyMeansNoAccrual) {
    ASSERT_EQ(Fund(WEEK), ResultCode::Success);
    util::AdvanceMockTime(util::Seconds{WEEK});
    EXPECT_EQ(stream_.RewardPerToken(token_), 0);
}

// ============================================================================
// Claims
// ============================================================================

TEST_F(RewardStreamTest, GetRewardPaysAndResets) {
    ASSERT_EQ(stream_.Deposit(ledger_, alice_, 300), ResultCode::Success);
    ASSERT_EQ(stream_.Deposit(ledger_, bob_, 100), ResultCode::Success);
    ASSERT_EQ(Fund(WEEK * 4), ResultCode::Success);
    util::AdvanceMockTime(util::Seconds{WEEK});

    ASSERT_EQ(stream_.GetReward(alice_), ResultCode::Success);
    EXPECT_EQ(assets_.BalanceOf(token_, alice_), WEEK * 3);
    EXPECT_EQ(stream_.Earned(alice_, token_), 0);

    ASSERT_EQ(stream_.GetReward(bob_), ResultCode::Success);
    EXPECT_EQ(assets_.BalanceOf(token_, bob_), WEEK);
    EXPECT_EQ(assets_.BalanceOf(token_, streamAddr_), 0);
}

TEST_F(RewardStreamTest, GetRewardWithNothingAccruedIsNoOp) {
    EXPECT_EQ(stream_.GetReward(alice_), ResultCode::Success);
    EXPECT_EQ(assets_.BalanceOf(token_, alice_), 0);
}

TEST_F(RewardStreamTest, PaidNeverExceedsNotified) {
    ASSERT_EQ(stream_.Deposit(ledger_, alice_, 7), ResultCode::Success);
    ASSERT_EQ(stream_.Deposit(ledger_, bob_, 13), ResultCode::Success);
    const Amount notified = Amount(WEEK) * 3 + 12345;
    ASSERT_EQ(Fund(notified), ResultCode::Success);

    util::AdvanceMockTime(util::Seconds{WEEK / 3});
    ASSERT_EQ(stream_.GetReward(alice_), ResultCode::Success);
    util::AdvanceMockTime(util::Seconds{WEEK});
    ASSERT_EQ(stream_.GetReward(alice_), ResultCode::Success);
    ASSERT_EQ(stream_.GetReward(bob_), ResultCode::Success);

    Amount paid = assets_.BalanceOf(token_, alice_) + assets_.BalanceOf(token_, bob_);
    EXPECT_LE(paid, notified);
    EXPECT_EQ(paid + assets_.BalanceOf(token_, streamAddr_), notified);
}

// ============================================================================
// Precision
// ============================================================================

TEST_F(RewardStreamTest, SmallBatchAgainstHugeSupplyRoundsToZero) {
    ASSERT_EQ(stream_.Deposit(ledger_, alice_, Amount(27000000) * PRECISION),
              ResultCode::Success);
    ASSERT_EQ(Fund(818777), ResultCode::Success);
    EXPECT_EQ(stream_.GetRewardData(token_)->rewardRate, 1);

    util::AdvanceMockTime(util::Seconds{WEEK});
    EXPECT_EQ(stream_.RewardPerToken(token_), 0);
    EXPECT_EQ(stream_.Earned(alice_, token_), 0);
}

TEST_F(RewardStreamTest, ProductionScaleAccrual) {
    const Amount supply = *ParseAmount("269960.52e18");
    const Amount user = Amount(105000) * PRECISION;
    ASSERT_EQ(stream_.Deposit(ledger_, alice_, user), ResultCode::Success);
    ASSERT_EQ(stream_.Deposit(ledger_, bob_, supply - user), ResultCode::Success);
    ASSERT_EQ(Fund(Amount(1000) * PRECISION), ResultCode::Success);
    EXPECT_EQ(stream_.GetRewardData(token_)->rewardRate, Amount("1653439153439153"));

    util::AdvanceMockTime(util::Seconds{WEEK / 2});
    EXPECT_EQ(stream_.RewardPerToken(token_), Amount("1852122673344976"));
    EXPECT_EQ(stream_.Earned(alice_, token_), Amount("194472880701222480000"));

    util::AdvanceMockTime(util::Seconds{WEEK / 2});
    EXPECT_EQ(stream_.RewardPerToken(token_), Amount("3704245346689952"));
    EXPECT_EQ(stream_.Earned(alice_, token_), Amount("388945761402444960000"));
}

} // namespace
} // namespace economics
} // namespace tributary
