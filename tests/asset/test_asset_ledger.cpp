// TRIBUTARY - Asset Ledger Tests
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include <gtest/gtest.h>

#include "tributary/asset/asset_ledger.h"

namespace tributary {
namespace asset {
namespace {

class MemoryAssetLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ledger_.RegisterToken(token_, "TKN", 18));
        ASSERT_EQ(ledger_.Mint(token_, alice_, 1000), ResultCode::Success);
    }

    MemoryAssetLedger ledger_;
    Address token_ = Address::FromId(100);
    Address alice_ = Address::FromId(1);
    Address bob_ = Address::FromId(2);
    Address carol_ = Address::FromId(3);
};

// ============================================================================
// Registration and Supply
// ============================================================================

TEST_F(MemoryAssetLedgerTest, RegisterToken) {
    EXPECT_FALSE(ledger_.RegisterToken(token_, "DUP"));
    EXPECT_FALSE(ledger_.RegisterToken(Address(), "NULL"));
    EXPECT_TRUE(ledger_.HasToken(token_));
    EXPECT_EQ(*ledger_.Decimals(token_), 18);
    EXPECT_FALSE(ledger_.Decimals(Address::FromId(999)).has_value());

    auto found = ledger_.FindToken("TKN");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, token_);
    EXPECT_FALSE(ledger_.FindToken("NOPE").has_value());
}

TEST_F(MemoryAssetLedgerTest, MintAndBurnTrackSupply) {
    EXPECT_EQ(ledger_.GetTokenInfo(token_)->totalSupply, 1000);
    EXPECT_EQ(ledger_.Burn(token_, alice_, 400), ResultCode::Success);
    EXPECT_EQ(ledger_.BalanceOf(token_, alice_), 600);
    EXPECT_EQ(ledger_.GetTokenInfo(token_)->totalSupply, 600);
    EXPECT_EQ(ledger_.Burn(token_, alice_, 601), ResultCode::InsufficientBalance);
    EXPECT_EQ(ledger_.Mint(Address::FromId(999), alice_, 1), ResultCode::UnknownToken);
    EXPECT_EQ(ledger_.Mint(token_, Address(), 1), ResultCode::ZeroAddress);
}

// ============================================================================
// Transfers
// ============================================================================

TEST_F(MemoryAssetLedgerTest, Transfer) {
    EXPECT_EQ(ledger_.Transfer(token_, alice_, bob_, 300), ResultCode::Success);
    EXPECT_EQ(ledger_.BalanceOf(token_, alice_), 700);
    EXPECT_EQ(ledger_.BalanceOf(token_, bob_), 300);
    EXPECT_EQ(ledger_.SumBalances(token_), 1000);
}

TEST_F(MemoryAssetLedgerTest, TransferFailuresChangeNothing) {
    EXPECT_EQ(ledger_.Transfer(token_, alice_, bob_, 1001), ResultCode::InsufficientBalance);
    EXPECT_EQ(ledger_.Transfer(token_, alice_, Address(), 1), ResultCode::ZeroAddress);
    EXPECT_EQ(ledger_.Transfer(Address::FromId(999), alice_, bob_, 1),
              ResultCode::UnknownToken);
    EXPECT_EQ(ledger_.BalanceOf(token_, alice_), 1000);
    EXPECT_EQ(ledger_.BalanceOf(token_, bob_), 0);
}

TEST_F(MemoryAssetLedgerTest, ZeroAndSelfTransfers) {
    EXPECT_EQ(ledger_.Transfer(token_, bob_, alice_, 0), ResultCode::Success);
    EXPECT_EQ(ledger_.Transfer(token_, alice_, alice_, 500), ResultCode::Success);
    EXPECT_EQ(ledger_.BalanceOf(token_, alice_), 1000);
    EXPECT_EQ(ledger_.Transfer(token_, alice_, alice_, 1001),
              ResultCode::InsufficientBalance);
}

// ============================================================================
// Allowances
// ============================================================================

TEST_F(MemoryAssetLedgerTest, TransferFromSpendsAllowance) {
    ASSERT_EQ(ledger_.Approve(token_, alice_, bob_, 500), ResultCode::Success);
    EXPECT_EQ(ledger_.Allowance(token_, alice_, bob_), 500);

    EXPECT_EQ(ledger_.TransferFrom(token_, bob_, alice_, carol_, 200), ResultCode::Success);
    EXPECT_EQ(ledger_.Allowance(token_, alice_, bob_), 300);
    EXPECT_EQ(ledger_.BalanceOf(token_, carol_), 200);
    EXPECT_EQ(ledger_.BalanceOf(token_, alice_), 800);
}

TEST_F(MemoryAssetLedgerTest, TransferFromChecksAllowanceFirst) {
    ASSERT_EQ(ledger_.Approve(token_, bob_, carol_, 10), ResultCode::Success);
    // bob holds nothing, but the allowance check comes first
    EXPECT_EQ(ledger_.TransferFrom(token_, carol_, bob_, carol_, 11),
              ResultCode::InsufficientAllowance);
    EXPECT_EQ(ledger_.TransferFrom(token_, carol_, bob_, carol_, 10),
              ResultCode::InsufficientBalance);
    EXPECT_EQ(ledger_.Allowance(token_, bob_, carol_), 10);
}

TEST_F(MemoryAssetLedgerTest, TransferFromSelfNeedsNoAllowance) {
    EXPECT_EQ(ledger_.TransferFrom(token_, alice_, alice_, bob_, 100), ResultCode::Success);
    EXPECT_EQ(ledger_.BalanceOf(token_, bob_), 100);
}

TEST_F(MemoryAssetLedgerTest, TransferFromZeroAmountNeedsNoAllowance) {
    EXPECT_EQ(ledger_.TransferFrom(token_, bob_, alice_, carol_, 0), ResultCode::Success);
}

TEST_F(MemoryAssetLedgerTest, ApproveOverwrites) {
    ASSERT_EQ(ledger_.Approve(token_, alice_, bob_, 500), ResultCode::Success);
    ASSERT_EQ(ledger_.Approve(token_, alice_, bob_, 0), ResultCode::Success);
    EXPECT_EQ(ledger_.Allowance(token_, alice_, bob_), 0);
    EXPECT_EQ(ledger_.Approve(token_, alice_, Address(), 1), ResultCode::ZeroAddress);
    EXPECT_EQ(ledger_.Approve(Address::FromId(999), alice_, bob_, 1),
              ResultCode::UnknownToken);
}

TEST_F(MemoryAssetLedgerTest, LargeAmounts) {
    Amount big = MAX_UINT192;
    ASSERT_EQ(ledger_.Mint(token_, bob_, big), ResultCode::Success);
    EXPECT_EQ(ledger_.Transfer(token_, bob_, carol_, big), ResultCode::Success);
    EXPECT_EQ(ledger_.BalanceOf(token_, carol_), big);
    EXPECT_EQ(ledger_.SumBalances(token_), big + 1000);
}

} // namespace
} // namespace asset
} // namespace tributary
