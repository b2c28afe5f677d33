// TRIBUTARY - Reward Stream
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Duration-based streaming payout shared by many reward tokens. Each
// strategy owns one stream; the voting ledger mirrors every voter's
// committed weight into it as a virtual balance, and auction proceeds are
// streamed to those balances over rewardDuration.

#ifndef TRIBUTARY_ECONOMICS_REWARD_STREAM_H
#define TRIBUTARY_ECONOMICS_REWARD_STREAM_H

#include "tributary/asset/asset_ledger.h"
#include "tributary/core/result.h"
#include "tributary/core/types.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tributary {
namespace economics {

// ============================================================================
// Reward Data
// ============================================================================

/// Per-token stream state
struct RewardData {
    Timestamp periodFinish{0};
    Amount rewardRate;              // Units per second
    Timestamp lastUpdateTime{0};
    Amount rewardPerTokenStored;    // Scaled by PRECISION

    /// Human-readable summary
    std::string ToString() const;
};

// ============================================================================
// Reward Stream
// ============================================================================

/**
 * Multi-token reward stream over virtual balances.
 *
 * rewardPerToken grows by elapsed * rewardRate * PRECISION / totalSupply
 * while a period is running and supply is non-zero; an account earns
 * balance * (rewardPerToken - paid) / PRECISION on top of its owed amount.
 *
 * Integer truncation is accepted as-is: rewardRate = amount / duration drops
 * up to duration - 1 units per notification, and with a very large
 * totalSupply the per-token delta of a small batch rounds to zero for the
 * entire period.
 *
 * Deposit, Withdraw and AddRewardToken are restricted to the owning ledger.
 */
class RewardStream {
public:
    /**
     * @param self Address holding the stream's reward tokens
     * @param ledger Only address allowed to move virtual balances
     * @param duration Streaming period in seconds
     */
    RewardStream(const Address& self, const Address& ledger,
                 asset::IAssetLedger& assets, int64_t duration);

    RewardStream(const RewardStream&) = delete;
    RewardStream& operator=(const RewardStream&) = delete;

    // ========================================================================
    // Ledger Operations
    // ========================================================================

    /// Register a reward token
    ResultCode AddRewardToken(const Address& caller, const Address& token);

    /// Add weight to an account's virtual balance
    ResultCode Deposit(const Address& caller, const Address& account, const Amount& amount);

    /// Remove weight from an account's virtual balance
    ResultCode Withdraw(const Address& caller, const Address& account, const Amount& amount);

    // ========================================================================
    // Public Operations
    // ========================================================================

    /**
     * Start or extend a reward period for a token.
     *
     * Pulls `amount` from `funder` (which must have approved this stream).
     * Any unstreamed remainder of a running period is rolled into the new
     * rate. Fails with RewardTooSmall if the amount is below the remainder
     * or the resulting rate would be zero.
     */
    ResultCode NotifyRewardAmount(const Address& funder, const Address& token,
                                  const Amount& amount);

    /// Pay out everything an account has earned, for every token.
    /// A call with nothing accrued is a successful no-op.
    ResultCode GetReward(const Address& account);

    // ========================================================================
    // Queries
    // ========================================================================

    Amount RewardPerToken(const Address& token) const;
    Amount Earned(const Address& account, const Address& token) const;

    /// Unstreamed remainder of the current period
    Amount Left(const Address& token) const;

    Timestamp LastTimeRewardApplicable(const Address& token) const;

    Amount TotalSupply() const;
    Amount BalanceOf(const Address& account) const;

    std::vector<Address> GetRewardTokens() const;
    bool IsRewardToken(const Address& token) const;
    std::optional<RewardData> GetRewardData(const Address& token) const;

    const Address& GetAddress() const { return self_; }
    int64_t GetDuration() const { return duration_; }

private:
    using AccountTokenKey = std::pair<Address, Address>;   // account, token

    Amount RewardPerTokenLocked(const RewardData& data, Timestamp now) const;
    Amount EarnedLocked(const Address& account, const Address& token,
                        const RewardData& data, Timestamp now) const;

    /// Checkpoint every token, and the account when given
    void UpdateRewardLocked(const Address* account, Timestamp now);

    Address self_;
    Address ledger_;
    asset::IAssetLedger& assets_;
    int64_t duration_;

    std::vector<Address> rewardTokens_;
    std::map<Address, RewardData> rewardData_;
    std::map<AccountTokenKey, Amount> rewardPerTokenPaid_;
    std::map<AccountTokenKey, Amount> owed_;

    Amount totalSupply_;
    std::map<Address, Amount> balances_;

    mutable std::mutex mutex_;
};

} // namespace economics
} // namespace tributary

#endif // TRIBUTARY_ECONOMICS_REWARD_STREAM_H
