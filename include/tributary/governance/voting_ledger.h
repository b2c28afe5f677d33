// TRIBUTARY - Voting Ledger
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Epoch-gated voting over a registry of strategies, and the proportional
// revenue-index distributor that splits incoming revenue by strategy weight.
//
// Revenue never fans out eagerly. Each notification advances a single
// global index; a strategy catches up lazily (RevenueAccumulator) whenever
// it is touched, and Distribute pulls its share into the strategy's
// auction balance.

#ifndef TRIBUTARY_GOVERNANCE_VOTING_LEDGER_H
#define TRIBUTARY_GOVERNANCE_VOTING_LEDGER_H

#include "tributary/asset/asset_ledger.h"
#include "tributary/core/result.h"
#include "tributary/core/types.h"
#include "tributary/economics/bribe_router.h"
#include "tributary/economics/reward_stream.h"
#include "tributary/governance/voting_power.h"
#include "tributary/market/auction.h"
#include "tributary/protocol/params.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tributary {
namespace governance {

// ============================================================================
// Revenue Accumulator
// ============================================================================

/**
 * Per-strategy view of the global revenue index.
 *
 * A strategy's share since it last caught up is
 * weight * (globalIndex - supplyIndex) / PRECISION. Dead strategies still
 * advance supplyIndex but discard the share.
 */
struct RevenueAccumulator {
    Amount weight;
    Amount supplyIndex;
    Amount claimable;

    /// Share accrued since the last catch-up
    Amount Pending(const Amount& globalIndex, bool alive) const;

    /// Claimable after a catch-up, without mutating
    Amount Projected(const Amount& globalIndex, bool alive) const {
        return claimable + Pending(globalIndex, alive);
    }

    /// Fold the pending share into claimable and advance supplyIndex
    void CatchUp(const Amount& globalIndex, bool alive);
};

// ============================================================================
// Records
// ============================================================================

/// Read-only copy of a strategy record
struct StrategyInfo {
    Address id;                 // Same as the auction address
    uint64_t index{0};          // Registration order
    Address paymentToken;
    Address receiver;
    Address auction;
    Address rewardStream;
    Address bribeRouter;
    bool isValid{false};
    bool isAlive{false};
    Amount weight;
    Amount supplyIndex;
    Amount claimable;

    std::string ToString() const;
};

struct AddStrategyResult {
    ResultCode code{ResultCode::Success};
    Address strategy;

    bool IsSuccess() const { return code == ResultCode::Success; }

    static AddStrategyResult Success(const Address& strategy) {
        AddStrategyResult r;
        r.strategy = strategy;
        return r;
    }

    static AddStrategyResult Failure(ResultCode code) {
        AddStrategyResult r;
        r.code = code;
        return r;
    }
};

/// An account's committed votes
struct AccountVotes {
    Amount usedWeight;
    std::optional<Timestamp> lastVoted;
    std::map<Address, Amount> votes;
};

// ============================================================================
// Voting Ledger
// ============================================================================

class VotingLedger {
public:
    /**
     * @param self Address custodying notified revenue
     * @param owner Account allowed to register and kill strategies
     * @param revenueToken Token revenue is notified and auctioned in
     * @param treasury Fallback sink for unattributable revenue
     *
     * The owner is also the initial revenue source.
     */
    VotingLedger(const protocol::Params& params, asset::IAssetLedger& assets,
                 const IVotingPowerSource& votingPower, const Address& self,
                 const Address& owner, const Address& revenueToken,
                 const Address& treasury);

    ~VotingLedger();

    VotingLedger(const VotingLedger&) = delete;
    VotingLedger& operator=(const VotingLedger&) = delete;

    // ========================================================================
    // Strategy Lifecycle
    // ========================================================================

    /**
     * Register a strategy with its auction, reward stream and bribe router.
     * The payment token is registered as the stream's first reward token,
     * and supplyIndex starts at the current global index.
     */
    AddStrategyResult AddStrategy(const Address& caller, const Address& paymentToken,
                                  const Address& receiver,
                                  const market::AuctionConfig& auction);

    /**
     * Retire a strategy. Pending claimable goes to the treasury; weight is
     * left for voters to remove with Reset.
     */
    ResultCode KillStrategy(const Address& caller, const Address& strategy);

    // ========================================================================
    // Voting
    // ========================================================================

    /**
     * Replace the account's votes with a proportional allocation of its
     * full voting power.
     *
     * Targets that are unknown or dead are skipped. Weight for each alive
     * target is available * w_i / sum(w), and the last alive target takes
     * the rounding remainder.
     */
    ResultCode Vote(const Address& account, const std::vector<Address>& strategies,
                    const std::vector<Amount>& weights);

    /// Withdraw every vote the account has committed
    ResultCode Reset(const Address& account);

    // ========================================================================
    // Revenue
    // ========================================================================

    /// Pull revenue from the revenue source and advance the global index
    ResultCode NotifyRevenue(const Address& caller, const Amount& amount);

    ResultCode UpdateStrategy(const Address& strategy);
    ResultCode UpdateFor(const std::vector<Address>& strategies);

    /// Update strategies [start, finish) in registration order
    ResultCode UpdateForRange(size_t start, size_t finish);
    ResultCode UpdateAll();

    /// Move a strategy's claimable revenue into its auction
    ResultCode Distribute(const Address& strategy);
    ResultCode DistributeRange(size_t start, size_t finish);
    ResultCode DistributeAll();

    // ========================================================================
    // Administration
    // ========================================================================

    ResultCode SetBribeSplit(const Address& caller, uint32_t splitBps);
    ResultCode SetRevenueSource(const Address& caller, const Address& source);

    /// Accept an extra reward token on a strategy's stream
    ResultCode AddBribeReward(const Address& caller, const Address& strategy,
                              const Address& token);

    /// Collect streamed rewards from several strategies
    ResultCode ClaimBribes(const Address& account, const std::vector<Address>& strategies);

    // ========================================================================
    // Queries
    // ========================================================================

    std::vector<Address> GetStrategies() const;
    size_t Length() const;
    bool IsStrategy(const Address& strategy) const;
    std::optional<StrategyInfo> GetStrategy(const Address& strategy) const;

    Amount GetStrategyVote(const Address& strategy, const Address& account) const;
    AccountVotes GetAccountVotes(const Address& account) const;
    Amount GetUsedWeight(const Address& account) const;
    std::optional<Timestamp> GetLastVoted(const Address& account) const;

    /// Whether the epoch gate currently admits a vote or reset
    bool CanVote(const Address& account) const;

    Amount GetAvailableWeight(const Address& account) const;
    Amount GetTotalWeight() const;
    Amount GetGlobalIndex() const;

    /// Claimable the strategy would have after an UpdateStrategy now
    Amount PendingClaimable(const Address& strategy) const;

    market::AuctionMarket* GetAuction(const Address& strategy) const;
    economics::RewardStream* GetRewardStream(const Address& strategy) const;
    economics::BribeRouter* GetBribeRouter(const Address& strategy) const;

    uint32_t GetBribeSplit() const { return bribeSplitBps_.load(); }
    const Address& GetAddress() const { return self_; }
    const Address& GetOwner() const { return owner_; }
    const Address& GetTreasury() const { return treasury_; }
    const Address& GetRevenueToken() const { return revenueToken_; }
    Address GetRevenueSource() const;
    const protocol::Params& GetParams() const { return params_; }

    /// Serializes the ledger; the router holds it across a composition
    std::recursive_mutex& GetMutex() const { return mutex_; }

private:
    struct StrategyRecord {
        StrategyInfo info;
        RevenueAccumulator acc;

        // Destroyed in reverse: auction, router, stream
        std::unique_ptr<economics::RewardStream> stream;
        std::unique_ptr<economics::BribeRouter> bribeRouter;
        std::unique_ptr<market::AuctionMarket> auction;
    };

    StrategyRecord* FindLocked(const Address& strategy);
    const StrategyRecord* FindLocked(const Address& strategy) const;

    bool IsGatedLocked(const AccountVotes& votes, Timestamp now) const;

    void UpdateStrategyLocked(StrategyRecord& record);
    ResultCode DistributeLocked(StrategyRecord& record);

    /// Remove every vote; the epoch gate has already been checked
    void ResetLocked(const Address& account, AccountVotes& votes);

    protocol::Params params_;
    asset::IAssetLedger& assets_;
    const IVotingPowerSource& votingPower_;
    Address self_;
    Address owner_;
    Address revenueToken_;
    Address treasury_;
    Address revenueSource_;

    std::atomic<uint32_t> bribeSplitBps_;

    std::vector<std::unique_ptr<StrategyRecord>> strategies_;
    std::map<Address, size_t> strategyIndex_;
    std::map<Address, AccountVotes> accounts_;

    Amount totalWeight_;
    Amount globalIndex_;

    mutable std::recursive_mutex mutex_;
};

} // namespace governance
} // namespace tributary

#endif // TRIBUTARY_GOVERNANCE_VOTING_LEDGER_H
