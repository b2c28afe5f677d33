// TRIBUTARY - Snapshot Views
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Read-only projections of ledger, auction and stream state for external
// consumers. Views carry no state of their own.

#ifndef TRIBUTARY_ROUTER_VIEWS_H
#define TRIBUTARY_ROUTER_VIEWS_H

#include "tributary/asset/asset_ledger.h"
#include "tributary/core/types.h"
#include "tributary/governance/voting_ledger.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tributary {
namespace router {

/// Strategy card
struct StrategySnapshot {
    Address strategy;
    uint64_t index{0};
    Address paymentToken;
    Address receiver;
    bool isAlive{false};

    Amount weight;
    Amount votePercent;         // Share of total weight * 100, scaled by PRECISION
    Amount claimable;           // Including revenue not yet caught up
    Amount revenueBalance;      // Held by the auction

    uint64_t epochId{0};
    Timestamp epochStart{0};
    Amount initPrice;
    Amount price;

    Amount accountVote;         // Zero without an account

    std::string ToString() const;
};

struct RewardTokenSnapshot {
    Address token;
    Amount rewardRate;
    Timestamp periodFinish{0};
    Amount rewardPerToken;
    Amount left;
    Amount earned;              // For the requested account
};

/// Reward card
struct RewardSnapshot {
    Address strategy;
    Amount totalSupply;
    Amount accountBalance;
    Amount bribeHeld;           // Waiting in the bribe router
    std::vector<RewardTokenSnapshot> tokens;
};

/// Account data
struct AccountSnapshot {
    Address account;
    Amount votingPower;
    Amount usedWeight;
    std::optional<Timestamp> lastVoted;
    bool canVote{false};
    std::vector<std::pair<Address, Amount>> votes;
};

std::optional<StrategySnapshot> GetStrategySnapshot(const governance::VotingLedger& ledger,
                                                    const Address& strategy,
                                                    const Address& account = Address());

std::vector<StrategySnapshot> GetAllStrategySnapshots(const governance::VotingLedger& ledger,
                                                      const Address& account = Address());

std::optional<RewardSnapshot> GetRewardSnapshot(const governance::VotingLedger& ledger,
                                                const Address& strategy,
                                                const Address& account = Address());

AccountSnapshot GetAccountSnapshot(const governance::VotingLedger& ledger,
                                   const Address& account);

} // namespace router
} // namespace tributary

#endif // TRIBUTARY_ROUTER_VIEWS_H
