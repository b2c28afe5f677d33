// TRIBUTARY - Snapshot Views Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/router/views.h"

#include <mutex>
#include <sstream>

namespace tributary {
namespace router {

std::string StrategySnapshot::ToString() const {
    std::ostringstream oss;
    oss << "Strategy " << strategy.ToShortString()
        << " [" << (isAlive ? "alive" : "dead") << "]"
        << " weight=" << weight.str()
        << " (" << FormatUnits(votePercent) << "%)"
        << " claimable=" << claimable.str()
        << " balance=" << revenueBalance.str()
        << " epoch=" << epochId
        << " price=" << price.str();
    return oss.str();
}

std::optional<StrategySnapshot> GetStrategySnapshot(const governance::VotingLedger& ledger,
                                                    const Address& strategy,
                                                    const Address& account) {
    std::lock_guard<std::recursive_mutex> lock(ledger.GetMutex());

    std::optional<governance::StrategyInfo> info = ledger.GetStrategy(strategy);
    const market::AuctionMarket* auction = ledger.GetAuction(strategy);
    if (!info || !auction) {
        return std::nullopt;
    }

    StrategySnapshot snap;
    snap.strategy = info->id;
    snap.index = info->index;
    snap.paymentToken = info->paymentToken;
    snap.receiver = info->receiver;
    snap.isAlive = info->isAlive;
    snap.weight = info->weight;

    const Amount total = ledger.GetTotalWeight();
    if (total > 0) {
        snap.votePercent = info->weight * 100 * PRECISION / total;
    }
    snap.claimable = ledger.PendingClaimable(strategy);
    snap.revenueBalance = auction->GetRevenueBalance();

    market::AuctionState state = auction->GetState();
    snap.epochId = state.epochId;
    snap.epochStart = state.startTime;
    snap.initPrice = state.initPrice;
    snap.price = auction->GetPrice();

    if (!account.IsNull()) {
        snap.accountVote = ledger.GetStrategyVote(strategy, account);
    }
    return snap;
}

std::vector<StrategySnapshot> GetAllStrategySnapshots(const governance::VotingLedger& ledger,
                                                      const Address& account) {
    std::lock_guard<std::recursive_mutex> lock(ledger.GetMutex());
    std::vector<StrategySnapshot> result;
    for (const auto& strategy : ledger.GetStrategies()) {
        if (auto snap = GetStrategySnapshot(ledger, strategy, account)) {
            result.push_back(std::move(*snap));
        }
    }
    return result;
}

std::optional<RewardSnapshot> GetRewardSnapshot(const governance::VotingLedger& ledger,
                                                const Address& strategy,
                                                const Address& account) {
    std::lock_guard<std::recursive_mutex> lock(ledger.GetMutex());

    const economics::RewardStream* stream = ledger.GetRewardStream(strategy);
    const economics::BribeRouter* bribes = ledger.GetBribeRouter(strategy);
    if (!stream || !bribes) {
        return std::nullopt;
    }

    RewardSnapshot snap;
    snap.strategy = strategy;
    snap.totalSupply = stream->TotalSupply();
    snap.bribeHeld = bribes->Held();
    if (!account.IsNull()) {
        snap.accountBalance = stream->BalanceOf(account);
    }

    for (const auto& token : stream->GetRewardTokens()) {
        RewardTokenSnapshot entry;
        entry.token = token;
        if (auto data = stream->GetRewardData(token)) {
            entry.rewardRate = data->rewardRate;
            entry.periodFinish = data->periodFinish;
        }
        entry.rewardPerToken = stream->RewardPerToken(token);
        entry.left = stream->Left(token);
        if (!account.IsNull()) {
            entry.earned = stream->Earned(account, token);
        }
        snap.tokens.push_back(entry);
    }
    return snap;
}

AccountSnapshot GetAccountSnapshot(const governance::VotingLedger& ledger,
                                   const Address& account) {
    std::lock_guard<std::recursive_mutex> lock(ledger.GetMutex());

    AccountSnapshot snap;
    snap.account = account;
    snap.votingPower = ledger.GetAvailableWeight(account);

    governance::AccountVotes votes = ledger.GetAccountVotes(account);
    snap.usedWeight = votes.usedWeight;
    snap.lastVoted = votes.lastVoted;
    snap.canVote = ledger.CanVote(account);
    for (const auto& [strategy, weight] : votes.votes) {
        snap.votes.emplace_back(strategy, weight);
    }
    return snap;
}

} // namespace router
} // namespace tributary
