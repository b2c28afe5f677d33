// TRIBUTARY - Voting Ledger Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/governance/voting_ledger.h"
#include "tributary/util/logging.h"
#include "tributary/util/time.h"

#include <set>
#include <sstream>
#include <stdexcept>

namespace tributary {
namespace governance {

// ============================================================================
// Revenue Accumulator
// ============================================================================

Amount RevenueAccumulator::Pending(const Amount& globalIndex, bool alive) const {
    if (!alive || weight == 0 || globalIndex <= supplyIndex) {
        return 0;
    }
    return weight * (globalIndex - supplyIndex) / PRECISION;
}

void RevenueAccumulator::CatchUp(const Amount& globalIndex, bool alive) {
    claimable += Pending(globalIndex, alive);
    supplyIndex = globalIndex;
}

std::string StrategyInfo::ToString() const {
    std::ostringstream oss;
    oss << "Strategy(" << id.ToShortString()
        << ", #" << index
        << ", " << (isAlive ? "alive" : "dead")
        << ", weight=" << weight.str()
        << ", claimable=" << claimable.str() << ")";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

VotingLedger::VotingLedger(const protocol::Params& params, asset::IAssetLedger& assets,
                           const IVotingPowerSource& votingPower, const Address& self,
                           const Address& owner, const Address& revenueToken,
                           const Address& treasury)
    : params_(params), assets_(assets), votingPower_(votingPower), self_(self),
      owner_(owner), revenueToken_(revenueToken), treasury_(treasury),
      revenueSource_(owner), bribeSplitBps_(params.defaultBribeSplitBps) {
    std::string error;
    if (!params_.IsValid(error)) {
        throw std::invalid_argument("invalid protocol parameters: " + error);
    }
    if (self.IsNull() || owner.IsNull() || revenueToken.IsNull() || treasury.IsNull()) {
        throw std::invalid_argument("voting ledger addresses must be non-zero");
    }
}

VotingLedger::~VotingLedger() = default;

VotingLedger::StrategyRecord* VotingLedger::FindLocked(const Address& strategy) {
    auto it = strategyIndex_.find(strategy);
    if (it == strategyIndex_.end()) {
        return nullptr;
    }
    return strategies_[it->second].get();
}

const VotingLedger::StrategyRecord* VotingLedger::FindLocked(const Address& strategy) const {
    auto it = strategyIndex_.find(strategy);
    if (it == strategyIndex_.end()) {
        return nullptr;
    }
    return strategies_[it->second].get();
}

// ============================================================================
// Strategy Lifecycle
// ============================================================================

AddStrategyResult VotingLedger::AddStrategy(const Address& caller, const Address& paymentToken,
                                            const Address& receiver,
                                            const market::AuctionConfig& auction) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (caller != owner_) {
        return AddStrategyResult::Failure(ResultCode::NotAuthorized);
    }
    if (paymentToken.IsNull() || receiver.IsNull()) {
        return AddStrategyResult::Failure(ResultCode::ZeroAddress);
    }
    if (!assets_.HasToken(paymentToken)) {
        return AddStrategyResult::Failure(ResultCode::UnknownToken);
    }
    std::string reason;
    ResultCode valid = market::ValidateAuctionConfig(auction, params_, &reason);
    if (valid != ResultCode::Success) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Rejected strategy: " << reason;
        return AddStrategyResult::Failure(valid);
    }

    const uint64_t index = strategies_.size();
    const Address auctionAddr = DeriveAddress(self_, ComponentTag::Auction, index);
    const Address streamAddr = DeriveAddress(self_, ComponentTag::RewardStream, index);
    const Address routerAddr = DeriveAddress(self_, ComponentTag::BribeRouter, index);

    auto record = std::make_unique<StrategyRecord>();
    record->stream = std::make_unique<economics::RewardStream>(
        streamAddr, self_, assets_, params_.rewardDuration);
    ResultCode code = record->stream->AddRewardToken(self_, paymentToken);
    if (code != ResultCode::Success) {
        return AddStrategyResult::Failure(code);
    }
    record->bribeRouter = std::make_unique<economics::BribeRouter>(
        routerAddr, assets_, *record->stream, paymentToken, receiver, treasury_,
        params_.bribeDustPolicy);
    record->auction = std::make_unique<market::AuctionMarket>(
        auctionAddr, assets_, revenueToken_, paymentToken, receiver, *record->bribeRouter,
        [this]() { return bribeSplitBps_.load(); }, auction, params_.absMaxInitPrice);

    StrategyInfo& info = record->info;
    info.id = auctionAddr;
    info.index = index;
    info.paymentToken = paymentToken;
    info.receiver = receiver;
    info.auction = auctionAddr;
    info.rewardStream = streamAddr;
    info.bribeRouter = routerAddr;
    info.isValid = true;
    info.isAlive = true;
    record->acc.supplyIndex = globalIndex_;

    strategyIndex_[auctionAddr] = strategies_.size();
    strategies_.push_back(std::move(record));

    LOG_INFO(util::LogCategory::LEDGER) << "Registered strategy " << auctionAddr.ToShortString()
        << " paying in " << paymentToken.ToShortString()
        << ", receiver " << receiver.ToShortString();
    return AddStrategyResult::Success(auctionAddr);
}

ResultCode VotingLedger::KillStrategy(const Address& caller, const Address& strategy) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (caller != owner_) {
        return ResultCode::NotAuthorized;
    }
    StrategyRecord* record = FindLocked(strategy);
    if (!record) {
        return ResultCode::UnknownStrategy;
    }
    if (!record->info.isAlive) {
        return ResultCode::AlreadyDead;
    }

    Amount claim = record->acc.Projected(globalIndex_, true);
    if (claim > 0) {
        ResultCode code = assets_.Transfer(revenueToken_, self_, treasury_, claim);
        if (code != ResultCode::Success) {
            return code;
        }
    }
    record->acc.CatchUp(globalIndex_, true);
    record->acc.claimable = 0;
    record->info.isAlive = false;

    LOG_INFO(util::LogCategory::LEDGER) << "Killed strategy " << strategy.ToShortString()
        << ", " << claim.str() << " claimable sent to treasury, weight "
        << record->acc.weight.str() << " awaits reset";
    return ResultCode::Success;
}

// ============================================================================
// Voting
// ============================================================================

bool VotingLedger::IsGatedLocked(const AccountVotes& votes, Timestamp now) const {
    return votes.lastVoted && util::EpochStart(now, params_.epochDuration) <= *votes.lastVoted;
}

ResultCode VotingLedger::Vote(const Address& account, const std::vector<Address>& strategies,
                              const std::vector<Amount>& weights) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (strategies.size() != weights.size()) {
        return ResultCode::ArrayLengthMismatch;
    }
    if (account.IsNull()) {
        return ResultCode::ZeroAddress;
    }

    const Timestamp now = util::GetTime();
    auto existing = accounts_.find(account);
    if (existing != accounts_.end() && IsGatedLocked(existing->second, now)) {
        return ResultCode::AlreadyVotedThisEpoch;
    }

    const Amount available = votingPower_.GetVotingPower(account);
    if (available == 0) {
        return ResultCode::NoWeight;
    }

    std::set<Address> seen;
    for (const auto& strategy : strategies) {
        if (!seen.insert(strategy).second) {
            return ResultCode::DuplicateTarget;
        }
    }

    // Skip policy: unknown and dead strategies drop out of the allocation
    // instead of failing the vote.
    std::vector<StrategyRecord*> targets;
    std::vector<Amount> targetWeights;
    Amount weightSum;
    for (size_t i = 0; i < strategies.size(); ++i) {
        StrategyRecord* record = FindLocked(strategies[i]);
        if (!record || !record->info.isAlive) {
            LOG_DEBUG(util::LogCategory::LEDGER) << "Vote by " << account.ToShortString()
                << " skips " << strategies[i].ToShortString();
            continue;
        }
        if (weights[i] == 0) {
            return ResultCode::ZeroWeightAfterNormalization;
        }
        targets.push_back(record);
        targetWeights.push_back(weights[i]);
        weightSum += weights[i];
    }

    std::vector<Amount> allocation(targets.size());
    Amount assigned;
    for (size_t i = 0; i < targets.size(); ++i) {
        if (i + 1 == targets.size()) {
            allocation[i] = available - assigned;
        } else {
            allocation[i] = available * targetWeights[i] / weightSum;
        }
        if (allocation[i] == 0) {
            return ResultCode::ZeroWeightAfterNormalization;
        }
        assigned += allocation[i];
    }

    AccountVotes& votes = accounts_[account];
    ResetLocked(account, votes);

    for (size_t i = 0; i < targets.size(); ++i) {
        StrategyRecord& record = *targets[i];
        const Amount& amount = allocation[i];

        UpdateStrategyLocked(record);
        record.acc.weight += amount;
        totalWeight_ += amount;
        votes.votes[record.info.id] = amount;
        votes.usedWeight += amount;

        ResultCode code = record.stream->Deposit(self_, account, amount);
        if (code != ResultCode::Success) {
            throw std::logic_error(std::string("reward stream deposit failed: ") +
                                   ResultCodeToString(code));
        }
    }
    votes.lastVoted = now;

    LOG_DEBUG(util::LogCategory::LEDGER) << "Account " << account.ToShortString()
        << " voted " << votes.usedWeight.str() << " across " << targets.size()
        << " strategies";
    return ResultCode::Success;
}

ResultCode VotingLedger::Reset(const Address& account) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    const Timestamp now = util::GetTime();
    auto existing = accounts_.find(account);
    if (existing != accounts_.end() && IsGatedLocked(existing->second, now)) {
        return ResultCode::AlreadyResetThisEpoch;
    }

    AccountVotes& votes = accounts_[account];
    ResetLocked(account, votes);
    votes.lastVoted = now;
    return ResultCode::Success;
}

void VotingLedger::ResetLocked(const Address& account, AccountVotes& votes) {
    for (const auto& [strategy, weight] : votes.votes) {
        StrategyRecord* record = FindLocked(strategy);
        if (!record) {
            throw std::logic_error("vote recorded for unregistered strategy");
        }
        UpdateStrategyLocked(*record);
        record->acc.weight -= weight;
        totalWeight_ -= weight;

        ResultCode code = record->stream->Withdraw(self_, account, weight);
        if (code != ResultCode::Success) {
            throw std::logic_error(std::string("reward stream withdraw failed: ") +
                                   ResultCodeToString(code));
        }
    }
    if (!votes.votes.empty()) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Account " << account.ToShortString()
            << " released " << votes.usedWeight.str();
    }
    votes.votes.clear();
    votes.usedWeight = 0;
}

// ============================================================================
// Revenue
// ============================================================================

ResultCode VotingLedger::NotifyRevenue(const Address& caller, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (caller != revenueSource_) {
        return ResultCode::NotAuthorized;
    }
    if (amount == 0) {
        return ResultCode::InvalidAmount;
    }

    if (totalWeight_ == 0) {
        ResultCode code = assets_.TransferFrom(revenueToken_, self_, caller, treasury_, amount);
        if (code == ResultCode::Success) {
            LOG_INFO(util::LogCategory::LEDGER) << "No weight committed, revenue "
                << amount.str() << " sent to treasury";
        }
        return code;
    }

    Amount delta = amount * PRECISION / totalWeight_;
    ResultCode code = assets_.TransferFrom(revenueToken_, self_, caller, self_, amount);
    if (code != ResultCode::Success) {
        return code;
    }
    globalIndex_ += delta;

    LOG_INFO(util::LogCategory::LEDGER) << "Revenue " << amount.str()
        << " over weight " << totalWeight_.str() << ", index " << globalIndex_.str();
    return ResultCode::Success;
}

void VotingLedger::UpdateStrategyLocked(StrategyRecord& record) {
    record.acc.CatchUp(globalIndex_, record.info.isAlive);
}

ResultCode VotingLedger::UpdateStrategy(const Address& strategy) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StrategyRecord* record = FindLocked(strategy);
    if (!record) {
        return ResultCode::UnknownStrategy;
    }
    UpdateStrategyLocked(*record);
    return ResultCode::Success;
}

ResultCode VotingLedger::UpdateFor(const std::vector<Address>& strategies) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<StrategyRecord*> records;
    for (const auto& strategy : strategies) {
        StrategyRecord* record = FindLocked(strategy);
        if (!record) {
            return ResultCode::UnknownStrategy;
        }
        records.push_back(record);
    }
    for (StrategyRecord* record : records) {
        UpdateStrategyLocked(*record);
    }
    return ResultCode::Success;
}

ResultCode VotingLedger::UpdateForRange(size_t start, size_t finish) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (start > finish || finish > strategies_.size()) {
        return ResultCode::InvalidParameter;
    }
    for (size_t i = start; i < finish; ++i) {
        UpdateStrategyLocked(*strategies_[i]);
    }
    return ResultCode::Success;
}

ResultCode VotingLedger::UpdateAll() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return UpdateForRange(0, strategies_.size());
}

ResultCode VotingLedger::DistributeLocked(StrategyRecord& record) {
    const bool alive = record.info.isAlive;
    Amount claim = record.acc.Projected(globalIndex_, alive);
    if (claim > 0) {
        ResultCode code = assets_.Transfer(revenueToken_, self_,
                                           record.auction->GetAddress(), claim);
        if (code != ResultCode::Success) {
            LOG_ERROR(util::LogCategory::LEDGER) << "Distribution of " << claim.str()
                << " to " << record.info.id.ToShortString() << " failed: "
                << ResultCodeToString(code);
            return code;
        }
        LOG_DEBUG(util::LogCategory::LEDGER) << "Distributed " << claim.str()
            << " to " << record.info.id.ToShortString();
    }
    record.acc.CatchUp(globalIndex_, alive);
    record.acc.claimable = 0;
    return ResultCode::Success;
}

ResultCode VotingLedger::Distribute(const Address& strategy) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StrategyRecord* record = FindLocked(strategy);
    if (!record) {
        return ResultCode::UnknownStrategy;
    }
    return DistributeLocked(*record);
}

ResultCode VotingLedger::DistributeRange(size_t start, size_t finish) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (start > finish || finish > strategies_.size()) {
        return ResultCode::InvalidParameter;
    }
    for (size_t i = start; i < finish; ++i) {
        ResultCode code = DistributeLocked(*strategies_[i]);
        if (code != ResultCode::Success) {
            return code;
        }
    }
    return ResultCode::Success;
}

ResultCode VotingLedger::DistributeAll() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return DistributeRange(0, strategies_.size());
}

// ============================================================================
// Administration
// ============================================================================

ResultCode VotingLedger::SetBribeSplit(const Address& caller, uint32_t splitBps) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (caller != owner_) {
        return ResultCode::NotAuthorized;
    }
    if (splitBps > params_.maxBribeSplitBps || splitBps >= BPS_DIVISOR) {
        return ResultCode::InvalidParameter;
    }
    bribeSplitBps_.store(splitBps);
    LOG_INFO(util::LogCategory::LEDGER) << "Bribe split set to " << splitBps << " bps";
    return ResultCode::Success;
}

ResultCode VotingLedger::SetRevenueSource(const Address& caller, const Address& source) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (caller != owner_) {
        return ResultCode::NotAuthorized;
    }
    if (source.IsNull()) {
        return ResultCode::ZeroAddress;
    }
    revenueSource_ = source;
    LOG_INFO(util::LogCategory::LEDGER) << "Revenue source set to " << source.ToShortString();
    return ResultCode::Success;
}

ResultCode VotingLedger::AddBribeReward(const Address& caller, const Address& strategy,
                                        const Address& token) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (caller != owner_) {
        return ResultCode::NotAuthorized;
    }
    StrategyRecord* record = FindLocked(strategy);
    if (!record) {
        return ResultCode::UnknownStrategy;
    }
    if (token.IsNull()) {
        return ResultCode::ZeroAddress;
    }
    if (!assets_.HasToken(token)) {
        return ResultCode::UnknownToken;
    }
    return record->stream->AddRewardToken(self_, token);
}

ResultCode VotingLedger::ClaimBribes(const Address& account,
                                     const std::vector<Address>& strategies) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (account.IsNull()) {
        return ResultCode::ZeroAddress;
    }
    std::vector<StrategyRecord*> records;
    for (const auto& strategy : strategies) {
        StrategyRecord* record = FindLocked(strategy);
        if (!record) {
            return ResultCode::UnknownStrategy;
        }
        records.push_back(record);
    }
    for (StrategyRecord* record : records) {
        ResultCode code = record->stream->GetReward(account);
        if (code != ResultCode::Success) {
            return code;
        }
    }
    return ResultCode::Success;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Address> VotingLedger::GetStrategies() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<Address> result;
    result.reserve(strategies_.size());
    for (const auto& record : strategies_) {
        result.push_back(record->info.id);
    }
    return result;
}

size_t VotingLedger::Length() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return strategies_.size();
}

bool VotingLedger::IsStrategy(const Address& strategy) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return FindLocked(strategy) != nullptr;
}

std::optional<StrategyInfo> VotingLedger::GetStrategy(const Address& strategy) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const StrategyRecord* record = FindLocked(strategy);
    if (!record) {
        return std::nullopt;
    }
    StrategyInfo info = record->info;
    info.weight = record->acc.weight;
    info.supplyIndex = record->acc.supplyIndex;
    info.claimable = record->acc.claimable;
    return info;
}

Amount VotingLedger::GetStrategyVote(const Address& strategy, const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = accounts_.find(account);
    if (it == accounts_.end()) {
        return 0;
    }
    auto vote = it->second.votes.find(strategy);
    return vote == it->second.votes.end() ? Amount(0) : vote->second;
}

AccountVotes VotingLedger::GetAccountVotes(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = accounts_.find(account);
    return it == accounts_.end() ? AccountVotes{} : it->second;
}

Amount VotingLedger::GetUsedWeight(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = accounts_.find(account);
    return it == accounts_.end() ? Amount(0) : it->second.usedWeight;
}

std::optional<Timestamp> VotingLedger::GetLastVoted(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = accounts_.find(account);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second.lastVoted;
}

bool VotingLedger::CanVote(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = accounts_.find(account);
    return it == accounts_.end() || !IsGatedLocked(it->second, util::GetTime());
}

Amount VotingLedger::GetAvailableWeight(const Address& account) const {
    return votingPower_.GetVotingPower(account);
}

Amount VotingLedger::GetTotalWeight() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return totalWeight_;
}

Amount VotingLedger::GetGlobalIndex() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return globalIndex_;
}

Amount VotingLedger::PendingClaimable(const Address& strategy) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const StrategyRecord* record = FindLocked(strategy);
    if (!record) {
        return 0;
    }
    return record->acc.Projected(globalIndex_, record->info.isAlive);
}

market::AuctionMarket* VotingLedger::GetAuction(const Address& strategy) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const StrategyRecord* record = FindLocked(strategy);
    return record ? record->auction.get() : nullptr;
}

economics::RewardStream* VotingLedger::GetRewardStream(const Address& strategy) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const StrategyRecord* record = FindLocked(strategy);
    return record ? record->stream.get() : nullptr;
}

economics::BribeRouter* VotingLedger::GetBribeRouter(const Address& strategy) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const StrategyRecord* record = FindLocked(strategy);
    return record ? record->bribeRouter.get() : nullptr;
}

Address VotingLedger::GetRevenueSource() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return revenueSource_;
}

} // namespace governance
} // namespace tributary
