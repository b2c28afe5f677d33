// TRIBUTARY - Reward Stream Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/economics/reward_stream.h"
#include "tributary/util/logging.h"
#include "tributary/util/time.h"

#include <algorithm>
#include <sstream>

namespace tributary {
namespace economics {

std::string RewardData::ToString() const {
    std::ostringstream oss;
    oss << "RewardData(rate=" << rewardRate.str()
        << ", periodFinish=" << periodFinish
        << ", lastUpdate=" << lastUpdateTime
        << ", rewardPerToken=" << rewardPerTokenStored.str() << ")";
    return oss.str();
}

RewardStream::RewardStream(const Address& self, const Address& ledger,
                           asset::IAssetLedger& assets, int64_t duration)
    : self_(self), ledger_(ledger), assets_(assets), duration_(duration) {}

// ============================================================================
// Accumulator Math
// ============================================================================

Amount RewardStream::RewardPerTokenLocked(const RewardData& data, Timestamp now) const {
    if (totalSupply_ == 0) {
        return data.rewardPerTokenStored;
    }
    Timestamp applicable = std::min(now, data.periodFinish);
    if (applicable <= data.lastUpdateTime) {
        return data.rewardPerTokenStored;
    }
    Amount elapsed = ToAmount(applicable - data.lastUpdateTime);
    return data.rewardPerTokenStored +
           elapsed * data.rewardRate * PRECISION / totalSupply_;
}

Amount RewardStream::EarnedLocked(const Address& account, const Address& token,
                                  const RewardData& data, Timestamp now) const {
    const AccountTokenKey key{account, token};

    auto balIt = balances_.find(account);
    Amount balance = balIt == balances_.end() ? Amount(0) : balIt->second;

    auto paidIt = rewardPerTokenPaid_.find(key);
    Amount paid = paidIt == rewardPerTokenPaid_.end() ? Amount(0) : paidIt->second;

    auto owedIt = owed_.find(key);
    Amount owed = owedIt == owed_.end() ? Amount(0) : owedIt->second;

    return balance * (RewardPerTokenLocked(data, now) - paid) / PRECISION + owed;
}

void RewardStream::UpdateRewardLocked(const Address* account, Timestamp now) {
    for (const auto& token : rewardTokens_) {
        RewardData& data = rewardData_[token];
        Amount stored = RewardPerTokenLocked(data, now);
        Timestamp applicable = std::min(now, data.periodFinish);

        if (account) {
            Amount earned = EarnedLocked(*account, token, data, now);
            owed_[{*account, token}] = earned;
            rewardPerTokenPaid_[{*account, token}] = stored;
        }
        data.rewardPerTokenStored = stored;
        data.lastUpdateTime = std::max(applicable, data.lastUpdateTime);
    }
}

// ============================================================================
// Ledger Operations
// ============================================================================

ResultCode RewardStream::AddRewardToken(const Address& caller, const Address& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller != ledger_) {
        return ResultCode::NotAuthorized;
    }
    if (token.IsNull()) {
        return ResultCode::ZeroAddress;
    }
    if (rewardData_.count(token) > 0) {
        return ResultCode::RewardTokenAlreadyRegistered;
    }

    rewardTokens_.push_back(token);
    rewardData_[token] = RewardData{};

    LOG_DEBUG(util::LogCategory::REWARD) << "Stream " << self_.ToShortString()
        << " accepts reward token " << token.ToShortString();
    return ResultCode::Success;
}

ResultCode RewardStream::Deposit(const Address& caller, const Address& account,
                                 const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller != ledger_) {
        return ResultCode::NotAuthorized;
    }
    if (account.IsNull()) {
        return ResultCode::ZeroAddress;
    }
    if (amount == 0) {
        return ResultCode::InvalidAmount;
    }

    Amount newSupply = totalSupply_ + amount;
    Amount newBalance = balances_[account] + amount;

    UpdateRewardLocked(&account, util::GetTime());
    totalSupply_ = newSupply;
    balances_[account] = newBalance;
    return ResultCode::Success;
}

ResultCode RewardStream::Withdraw(const Address& caller, const Address& account,
                                  const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller != ledger_) {
        return ResultCode::NotAuthorized;
    }
    if (amount == 0) {
        return ResultCode::InvalidAmount;
    }
    auto it = balances_.find(account);
    if (it == balances_.end() || it->second < amount) {
        return ResultCode::InsufficientBalance;
    }

    UpdateRewardLocked(&account, util::GetTime());
    totalSupply_ -= amount;
    balances_[account] -= amount;
    return ResultCode::Success;
}

// ============================================================================
// Public Operations
// ============================================================================

ResultCode RewardStream::NotifyRewardAmount(const Address& funder, const Address& token,
                                            const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rewardData_.find(token);
    if (it == rewardData_.end()) {
        return ResultCode::RewardTokenNotRegistered;
    }
    if (amount == 0) {
        return ResultCode::InvalidAmount;
    }

    const Timestamp now = util::GetTime();
    const RewardData& current = it->second;
    const Amount durationAmount = ToAmount(duration_);

    Amount newRate;
    if (now >= current.periodFinish) {
        newRate = amount / durationAmount;
    } else {
        Amount remaining = ToAmount(current.periodFinish - now) * current.rewardRate;
        if (amount < remaining) {
            return ResultCode::RewardTooSmall;
        }
        newRate = (amount + remaining) / durationAmount;
    }
    if (newRate == 0) {
        return ResultCode::RewardTooSmall;
    }

    ResultCode pulled = assets_.TransferFrom(token, self_, funder, self_, amount);
    if (pulled != ResultCode::Success) {
        return pulled;
    }

    UpdateRewardLocked(nullptr, now);
    RewardData& data = rewardData_[token];
    data.rewardRate = newRate;
    data.lastUpdateTime = now;
    data.periodFinish = now + duration_;

    LOG_INFO(util::LogCategory::REWARD) << "Stream " << self_.ToShortString()
        << " notified " << amount.str() << " of " << token.ToShortString()
        << ", rate " << newRate.str() << "/s until "
        << util::FormatISO8601(data.periodFinish);
    return ResultCode::Success;
}

ResultCode RewardStream::GetReward(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = util::GetTime();

    std::vector<std::pair<Address, Amount>> payouts;
    for (const auto& token : rewardTokens_) {
        Amount earned = EarnedLocked(account, token, rewardData_[token], now);
        if (earned == 0) {
            continue;
        }
        if (assets_.BalanceOf(token, self_) < earned) {
            LOG_ERROR(util::LogCategory::REWARD) << "Stream " << self_.ToShortString()
                << " cannot cover " << earned.str() << " of " << token.ToShortString();
            return ResultCode::InsufficientBalance;
        }
        payouts.emplace_back(token, earned);
    }

    UpdateRewardLocked(&account, now);
    for (const auto& [token, earned] : payouts) {
        ResultCode code = assets_.Transfer(token, self_, account, earned);
        if (code != ResultCode::Success) {
            return code;
        }
        owed_[{account, token}] = 0;
        LOG_DEBUG(util::LogCategory::REWARD) << "Paid " << earned.str() << " of "
            << token.ToShortString() << " to " << account.ToShortString();
    }
    return ResultCode::Success;
}

// ============================================================================
// Queries
// ============================================================================

Amount RewardStream::RewardPerToken(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rewardData_.find(token);
    if (it == rewardData_.end()) {
        return 0;
    }
    return RewardPerTokenLocked(it->second, util::GetTime());
}

Amount RewardStream::Earned(const Address& account, const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rewardData_.find(token);
    if (it == rewardData_.end()) {
        return 0;
    }
    return EarnedLocked(account, token, it->second, util::GetTime());
}

Amount RewardStream::Left(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rewardData_.find(token);
    if (it == rewardData_.end()) {
        return 0;
    }
    Timestamp now = util::GetTime();
    if (now >= it->second.periodFinish) {
        return 0;
    }
    return ToAmount(it->second.periodFinish - now) * it->second.rewardRate;
}

Timestamp RewardStream::LastTimeRewardApplicable(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rewardData_.find(token);
    if (it == rewardData_.end()) {
        return 0;
    }
    return std::min(util::GetTime(), it->second.periodFinish);
}

Amount RewardStream::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

Amount RewardStream::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? Amount(0) : it->second;
}

std::vector<Address> RewardStream::GetRewardTokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rewardTokens_;
}

bool RewardStream::IsRewardToken(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rewardData_.count(token) > 0;
}

std::optional<RewardData> RewardStream::GetRewardData(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rewardData_.find(token);
    if (it == rewardData_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace economics
} // namespace tributary
