// TRIBUTARY - Voting Power Source Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/governance/voting_power.h"

namespace tributary {
namespace governance {

void VotingPowerTracker::UpdateVotingPower(const Address& account, const Amount& power) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = votingPower_.find(account);
    Amount previous = it == votingPower_.end() ? Amount(0) : it->second;
    Amount total = totalPower_ - previous + power;

    if (power == 0) {
        if (it != votingPower_.end()) {
            votingPower_.erase(it);
        }
    } else {
        votingPower_[account] = power;
    }
    totalPower_ = total;
}

Amount VotingPowerTracker::GetVotingPower(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = votingPower_.find(account);
    return it == votingPower_.end() ? Amount(0) : it->second;
}

Amount VotingPowerTracker::GetTotalVotingPower() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalPower_;
}

size_t VotingPowerTracker::GetVoterCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return votingPower_.size();
}

std::map<Address, Amount> VotingPowerTracker::TakeSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return votingPower_;
}

void VotingPowerTracker::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    votingPower_.clear();
    totalPower_ = 0;
}

} // namespace governance
} // namespace tributary
