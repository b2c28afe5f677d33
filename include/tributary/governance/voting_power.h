// TRIBUTARY - Voting Power Source
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#ifndef TRIBUTARY_GOVERNANCE_VOTING_POWER_H
#define TRIBUTARY_GOVERNANCE_VOTING_POWER_H

#include "tributary/core/types.h"

#include <map>
#include <mutex>

namespace tributary {
namespace governance {

/**
 * Source of an account's available voting weight.
 *
 * Consulted once per Vote; the ledger records the allocation it made and
 * never re-reads the source on Reset.
 */
class IVotingPowerSource {
public:
    virtual ~IVotingPowerSource() = default;

    virtual Amount GetVotingPower(const Address& account) const = 0;
};

/**
 * In-process voting power registry, standing in for the stake wrapper.
 */
class VotingPowerTracker : public IVotingPowerSource {
public:
    VotingPowerTracker() = default;

    /// Set an account's voting power (zero removes the account)
    void UpdateVotingPower(const Address& account, const Amount& power);

    Amount GetVotingPower(const Address& account) const override;

    /// Sum of all registered voting power
    Amount GetTotalVotingPower() const;

    /// Number of accounts with non-zero power
    size_t GetVoterCount() const;

    /// Copy of the current power table
    std::map<Address, Amount> TakeSnapshot() const;

    void Clear();

private:
    mutable std::mutex mutex_;
    std::map<Address, Amount> votingPower_;
    Amount totalPower_;
};

} // namespace governance
} // namespace tributary

#endif // TRIBUTARY_GOVERNANCE_VOTING_POWER_H
