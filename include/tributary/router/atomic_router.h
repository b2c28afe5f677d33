// TRIBUTARY - Atomic Router
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#ifndef TRIBUTARY_ROUTER_ATOMIC_ROUTER_H
#define TRIBUTARY_ROUTER_ATOMIC_ROUTER_H

#include "tributary/asset/asset_ledger.h"
#include "tributary/core/result.h"
#include "tributary/core/types.h"
#include "tributary/governance/voting_ledger.h"
#include "tributary/market/auction.h"

namespace tributary {
namespace router {

/**
 * Stateless composition of distribution and auction purchase.
 *
 * Purchases go through an escrow: the caller approves this router for
 * maxPayment, the router pulls it, pays the auction and refunds the
 * difference in the same call. Every condition of the composition is
 * checked before the first transfer, so a failed call moves nothing.
 *
 * The ledger mutex and then the auction mutex are held for the whole call.
 */
class AtomicRouter {
public:
    AtomicRouter(const Address& self, governance::VotingLedger& ledger,
                 asset::IAssetLedger& assets);

    AtomicRouter(const AtomicRouter&) = delete;
    AtomicRouter& operator=(const AtomicRouter&) = delete;

    ResultCode Distribute(const Address& strategy);
    ResultCode DistributeAll();

    /// Buy without distributing first
    market::BuyResult Buy(const Address& caller, const Address& strategy,
                          uint64_t epochId, Timestamp deadline, const Amount& maxPayment);

    /// Distribute the target strategy, then buy from it
    market::BuyResult DistributeAndBuy(const Address& caller, const Address& strategy,
                                       uint64_t epochId, Timestamp deadline,
                                       const Amount& maxPayment);

    /// Distribute every strategy, then buy from the target
    market::BuyResult DistributeAllAndBuy(const Address& caller, const Address& strategy,
                                          uint64_t epochId, Timestamp deadline,
                                          const Amount& maxPayment);

    const Address& GetAddress() const { return self_; }

private:
    enum class DistributeMode { None, Target, All };

    market::BuyResult Execute(DistributeMode mode, const Address& caller,
                              const Address& strategy, uint64_t epochId,
                              Timestamp deadline, const Amount& maxPayment);

    Address self_;
    governance::VotingLedger& ledger_;
    asset::IAssetLedger& assets_;
};

} // namespace router
} // namespace tributary

#endif // TRIBUTARY_ROUTER_ATOMIC_ROUTER_H
