// TRIBUTARY - Atomic Router Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/router/atomic_router.h"
#include "tributary/util/logging.h"
#include "tributary/util/time.h"

#include <mutex>
#include <stdexcept>

namespace tributary {
namespace router {

AtomicRouter::AtomicRouter(const Address& self, governance::VotingLedger& ledger,
                           asset::IAssetLedger& assets)
    : self_(self), ledger_(ledger), assets_(assets) {}

ResultCode AtomicRouter::Distribute(const Address& strategy) {
    return ledger_.Distribute(strategy);
}

ResultCode AtomicRouter::DistributeAll() {
    return ledger_.DistributeAll();
}

market::BuyResult AtomicRouter::Buy(const Address& caller, const Address& strategy,
                                    uint64_t epochId, Timestamp deadline,
                                    const Amount& maxPayment) {
    return Execute(DistributeMode::None, caller, strategy, epochId, deadline, maxPayment);
}

market::BuyResult AtomicRouter::DistributeAndBuy(const Address& caller, const Address& strategy,
                                                 uint64_t epochId, Timestamp deadline,
                                                 const Amount& maxPayment) {
    return Execute(DistributeMode::Target, caller, strategy, epochId, deadline, maxPayment);
}

market::BuyResult AtomicRouter::DistributeAllAndBuy(const Address& caller,
                                                    const Address& strategy,
                                                    uint64_t epochId, Timestamp deadline,
                                                    const Amount& maxPayment) {
    return Execute(DistributeMode::All, caller, strategy, epochId, deadline, maxPayment);
}

market::BuyResult AtomicRouter::Execute(DistributeMode mode, const Address& caller,
                                        const Address& strategy, uint64_t epochId,
                                        Timestamp deadline, const Amount& maxPayment) {
    std::lock_guard<std::recursive_mutex> ledgerLock(ledger_.GetMutex());
    // One clock reading for the whole composition
    const Timestamp now = util::GetTime();

    market::AuctionMarket* auction = ledger_.GetAuction(strategy);
    if (!auction) {
        return market::BuyResult::Failure(ResultCode::UnknownStrategy);
    }
    std::lock_guard<std::recursive_mutex> auctionLock(auction->GetMutex());

    if (caller.IsNull()) {
        return market::BuyResult::Failure(ResultCode::ZeroAddress);
    }

    // Pre-flight against the balance the auction will hold once distributed
    const Amount incoming = mode == DistributeMode::None ? Amount(0)
                                                         : ledger_.PendingClaimable(strategy);
    market::BuyQuote quote = auction->CheckBuyAt(now, self_, caller, epochId, deadline,
                                                 maxPayment, incoming, false);
    if (!quote.IsSuccess()) {
        LOG_DEBUG(util::LogCategory::ROUTER) << "Router buy on " << strategy.ToShortString()
            << " rejected: " << ResultCodeToString(quote.code);
        return market::BuyResult::Failure(quote.code);
    }

    const Address& paymentToken = auction->GetPaymentToken();
    if (maxPayment > 0) {
        if (assets_.BalanceOf(paymentToken, caller) < maxPayment) {
            return market::BuyResult::Failure(ResultCode::InsufficientBalance);
        }
        if (assets_.Allowance(paymentToken, caller, self_) < maxPayment) {
            return market::BuyResult::Failure(ResultCode::InsufficientAllowance);
        }
        ResultCode code = assets_.TransferFrom(paymentToken, self_, caller, self_, maxPayment);
        if (code != ResultCode::Success) {
            return market::BuyResult::Failure(code);
        }
    }

    auto refund = [&](const Amount& amount) {
        if (amount == 0) {
            return;
        }
        ResultCode code = assets_.Transfer(paymentToken, self_, caller, amount);
        if (code != ResultCode::Success) {
            throw std::logic_error(std::string("router refund failed: ") +
                                   ResultCodeToString(code));
        }
    };

    ResultCode distributed = ResultCode::Success;
    if (mode == DistributeMode::Target) {
        distributed = ledger_.Distribute(strategy);
    } else if (mode == DistributeMode::All) {
        distributed = ledger_.DistributeAll();
    }
    if (distributed != ResultCode::Success) {
        LOG_ERROR(util::LogCategory::ROUTER) << "Distribution failed after pre-flight: "
                                             << ResultCodeToString(distributed);
        refund(maxPayment);
        return market::BuyResult::Failure(distributed);
    }

    ResultCode approved = assets_.Approve(paymentToken, self_, auction->GetAddress(), quote.price);
    if (approved != ResultCode::Success) {
        refund(maxPayment);
        return market::BuyResult::Failure(approved);
    }

    market::BuyResult result = auction->BuyAt(now, self_, caller, epochId, deadline,
                                              maxPayment);

    ResultCode cleared = assets_.Approve(paymentToken, self_, auction->GetAddress(), 0);
    if (cleared != ResultCode::Success) {
        LOG_WARN(util::LogCategory::ROUTER) << "Could not clear auction allowance: "
                                            << ResultCodeToString(cleared);
    }

    if (!result.IsSuccess()) {
        LOG_ERROR(util::LogCategory::ROUTER) << "Buy failed after pre-flight: "
                                             << ResultCodeToString(result.code);
        refund(maxPayment);
        return result;
    }

    refund(maxPayment - result.paymentAmount);

    LOG_INFO(util::LogCategory::ROUTER) << "Router bought epoch " << result.epochId
        << " of " << strategy.ToShortString() << " for " << caller.ToShortString()
        << ", paid " << result.paymentAmount.str() << " of " << maxPayment.str();
    return result;
}

} // namespace router
} // namespace tributary
