// TRIBUTARY - Bribe Router Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/economics/bribe_router.h"
#include "tributary/util/logging.h"

namespace tributary {
namespace economics {

const char* FlushActionToString(FlushAction action) {
    switch (action) {
        case FlushAction::None: return "none";
        case FlushAction::Streamed: return "streamed";
        case FlushAction::Held: return "held";
        case FlushAction::ToReceiver: return "to-receiver";
        case FlushAction::ToTreasury: return "to-treasury";
        default: return "unknown";
    }
}

BribeRouter::BribeRouter(const Address& self, asset::IAssetLedger& assets,
                         RewardStream& stream, const Address& paymentToken,
                         const Address& receiver, const Address& treasury,
                         protocol::BribeDustPolicy policy)
    : self_(self), assets_(assets), stream_(stream), paymentToken_(paymentToken),
      receiver_(receiver), treasury_(treasury), policy_(policy) {}

Amount BribeRouter::Held() const {
    return assets_.BalanceOf(paymentToken_, self_);
}

FlushResult BribeRouter::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    FlushResult result;
    Amount balance = assets_.BalanceOf(paymentToken_, self_);
    result.amount = balance;
    if (balance == 0) {
        return result;
    }

    // Below this a notification would stream at rate zero
    const Amount minBatch = ToAmount(stream_.GetDuration());

    if (balance < minBatch) {
        switch (policy_) {
            case protocol::BribeDustPolicy::Accumulate:
                result.action = FlushAction::Held;
                return result;
            case protocol::BribeDustPolicy::Receiver:
                result.code = assets_.Transfer(paymentToken_, self_, receiver_, balance);
                result.action = FlushAction::ToReceiver;
                break;
            case protocol::BribeDustPolicy::Treasury:
                result.code = assets_.Transfer(paymentToken_, self_, treasury_, balance);
                result.action = FlushAction::ToTreasury;
                break;
        }
        if (result.IsSuccess()) {
            LOG_DEBUG(util::LogCategory::REWARD) << "Bribe dust " << balance.str()
                << " sent " << FlushActionToString(result.action);
        }
        return result;
    }

    if (balance <= stream_.Left(paymentToken_)) {
        result.action = FlushAction::Held;
        return result;
    }

    result.code = assets_.Approve(paymentToken_, self_, stream_.GetAddress(), balance);
    if (!result.IsSuccess()) {
        return result;
    }
    result.code = stream_.NotifyRewardAmount(self_, paymentToken_, balance);
    if (!result.IsSuccess()) {
        ResultCode cleared = assets_.Approve(paymentToken_, self_, stream_.GetAddress(), 0);
        if (cleared != ResultCode::Success) {
            LOG_WARN(util::LogCategory::REWARD) << "Could not clear stream allowance: "
                                                << ResultCodeToString(cleared);
        }
        return result;
    }
    result.action = FlushAction::Streamed;
    return result;
}

} // namespace economics
} // namespace tributary
