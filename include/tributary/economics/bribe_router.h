// TRIBUTARY - Bribe Router
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#ifndef TRIBUTARY_ECONOMICS_BRIBE_ROUTER_H
#define TRIBUTARY_ECONOMICS_BRIBE_ROUTER_H

#include "tributary/asset/asset_ledger.h"
#include "tributary/core/result.h"
#include "tributary/core/types.h"
#include "tributary/economics/reward_stream.h"
#include "tributary/protocol/params.h"

#include <mutex>
#include <string>

namespace tributary {
namespace economics {

/// What a flush did with the router's balance
enum class FlushAction : uint8_t {
    None,           // Nothing held
    Streamed,       // Forwarded to the reward stream
    Held,           // Kept for a later batch
    ToReceiver,     // Dust paid to the strategy receiver
    ToTreasury,     // Dust paid to the treasury
};

const char* FlushActionToString(FlushAction action);

struct FlushResult {
    ResultCode code{ResultCode::Success};
    FlushAction action{FlushAction::None};
    Amount amount;

    bool IsSuccess() const { return code == ResultCode::Success; }
};

/**
 * Holding account for a strategy's cut of auction proceeds.
 *
 * Flush() forwards the whole balance to the strategy's reward stream once
 * it exceeds both the stream's unstreamed remainder and the smallest batch
 * that yields a non-zero reward rate. A balance that is at least that
 * minimum but not above the remainder is always held. A balance below the
 * minimum is handled by the configured BribeDustPolicy. Anyone may flush.
 */
class BribeRouter {
public:
    BribeRouter(const Address& self, asset::IAssetLedger& assets, RewardStream& stream,
                const Address& paymentToken, const Address& receiver,
                const Address& treasury, protocol::BribeDustPolicy policy);

    BribeRouter(const BribeRouter&) = delete;
    BribeRouter& operator=(const BribeRouter&) = delete;

    FlushResult Flush();

    /// Balance currently held
    Amount Held() const;

    const Address& GetAddress() const { return self_; }
    const Address& GetPaymentToken() const { return paymentToken_; }
    protocol::BribeDustPolicy GetDustPolicy() const { return policy_; }

private:
    Address self_;
    asset::IAssetLedger& assets_;
    RewardStream& stream_;
    Address paymentToken_;
    Address receiver_;
    Address treasury_;
    protocol::BribeDustPolicy policy_;

    std::mutex mutex_;
};

} // namespace economics
} // namespace tributary

#endif // TRIBUTARY_ECONOMICS_BRIBE_ROUTER_H
