// TRIBUTARY - Continuous Dutch Auction
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Each strategy sells its accumulated revenue balance through a single-lot
// Dutch auction. The price decays linearly from initPrice to zero over
// epochPeriod; a purchase takes the whole balance, pays the strategy's
// receiver and bribe router, and reseeds the next epoch from the realized
// price.

#ifndef TRIBUTARY_MARKET_AUCTION_H
#define TRIBUTARY_MARKET_AUCTION_H

#include "tributary/asset/asset_ledger.h"
#include "tributary/core/result.h"
#include "tributary/core/types.h"
#include "tributary/economics/bribe_router.h"
#include "tributary/protocol/params.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace tributary {
namespace market {

// ============================================================================
// Configuration
// ============================================================================

/// Auction parameters fixed at registration
struct AuctionConfig {
    Amount initPrice;           // Price of the first epoch
    int64_t epochPeriod{0};     // Decay duration in seconds
    Amount priceMultiplier;     // Scaled by PRECISION
    Amount minInitPrice;        // Floor for reseeded prices
};

/**
 * Check an auction configuration against the protocol bounds.
 * @return Success or InvalidParameter
 */
ResultCode ValidateAuctionConfig(const AuctionConfig& config,
                                 const protocol::Params& params,
                                 std::string* reason = nullptr);

// ============================================================================
// Auction State
// ============================================================================

enum class AuctionPhase : uint8_t {
    Active,     // Price still decaying
    Expired,    // Price pinned at zero until the next purchase
};

const char* AuctionPhaseToString(AuctionPhase phase);

struct AuctionState {
    uint64_t epochId{0};
    Timestamp startTime{0};
    Amount initPrice;
};

/// Price at `elapsed` seconds into an epoch
Amount PriceAt(const Amount& initPrice, int64_t epochPeriod, int64_t elapsed);

// ============================================================================
// Buy Result
// ============================================================================

struct BuyResult {
    ResultCode code{ResultCode::Success};
    Amount paymentAmount;       // Price paid
    Amount revenueAmount;       // Revenue transferred to the recipient
    Amount bribeAmount;         // Part of the payment routed to voters
    uint64_t epochId{0};        // Epoch that was sold

    bool IsSuccess() const { return code == ResultCode::Success; }

    static BuyResult Failure(ResultCode code) {
        BuyResult r;
        r.code = code;
        return r;
    }

    std::string ToString() const;
};

/// Outcome of a purchase pre-flight
struct BuyQuote {
    ResultCode code{ResultCode::Success};
    Amount price;
    Amount revenue;

    bool IsSuccess() const { return code == ResultCode::Success; }
};

// ============================================================================
// Auction Market
// ============================================================================

class AuctionMarket {
public:
    /// Current bribe split in basis points
    using SplitSource = std::function<uint32_t()>;

    /**
     * @param self Address holding the revenue balance (also the strategy id)
     * @param revenueToken Token being sold
     * @param paymentToken Token the price is paid in
     * @param receiver Recipient of the non-bribe share of each payment
     * @param split Supplies the bribe split at purchase time
     */
    AuctionMarket(const Address& self, asset::IAssetLedger& assets,
                  const Address& revenueToken, const Address& paymentToken,
                  const Address& receiver, economics::BribeRouter& bribeRouter,
                  SplitSource split, const AuctionConfig& config,
                  const Amount& absMaxInitPrice);

    AuctionMarket(const AuctionMarket&) = delete;
    AuctionMarket& operator=(const AuctionMarket&) = delete;

    /// Current price, evaluated against the ledger clock on every call
    Amount GetPrice() const;

    AuctionPhase GetPhase() const;

    /**
     * Check a purchase without executing it.
     *
     * @param extraRevenue Revenue that will arrive before the purchase
     *        (a pending distribution)
     * @param checkPayer Also check the payer's balance and allowance
     */
    BuyQuote CheckBuy(const Address& payer, const Address& recipient,
                      uint64_t expectedEpochId, Timestamp deadline,
                      const Amount& maxPayment, const Amount& extraRevenue,
                      bool checkPayer) const;

    /// CheckBuy against a clock reading supplied by the caller
    BuyQuote CheckBuyAt(Timestamp now, const Address& payer, const Address& recipient,
                        uint64_t expectedEpochId, Timestamp deadline,
                        const Amount& maxPayment, const Amount& extraRevenue,
                        bool checkPayer) const;

    /**
     * Buy the entire revenue balance at the current price.
     *
     * Checks, in order: deadline, epoch id, price against maxPayment,
     * non-empty balance, recipient, payer funds. The payer must have
     * approved this auction for the price.
     */
    BuyResult Buy(const Address& payer, const Address& recipient,
                  uint64_t expectedEpochId, Timestamp deadline,
                  const Amount& maxPayment);

    /// Buy at `now`, which also becomes the start of the next epoch
    BuyResult BuyAt(Timestamp now, const Address& payer, const Address& recipient,
                    uint64_t expectedEpochId, Timestamp deadline,
                    const Amount& maxPayment);

    // ========================================================================
    // Accessors
    // ========================================================================

    AuctionState GetState() const;
    uint64_t GetEpochId() const;
    Amount GetRevenueBalance() const;

    const AuctionConfig& GetConfig() const { return config_; }
    const Address& GetAddress() const { return self_; }
    const Address& GetPaymentToken() const { return paymentToken_; }
    const Address& GetRevenueToken() const { return revenueToken_; }
    const Address& GetReceiver() const { return receiver_; }

    /// Held by the router across a distribute-and-buy composition
    std::recursive_mutex& GetMutex() const { return mutex_; }

private:
    Amount GetPriceLocked(Timestamp now) const;

    Address self_;
    asset::IAssetLedger& assets_;
    Address revenueToken_;
    Address paymentToken_;
    Address receiver_;
    economics::BribeRouter& bribeRouter_;
    SplitSource split_;
    AuctionConfig config_;
    Amount absMaxInitPrice_;

    AuctionState state_;

    mutable std::recursive_mutex mutex_;
};

} // namespace market
} // namespace tributary

#endif // TRIBUTARY_MARKET_AUCTION_H
