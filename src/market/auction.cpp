// TRIBUTARY - Continuous Dutch Auction Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/market/auction.h"
#include "tributary/util/logging.h"
#include "tributary/util/time.h"

#include <sstream>
#include <stdexcept>

namespace tributary {
namespace market {

// ============================================================================
// Configuration
// ============================================================================

namespace {

ResultCode Reject(std::string* reason, const std::string& message) {
    if (reason) {
        *reason = message;
    }
    return ResultCode::InvalidParameter;
}

} // anonymous namespace

ResultCode ValidateAuctionConfig(const AuctionConfig& config,
                                 const protocol::Params& params,
                                 std::string* reason) {
    if (config.epochPeriod < params.minEpochPeriod) {
        return Reject(reason, "epoch period below minimum");
    }
    if (config.epochPeriod > params.maxEpochPeriod) {
        return Reject(reason, "epoch period above maximum");
    }
    if (config.priceMultiplier < params.minPriceMultiplier) {
        return Reject(reason, "price multiplier below minimum");
    }
    if (config.priceMultiplier > params.maxPriceMultiplier) {
        return Reject(reason, "price multiplier above maximum");
    }
    if (config.minInitPrice < params.absMinInitPrice) {
        return Reject(reason, "minimum init price below absolute minimum");
    }
    if (config.minInitPrice > params.absMaxInitPrice) {
        return Reject(reason, "minimum init price above absolute maximum");
    }
    if (config.initPrice < config.minInitPrice) {
        return Reject(reason, "init price below minimum init price");
    }
    if (config.initPrice > params.absMaxInitPrice) {
        return Reject(reason, "init price above absolute maximum");
    }
    return ResultCode::Success;
}

const char* AuctionPhaseToString(AuctionPhase phase) {
    switch (phase) {
        case AuctionPhase::Active: return "active";
        case AuctionPhase::Expired: return "expired";
        default: return "unknown";
    }
}

Amount PriceAt(const Amount& initPrice, int64_t epochPeriod, int64_t elapsed) {
    if (epochPeriod <= 0) {
        throw std::invalid_argument("epoch period must be positive");
    }
    if (elapsed < 0) {
        elapsed = 0;
    }
    if (elapsed >= epochPeriod) {
        return 0;
    }
    return initPrice * ToAmount(epochPeriod - elapsed) / ToAmount(epochPeriod);
}

std::string BuyResult::ToString() const {
    std::ostringstream oss;
    oss << "BuyResult(" << ResultCodeToString(code);
    if (IsSuccess()) {
        oss << ", epoch=" << epochId
            << ", paid=" << paymentAmount.str()
            << ", revenue=" << revenueAmount.str()
            << ", bribe=" << bribeAmount.str();
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// Auction Market
// ============================================================================

AuctionMarket::AuctionMarket(const Address& self, asset::IAssetLedger& assets,
                             const Address& revenueToken, const Address& paymentToken,
                             const Address& receiver, economics::BribeRouter& bribeRouter,
                             SplitSource split, const AuctionConfig& config,
                             const Amount& absMaxInitPrice)
    : self_(self), assets_(assets), revenueToken_(revenueToken),
      paymentToken_(paymentToken), receiver_(receiver), bribeRouter_(bribeRouter),
      split_(std::move(split)), config_(config), absMaxInitPrice_(absMaxInitPrice) {
    state_.epochId = 0;
    state_.startTime = util::GetTime();
    state_.initPrice = config.initPrice;
}

Amount AuctionMarket::GetPriceLocked(Timestamp now) const {
    return PriceAt(state_.initPrice, config_.epochPeriod, now - state_.startTime);
}

Amount AuctionMarket::GetPrice() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return GetPriceLocked(util::GetTime());
}

AuctionPhase AuctionMarket::GetPhase() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (util::GetTime() - state_.startTime >= config_.epochPeriod) {
        return AuctionPhase::Expired;
    }
    return AuctionPhase::Active;
}

BuyQuote AuctionMarket::CheckBuy(const Address& payer, const Address& recipient,
                                 uint64_t expectedEpochId, Timestamp deadline,
                                 const Amount& maxPayment, const Amount& extraRevenue,
                                 bool checkPayer) const {
    return CheckBuyAt(util::GetTime(), payer, recipient, expectedEpochId, deadline,
                      maxPayment, extraRevenue, checkPayer);
}

BuyQuote AuctionMarket::CheckBuyAt(Timestamp now, const Address& payer,
                                   const Address& recipient, uint64_t expectedEpochId,
                                   Timestamp deadline, const Amount& maxPayment,
                                   const Amount& extraRevenue, bool checkPayer) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    BuyQuote quote;
    if (now > deadline) {
        quote.code = ResultCode::DeadlineExpired;
        return quote;
    }
    if (expectedEpochId != state_.epochId) {
        quote.code = ResultCode::EpochIdMismatch;
        return quote;
    }

    quote.price = GetPriceLocked(now);
    if (quote.price > maxPayment) {
        quote.code = ResultCode::MaxPaymentExceeded;
        return quote;
    }

    quote.revenue = assets_.BalanceOf(revenueToken_, self_) + extraRevenue;
    if (quote.revenue == 0) {
        quote.code = ResultCode::EmptyAssets;
        return quote;
    }
    if (recipient.IsNull()) {
        quote.code = ResultCode::ZeroAddress;
        return quote;
    }

    if (checkPayer && quote.price > 0) {
        if (assets_.BalanceOf(paymentToken_, payer) < quote.price) {
            quote.code = ResultCode::InsufficientBalance;
            return quote;
        }
        if (payer != self_ && assets_.Allowance(paymentToken_, payer, self_) < quote.price) {
            quote.code = ResultCode::InsufficientAllowance;
            return quote;
        }
    }
    return quote;
}

BuyResult AuctionMarket::Buy(const Address& payer, const Address& recipient,
                             uint64_t expectedEpochId, Timestamp deadline,
                             const Amount& maxPayment) {
    return BuyAt(util::GetTime(), payer, recipient, expectedEpochId, deadline, maxPayment);
}

BuyResult AuctionMarket::BuyAt(Timestamp now, const Address& payer, const Address& recipient,
                               uint64_t expectedEpochId, Timestamp deadline,
                               const Amount& maxPayment) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    BuyQuote quote = CheckBuyAt(now, payer, recipient, expectedEpochId, deadline,
                                maxPayment, 0, true);
    if (!quote.IsSuccess()) {
        LOG_DEBUG(util::LogCategory::AUCTION) << "Auction " << self_.ToShortString()
            << " rejected buy: " << ResultCodeToString(quote.code);
        return BuyResult::Failure(quote.code);
    }

    const Amount price = quote.price;
    const uint32_t splitBps = split_ ? split_() : 0;
    if (splitBps >= BPS_DIVISOR) {
        throw std::logic_error("bribe split must leave the receiver a share");
    }

    BuyResult result;
    result.epochId = state_.epochId;
    result.paymentAmount = price;
    result.revenueAmount = quote.revenue;
    result.bribeAmount = price * splitBps / BPS_DIVISOR;
    const Amount toReceiver = price - result.bribeAmount;

    // All checks passed; a failure past this point means the asset ledger
    // disagrees with its own balance queries.
    if (price > 0) {
        ResultCode code = assets_.TransferFrom(paymentToken_, self_, payer, self_, price);
        if (code != ResultCode::Success) {
            throw std::logic_error(std::string("auction payment pull failed: ") +
                                   ResultCodeToString(code));
        }
        if (result.bribeAmount > 0) {
            code = assets_.Transfer(paymentToken_, self_, bribeRouter_.GetAddress(),
                                    result.bribeAmount);
            if (code != ResultCode::Success) {
                throw std::logic_error("auction bribe transfer failed");
            }
        }
        if (toReceiver > 0) {
            code = assets_.Transfer(paymentToken_, self_, receiver_, toReceiver);
            if (code != ResultCode::Success) {
                throw std::logic_error("auction receiver transfer failed");
            }
        }
    }

    ResultCode code = assets_.Transfer(revenueToken_, self_, recipient, quote.revenue);
    if (code != ResultCode::Success) {
        throw std::logic_error("auction revenue transfer failed");
    }

    Amount nextInit = price * config_.priceMultiplier / PRECISION;
    if (nextInit < config_.minInitPrice) {
        nextInit = config_.minInitPrice;
    }
    if (nextInit > absMaxInitPrice_) {
        nextInit = absMaxInitPrice_;
    }

    state_.initPrice = nextInit;
    state_.startTime = now;
    ++state_.epochId;

    LOG_INFO(util::LogCategory::AUCTION) << "Auction " << self_.ToShortString()
        << " sold epoch " << result.epochId << ": " << quote.revenue.str()
        << " revenue for " << price.str() << " (bribe " << result.bribeAmount.str()
        << "), next init " << nextInit.str();

    if (result.bribeAmount > 0) {
        economics::FlushResult flushed = bribeRouter_.Flush();
        if (!flushed.IsSuccess()) {
            LOG_WARN(util::LogCategory::AUCTION) << "Bribe flush for "
                << self_.ToShortString() << " failed: " << ResultCodeToString(flushed.code);
        }
    }
    return result;
}

// ============================================================================
// Accessors
// ============================================================================

AuctionState AuctionMarket::GetState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_;
}

uint64_t AuctionMarket::GetEpochId() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.epochId;
}

Amount AuctionMarket::GetRevenueBalance() const {
    return assets_.BalanceOf(revenueToken_, self_);
}

} // namespace market
} // namespace tributary
