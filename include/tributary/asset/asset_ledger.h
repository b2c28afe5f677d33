// TRIBUTARY - Asset Ledger Interface
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Fungible-asset custody consumed by the voting ledger, auctions, reward
// streams and the router. Every token is identified by an Address and every
// holder, including ledger components, by an Address.

#ifndef TRIBUTARY_ASSET_ASSET_LEDGER_H
#define TRIBUTARY_ASSET_ASSET_LEDGER_H

#include "tributary/core/result.h"
#include "tributary/core/types.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tributary {
namespace asset {

// ============================================================================
// IAssetLedger
// ============================================================================

/**
 * Standard fungible-asset ledger.
 *
 * Transfer moves funds held by `from`; the caller is trusted to act for
 * `from` (components only ever pass their own address). TransferFrom spends
 * an allowance that `from` granted to `spender`. Zero-amount transfers
 * succeed without effect. A failed call changes nothing.
 */
class IAssetLedger {
public:
    virtual ~IAssetLedger() = default;

    virtual ResultCode Transfer(const Address& token, const Address& from,
                                const Address& to, const Amount& amount) = 0;

    virtual ResultCode TransferFrom(const Address& token, const Address& spender,
                                    const Address& from, const Address& to,
                                    const Amount& amount) = 0;

    virtual ResultCode Approve(const Address& token, const Address& owner,
                               const Address& spender, const Amount& amount) = 0;

    virtual Amount BalanceOf(const Address& token, const Address& account) const = 0;

    virtual Amount Allowance(const Address& token, const Address& owner,
                             const Address& spender) const = 0;

    /// Token decimals, or nullopt for an unknown token
    virtual std::optional<uint8_t> Decimals(const Address& token) const = 0;

    virtual bool HasToken(const Address& token) const = 0;
};

// ============================================================================
// MemoryAssetLedger
// ============================================================================

/// Token metadata
struct TokenInfo {
    std::string symbol;
    uint8_t decimals{18};
    Amount totalSupply;
};

/**
 * In-process asset ledger backed by maps.
 *
 * Used by the simulator and the test suite in place of deployed tokens.
 */
class MemoryAssetLedger : public IAssetLedger {
public:
    MemoryAssetLedger() = default;

    /// Register a token. Returns false if already registered or null.
    bool RegisterToken(const Address& token, const std::string& symbol,
                       uint8_t decimals = 18);

    /// Create new units for `to`
    ResultCode Mint(const Address& token, const Address& to, const Amount& amount);

    /// Destroy units held by `from`
    ResultCode Burn(const Address& token, const Address& from, const Amount& amount);

    ResultCode Transfer(const Address& token, const Address& from,
                        const Address& to, const Amount& amount) override;

    ResultCode TransferFrom(const Address& token, const Address& spender,
                            const Address& from, const Address& to,
                            const Amount& amount) override;

    ResultCode Approve(const Address& token, const Address& owner,
                       const Address& spender, const Amount& amount) override;

    Amount BalanceOf(const Address& token, const Address& account) const override;

    Amount Allowance(const Address& token, const Address& owner,
                     const Address& spender) const override;

    std::optional<uint8_t> Decimals(const Address& token) const override;

    bool HasToken(const Address& token) const override;

    std::optional<TokenInfo> GetTokenInfo(const Address& token) const;

    /// Sum of all balances of a token (equals its total supply)
    Amount SumBalances(const Address& token) const;

    /// Look up a token by symbol
    std::optional<Address> FindToken(const std::string& symbol) const;

private:
    using BalanceKey = std::pair<Address, Address>;                  // token, holder
    using AllowanceKey = std::pair<BalanceKey, Address>;             // (token, owner), spender

    ResultCode MoveLocked(const Address& token, const Address& from,
                          const Address& to, const Amount& amount);

    std::map<Address, TokenInfo> tokens_;
    std::map<BalanceKey, Amount> balances_;
    std::map<AllowanceKey, Amount> allowances_;
    mutable std::mutex mutex_;
};

} // namespace asset
} // namespace tributary

#endif // TRIBUTARY_ASSET_ASSET_LEDGER_H
