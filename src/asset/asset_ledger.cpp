// TRIBUTARY - In-Memory Asset Ledger
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/asset/asset_ledger.h"
#include "tributary/util/logging.h"

namespace tributary {
namespace asset {

bool MemoryAssetLedger::RegisterToken(const Address& token, const std::string& symbol,
                                      uint8_t decimals) {
    if (token.IsNull()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (tokens_.count(token) > 0) {
        return false;
    }
    TokenInfo info;
    info.symbol = symbol;
    info.decimals = decimals;
    tokens_.emplace(token, std::move(info));

    LOG_DEBUG(util::LogCategory::ASSET) << "Registered token " << symbol
                                        << " at " << token.ToHex();
    return true;
}

ResultCode MemoryAssetLedger::Mint(const Address& token, const Address& to,
                                   const Amount& amount) {
    if (to.IsNull()) {
        return ResultCode::ZeroAddress;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return ResultCode::UnknownToken;
    }
    Amount newSupply = it->second.totalSupply + amount;
    Amount newBalance = balances_[{token, to}] + amount;
    it->second.totalSupply = newSupply;
    balances_[{token, to}] = newBalance;
    return ResultCode::Success;
}

ResultCode MemoryAssetLedger::Burn(const Address& token, const Address& from,
                                   const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return ResultCode::UnknownToken;
    }
    Amount& balance = balances_[{token, from}];
    if (balance < amount) {
        return ResultCode::InsufficientBalance;
    }
    balance -= amount;
    it->second.totalSupply -= amount;
    return ResultCode::Success;
}

ResultCode MemoryAssetLedger::MoveLocked(const Address& token, const Address& from,
                                         const Address& to, const Amount& amount) {
    if (tokens_.count(token) == 0) {
        return ResultCode::UnknownToken;
    }
    if (to.IsNull()) {
        return ResultCode::ZeroAddress;
    }
    if (amount == 0) {
        return ResultCode::Success;
    }

    auto fromIt = balances_.find({token, from});
    if (fromIt == balances_.end() || fromIt->second < amount) {
        return ResultCode::InsufficientBalance;
    }
    if (from == to) {
        return ResultCode::Success;
    }

    Amount credited = balances_[{token, to}] + amount;
    fromIt->second -= amount;
    balances_[{token, to}] = credited;
    return ResultCode::Success;
}

ResultCode MemoryAssetLedger::Transfer(const Address& token, const Address& from,
                                       const Address& to, const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    ResultCode code = MoveLocked(token, from, to, amount);
    if (code != ResultCode::Success) {
        LOG_DEBUG(util::LogCategory::ASSET) << "Transfer of " << amount.str()
            << " from " << from.ToShortString() << " to " << to.ToShortString()
            << " failed: " << ResultCodeToString(code);
    }
    return code;
}

ResultCode MemoryAssetLedger::TransferFrom(const Address& token, const Address& spender,
                                           const Address& from, const Address& to,
                                           const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tokens_.count(token) == 0) {
        return ResultCode::UnknownToken;
    }

    bool selfSpend = spender == from;
    auto allowIt = allowances_.find({{token, from}, spender});
    if (!selfSpend && amount > 0 &&
        (allowIt == allowances_.end() || allowIt->second < amount)) {
        return ResultCode::InsufficientAllowance;
    }

    ResultCode code = MoveLocked(token, from, to, amount);
    if (code != ResultCode::Success) {
        return code;
    }
    if (!selfSpend && amount > 0) {
        allowIt->second -= amount;
    }
    return ResultCode::Success;
}

ResultCode MemoryAssetLedger::Approve(const Address& token, const Address& owner,
                                      const Address& spender, const Amount& amount) {
    if (spender.IsNull()) {
        return ResultCode::ZeroAddress;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (tokens_.count(token) == 0) {
        return ResultCode::UnknownToken;
    }
    allowances_[{{token, owner}, spender}] = amount;
    return ResultCode::Success;
}

Amount MemoryAssetLedger::BalanceOf(const Address& token, const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find({token, account});
    return it == balances_.end() ? Amount(0) : it->second;
}

Amount MemoryAssetLedger::Allowance(const Address& token, const Address& owner,
                                    const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({{token, owner}, spender});
    return it == allowances_.end() ? Amount(0) : it->second;
}

std::optional<uint8_t> MemoryAssetLedger::Decimals(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second.decimals;
}

bool MemoryAssetLedger::HasToken(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.count(token) > 0;
}

std::optional<TokenInfo> MemoryAssetLedger::GetTokenInfo(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Amount MemoryAssetLedger::SumBalances(const Address& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& [key, balance] : balances_) {
        if (key.first == token) {
            total += balance;
        }
    }
    return total;
}

std::optional<Address> MemoryAssetLedger::FindToken(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [token, info] : tokens_) {
        if (info.symbol == symbol) {
            return token;
        }
    }
    return std::nullopt;
}

} // namespace asset
} // namespace tributary
