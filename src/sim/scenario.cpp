// TRIBUTARY - Scenario Interpreter Implementation
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include "tributary/sim/scenario.h"
#include "tributary/market/auction.h"
#include "tributary/router/views.h"
#include "tributary/util/config.h"
#include "tributary/util/logging.h"
#include "tributary/util/time.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace tributary {
namespace sim {

namespace {

std::vector<std::string> Tokenize(const std::string& line) {
    std::string body = line.substr(0, line.find('#'));
    std::istringstream iss(body);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) {
        tokens.push_back(tok);
    }
    return tokens;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

CommandResult Usage(const char* usage) {
    return CommandResult::Fail(std::string("usage: ") + usage);
}

CommandResult FromCode(ResultCode code, const std::string& output = "") {
    if (code != ResultCode::Success) {
        return CommandResult::Fail(ResultCodeToString(code));
    }
    return CommandResult::Ok(output);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Scenario::Scenario(const protocol::Params& params, Timestamp startTime)
    : params_(params) {
    util::EnableMockTime();
    util::SetMockTime(startTime);

    owner_ = Resolve("owner");
    treasury_ = Resolve("treasury");
    const Address ledgerAddr = Resolve("ledger");
    const Address routerAddr = Resolve("router");

    revenueToken_ = Address::FromId(nextId_++);
    if (!assets_.RegisterToken(revenueToken_, REVENUE_SYMBOL)) {
        throw std::logic_error("revenue token registration failed");
    }
    tokens_[REVENUE_SYMBOL] = revenueToken_;

    ledger_ = std::make_unique<governance::VotingLedger>(
        params_, assets_, power_, ledgerAddr, owner_, revenueToken_, treasury_);
    router_ = std::make_unique<router::AtomicRouter>(routerAddr, *ledger_, assets_);

    LOG_INFO(util::LogCategory::SIM) << "Scenario on " << params_.networkId
        << " starting at " << util::FormatISO8601(startTime);
}

Scenario::~Scenario() = default;

Address Scenario::Resolve(const std::string& name) {
    auto it = names_.find(name);
    if (it != names_.end()) {
        return it->second;
    }
    Address addr = Address::FromId(nextId_++);
    names_[name] = addr;
    return addr;
}

std::optional<Address> Scenario::Lookup(const std::string& name) const {
    auto it = names_.find(name);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Scenario::NameOf(const Address& address) const {
    for (const auto& [name, addr] : names_) {
        if (addr == address) {
            return name;
        }
    }
    for (const auto& [symbol, addr] : tokens_) {
        if (addr == address) {
            return symbol;
        }
    }
    return address.ToShortString();
}

std::optional<Address> Scenario::ResolveToken(const std::string& symbol) const {
    auto it = tokens_.find(symbol);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Address> Scenario::ResolveStrategy(const std::string& name) const {
    auto it = strategies_.find(name);
    if (it == strategies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Dispatch
// ============================================================================

CommandResult Scenario::Execute(const std::string& line) {
    Args args = Tokenize(line);
    if (args.empty()) {
        return CommandResult::Ok();
    }
    const std::string cmd = ToLower(args[0]);
    args.erase(args.begin());

    try {
        if (cmd == "token") return CmdToken(args);
        if (cmd == "mint") return CmdMint(args);
        if (cmd == "power") return CmdPower(args);
        if (cmd == "strategy") return CmdStrategy(args);
        if (cmd == "vote") return CmdVote(args);
        if (cmd == "reset") return CmdReset(args);
        if (cmd == "notify") return CmdNotify(args);
        if (cmd == "distribute") return CmdDistribute(args);
        if (cmd == "buy") return CmdBuy(args);
        if (cmd == "claim") return CmdClaim(args);
        if (cmd == "kill") return CmdKill(args);
        if (cmd == "split") return CmdSplit(args);
        if (cmd == "flush") return CmdFlush(args);
        if (cmd == "advance") return CmdAdvance(args);
        if (cmd == "show") return CmdShow(args);
    } catch (const std::range_error& e) {
        return CommandResult::Fail(std::string("arithmetic underflow: ") + e.what());
    } catch (const std::overflow_error& e) {
        return CommandResult::Fail(std::string("arithmetic overflow: ") + e.what());
    }
    return CommandResult::Fail("unknown command '" + cmd + "'");
}

ScriptResult Scenario::Run(std::istream& in, std::ostream& out, bool stopOnError) {
    ScriptResult result;
    std::string line;
    size_t lineNum = 0;
    while (std::getline(in, line)) {
        ++lineNum;
        if (Tokenize(line).empty()) {
            continue;
        }
        ++result.commands;
        CommandResult cr = Execute(line);
        out << "> " << line << "\n";
        if (!cr.output.empty()) {
            out << cr.output;
            if (cr.output.back() != '\n') {
                out << "\n";
            }
        }
        if (!cr.success) {
            out << "error: " << cr.error << "\n";
            if (result.success) {
                result.success = false;
                result.failedLine = lineNum;
                result.error = cr.error;
            }
            LOG_WARN(util::LogCategory::SIM) << "Line " << lineNum << ": " << cr.error;
            if (stopOnError) {
                break;
            }
        }
    }
    return result;
}

// ============================================================================
// Commands
// ============================================================================

CommandResult Scenario::CmdToken(const Args& args) {
    if (args.empty() || args.size() > 2) {
        return Usage("token <SYMBOL> [decimals]");
    }
    if (tokens_.count(args[0]) > 0) {
        return CommandResult::Fail("token " + args[0] + " already exists");
    }
    uint8_t decimals = 18;
    if (args.size() == 2) {
        auto d = ParseAmount(args[1]);
        if (!d || *d > 77) {
            return CommandResult::Fail("invalid decimals");
        }
        decimals = d->convert_to<uint8_t>();
    }
    Address token = Address::FromId(nextId_++);
    if (!assets_.RegisterToken(token, args[0], decimals)) {
        return CommandResult::Fail("token " + args[0] + " could not be registered");
    }
    tokens_[args[0]] = token;
    return CommandResult::Ok("token " + args[0] + " at " + token.ToHex());
}

CommandResult Scenario::CmdMint(const Args& args) {
    if (args.size() != 3) {
        return Usage("mint <account> <SYMBOL> <amount>");
    }
    auto token = ResolveToken(args[1]);
    auto amount = ParseAmount(args[2]);
    if (!token) return CommandResult::Fail("unknown token " + args[1]);
    if (!amount) return CommandResult::Fail("invalid amount " + args[2]);
    return FromCode(assets_.Mint(*token, Resolve(args[0]), *amount));
}

CommandResult Scenario::CmdPower(const Args& args) {
    if (args.size() != 2) {
        return Usage("power <account> <amount>");
    }
    auto amount = ParseAmount(args[1]);
    if (!amount) return CommandResult::Fail("invalid amount " + args[1]);
    power_.UpdateVotingPower(Resolve(args[0]), *amount);
    return CommandResult::Ok();
}

CommandResult Scenario::CmdStrategy(const Args& args) {
    if (args.size() != 7) {
        return Usage("strategy <name> <SYMBOL> <receiver> <initPrice> <epochPeriod> "
                     "<multiplier> <minInitPrice>");
    }
    if (strategies_.count(args[0]) > 0 || names_.count(args[0]) > 0) {
        return CommandResult::Fail("name " + args[0] + " already bound");
    }
    auto token = ResolveToken(args[1]);
    if (!token) return CommandResult::Fail("unknown token " + args[1]);

    market::AuctionConfig config;
    auto initPrice = ParseAmount(args[3]);
    auto period = util::ParseDuration(args[4]);
    auto multiplier = ParseAmount(args[5]);
    auto minInit = ParseAmount(args[6]);
    if (!initPrice || !period || !multiplier || !minInit) {
        return CommandResult::Fail("invalid auction parameters");
    }
    config.initPrice = *initPrice;
    config.epochPeriod = *period;
    config.priceMultiplier = *multiplier;
    config.minInitPrice = *minInit;

    governance::AddStrategyResult result =
        ledger_->AddStrategy(owner_, *token, Resolve(args[2]), config);
    if (!result.IsSuccess()) {
        return CommandResult::Fail(ResultCodeToString(result.code));
    }
    strategies_[args[0]] = result.strategy;
    names_[args[0]] = result.strategy;
    return CommandResult::Ok("strategy " + args[0] + " at " + result.strategy.ToHex());
}

CommandResult Scenario::CmdVote(const Args& args) {
    if (args.empty()) {
        return Usage("vote <account> <strategy>=<weight> ...");
    }
    std::vector<Address> targets;
    std::vector<Amount> weights;
    for (size_t i = 1; i < args.size(); ++i) {
        size_t eq = args[i].find('=');
        if (eq == std::string::npos) {
            return CommandResult::Fail("expected <strategy>=<weight>, got " + args[i]);
        }
        std::string name = args[i].substr(0, eq);
        auto weight = ParseAmount(args[i].substr(eq + 1));
        if (!weight) return CommandResult::Fail("invalid weight in " + args[i]);
        // Unknown names still reach the ledger, which skips them
        auto strategy = ResolveStrategy(name);
        targets.push_back(strategy ? *strategy : Resolve(name));
        weights.push_back(*weight);
    }
    return FromCode(ledger_->Vote(Resolve(args[0]), targets, weights));
}

CommandResult Scenario::CmdReset(const Args& args) {
    if (args.size() != 1) {
        return Usage("reset <account>");
    }
    return FromCode(ledger_->Reset(Resolve(args[0])));
}

CommandResult Scenario::CmdNotify(const Args& args) {
    if (args.size() != 1) {
        return Usage("notify <amount>");
    }
    auto amount = ParseAmount(args[0]);
    if (!amount) return CommandResult::Fail("invalid amount " + args[0]);

    const Address source = ledger_->GetRevenueSource();
    ResultCode code = assets_.Mint(revenueToken_, source, *amount);
    if (code != ResultCode::Success) {
        return FromCode(code);
    }
    code = assets_.Approve(revenueToken_, source, ledger_->GetAddress(), *amount);
    if (code != ResultCode::Success) {
        return FromCode(code);
    }
    code = ledger_->NotifyRevenue(source, *amount);
    if (code != ResultCode::Success) {
        ResultCode burned = assets_.Burn(revenueToken_, source, *amount);
        if (burned != ResultCode::Success) {
            LOG_WARN(util::LogCategory::SIM) << "Could not burn unnotified revenue: "
                                             << ResultCodeToString(burned);
        }
    }
    return FromCode(code);
}

CommandResult Scenario::CmdDistribute(const Args& args) {
    if (args.size() > 1) {
        return Usage("distribute [<strategy>|all]");
    }
    if (args.empty() || args[0] == "all") {
        return FromCode(router_->DistributeAll());
    }
    auto strategy = ResolveStrategy(args[0]);
    if (!strategy) return CommandResult::Fail("unknown strategy " + args[0]);
    return FromCode(router_->Distribute(*strategy));
}

CommandResult Scenario::CmdBuy(const Args& args) {
    if (args.size() < 3 || args.size() > 4) {
        return Usage("buy <account> <strategy> <maxPayment> [direct|atomic|atomic-all]");
    }
    auto strategy = ResolveStrategy(args[1]);
    auto maxPayment = ParseAmount(args[2]);
    if (!strategy) return CommandResult::Fail("unknown strategy " + args[1]);
    if (!maxPayment) return CommandResult::Fail("invalid amount " + args[2]);
    const std::string mode = args.size() == 4 ? ToLower(args[3]) : "atomic";

    const Address buyer = Resolve(args[0]);
    market::AuctionMarket* auction = ledger_->GetAuction(*strategy);
    const Address& paymentToken = auction->GetPaymentToken();
    const uint64_t epochId = auction->GetEpochId();
    const Timestamp deadline = util::GetTime();

    market::BuyResult result;
    if (mode == "direct") {
        ResultCode code = assets_.Approve(paymentToken, buyer, auction->GetAddress(), *maxPayment);
        if (code != ResultCode::Success) {
            return FromCode(code);
        }
        result = auction->Buy(buyer, buyer, epochId, deadline, *maxPayment);
        code = assets_.Approve(paymentToken, buyer, auction->GetAddress(), 0);
        if (code != ResultCode::Success) {
            return FromCode(code);
        }
    } else if (mode == "atomic" || mode == "atomic-all") {
        ResultCode code = assets_.Approve(paymentToken, buyer, router_->GetAddress(), *maxPayment);
        if (code != ResultCode::Success) {
            return FromCode(code);
        }
        result = mode == "atomic"
            ? router_->DistributeAndBuy(buyer, *strategy, epochId, deadline, *maxPayment)
            : router_->DistributeAllAndBuy(buyer, *strategy, epochId, deadline, *maxPayment);
        code = assets_.Approve(paymentToken, buyer, router_->GetAddress(), 0);
        if (code != ResultCode::Success) {
            return FromCode(code);
        }
    } else {
        return CommandResult::Fail("unknown buy mode " + mode);
    }
    return FromCode(result.code, result.ToString());
}

CommandResult Scenario::CmdClaim(const Args& args) {
    if (args.size() < 2) {
        return Usage("claim <account> <strategy> ...");
    }
    std::vector<Address> targets;
    for (size_t i = 1; i < args.size(); ++i) {
        auto strategy = ResolveStrategy(args[i]);
        if (!strategy) return CommandResult::Fail("unknown strategy " + args[i]);
        targets.push_back(*strategy);
    }
    return FromCode(ledger_->ClaimBribes(Resolve(args[0]), targets));
}

CommandResult Scenario::CmdKill(const Args& args) {
    if (args.size() != 1) {
        return Usage("kill <strategy>");
    }
    auto strategy = ResolveStrategy(args[0]);
    if (!strategy) return CommandResult::Fail("unknown strategy " + args[0]);
    return FromCode(ledger_->KillStrategy(owner_, *strategy));
}

CommandResult Scenario::CmdSplit(const Args& args) {
    if (args.size() != 1) {
        return Usage("split <bps>");
    }
    auto bps = ParseAmount(args[0]);
    if (!bps || *bps > BPS_DIVISOR) {
        return CommandResult::Fail("invalid split " + args[0]);
    }
    return FromCode(ledger_->SetBribeSplit(owner_, bps->convert_to<uint32_t>()));
}

CommandResult Scenario::CmdFlush(const Args& args) {
    if (args.size() != 1) {
        return Usage("flush <strategy>");
    }
    auto strategy = ResolveStrategy(args[0]);
    if (!strategy) return CommandResult::Fail("unknown strategy " + args[0]);
    economics::FlushResult result = ledger_->GetBribeRouter(*strategy)->Flush();
    return FromCode(result.code, std::string("flush ") + economics::FlushActionToString(result.action) +
                                 " " + result.amount.str());
}

CommandResult Scenario::CmdAdvance(const Args& args) {
    if (args.size() != 1) {
        return Usage("advance <duration>");
    }
    auto seconds = util::ParseDuration(args[0]);
    if (!seconds) return CommandResult::Fail("invalid duration " + args[0]);
    util::AdvanceMockTime(util::Seconds(*seconds));
    return CommandResult::Ok("now " + util::FormatISO8601(util::GetTime()));
}

std::string Scenario::FormatBalances(const Address& account) const {
    std::ostringstream oss;
    for (const auto& [symbol, token] : tokens_) {
        Amount balance = assets_.BalanceOf(token, account);
        if (balance > 0) {
            oss << "  " << symbol << ": " << balance.str() << "\n";
        }
    }
    return oss.str();
}

CommandResult Scenario::CmdShow(const Args& args) {
    if (args.empty() || args.size() > 2) {
        return Usage("show <name>|balances <SYMBOL>");
    }
    std::ostringstream oss;

    if (args[0] == "balances") {
        if (args.size() != 2) return Usage("show balances <SYMBOL>");
        auto token = ResolveToken(args[1]);
        if (!token) return CommandResult::Fail("unknown token " + args[1]);
        for (const auto& [name, addr] : names_) {
            Amount balance = assets_.BalanceOf(*token, addr);
            if (balance > 0) {
                oss << name << ": " << balance.str() << "\n";
            }
        }
        return CommandResult::Ok(oss.str());
    }

    if (auto strategy = ResolveStrategy(args[0])) {
        auto snap = router::GetStrategySnapshot(*ledger_, *strategy);
        auto rewards = router::GetRewardSnapshot(*ledger_, *strategy);
        oss << args[0] << ": " << snap->ToString() << "\n";
        oss << "  bribes held " << rewards->bribeHeld.str()
            << ", stream supply " << rewards->totalSupply.str() << "\n";
        for (const auto& entry : rewards->tokens) {
            oss << "  reward " << NameOf(entry.token) << " rate " << entry.rewardRate.str()
                << "/s, left " << entry.left.str() << "\n";
        }
        return CommandResult::Ok(oss.str());
    }

    auto account = Lookup(args[0]);
    if (!account) return CommandResult::Fail("unknown name " + args[0]);
    router::AccountSnapshot snap = router::GetAccountSnapshot(*ledger_, *account);
    oss << args[0] << ": power " << snap.votingPower.str()
        << ", used " << snap.usedWeight.str()
        << (snap.canVote ? ", can vote" : ", voted this epoch") << "\n";
    for (const auto& [strategy, weight] : snap.votes) {
        oss << "  vote " << NameOf(strategy) << " " << weight.str();
        if (auto rewards = router::GetRewardSnapshot(*ledger_, strategy, *account)) {
            for (const auto& entry : rewards->tokens) {
                if (entry.earned > 0) {
                    oss << ", earned " << entry.earned.str() << " " << NameOf(entry.token);
                }
            }
        }
        oss << "\n";
    }
    oss << FormatBalances(*account);
    return CommandResult::Ok(oss.str());
}

} // namespace sim
} // namespace tributary
