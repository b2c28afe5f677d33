// TRIBUTARY - Scenario Interpreter
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Line-oriented driver for an in-memory deployment. Each line is one
// command; names resolve to addresses on first use.
//
//   token <SYMBOL> [decimals]
//   mint <account> <SYMBOL> <amount>
//   power <account> <amount>
//   strategy <name> <SYMBOL> <receiver> <initPrice> <epochPeriod> <multiplier> <minInitPrice>
//   vote <account> <strategy>=<weight> ...
//   reset <account>
//   notify <amount>
//   distribute [<strategy>|all]
//   buy <account> <strategy> <maxPayment> [direct|atomic|atomic-all]
//   claim <account> <strategy> ...
//   kill <strategy>
//   split <bps>
//   flush <strategy>
//   advance <duration>
//   show <name>|balances <SYMBOL>

#ifndef TRIBUTARY_SIM_SCENARIO_H
#define TRIBUTARY_SIM_SCENARIO_H

#include "tributary/asset/asset_ledger.h"
#include "tributary/core/types.h"
#include "tributary/governance/voting_ledger.h"
#include "tributary/governance/voting_power.h"
#include "tributary/protocol/params.h"
#include "tributary/router/atomic_router.h"

#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tributary {
namespace sim {

/// Symbol of the revenue token created for every scenario
constexpr const char* REVENUE_SYMBOL = "REV";

struct CommandResult {
    bool success{true};
    std::string output;
    std::string error;

    static CommandResult Ok(const std::string& output = "") {
        CommandResult r;
        r.output = output;
        return r;
    }

    static CommandResult Fail(const std::string& error) {
        CommandResult r;
        r.success = false;
        r.error = error;
        return r;
    }
};

struct ScriptResult {
    bool success{true};
    size_t commands{0};
    size_t failedLine{0};
    std::string error;
};

class Scenario {
public:
    /// Builds the deployment and sets the mock clock to `startTime`
    Scenario(const protocol::Params& params, Timestamp startTime);
    ~Scenario();

    Scenario(const Scenario&) = delete;
    Scenario& operator=(const Scenario&) = delete;

    /// Execute one command line. Blank lines and '#' comments succeed.
    CommandResult Execute(const std::string& line);

    /**
     * Execute every line of a script, echoing output.
     * @param stopOnError Abort at the first failing command
     */
    ScriptResult Run(std::istream& in, std::ostream& out, bool stopOnError = true);

    /// Address bound to a name, created on first use
    Address Resolve(const std::string& name);

    std::optional<Address> Lookup(const std::string& name) const;
    std::string NameOf(const Address& address) const;

    asset::MemoryAssetLedger& GetAssets() { return assets_; }
    governance::VotingPowerTracker& GetVotingPower() { return power_; }
    governance::VotingLedger& GetLedger() { return *ledger_; }
    router::AtomicRouter& GetRouter() { return *router_; }

    const Address& GetOwner() const { return owner_; }
    const Address& GetRevenueToken() const { return revenueToken_; }

private:
    using Args = std::vector<std::string>;

    CommandResult CmdToken(const Args& args);
    CommandResult CmdMint(const Args& args);
    CommandResult CmdPower(const Args& args);
    CommandResult CmdStrategy(const Args& args);
    CommandResult CmdVote(const Args& args);
    CommandResult CmdReset(const Args& args);
    CommandResult CmdNotify(const Args& args);
    CommandResult CmdDistribute(const Args& args);
    CommandResult CmdBuy(const Args& args);
    CommandResult CmdClaim(const Args& args);
    CommandResult CmdKill(const Args& args);
    CommandResult CmdSplit(const Args& args);
    CommandResult CmdFlush(const Args& args);
    CommandResult CmdAdvance(const Args& args);
    CommandResult CmdShow(const Args& args);

    std::optional<Address> ResolveToken(const std::string& symbol) const;
    std::optional<Address> ResolveStrategy(const std::string& name) const;
    std::string FormatBalances(const Address& account) const;

    protocol::Params params_;
    asset::MemoryAssetLedger assets_;
    governance::VotingPowerTracker power_;

    Address owner_;
    Address treasury_;
    Address revenueToken_;

    std::unique_ptr<governance::VotingLedger> ledger_;
    std::unique_ptr<router::AtomicRouter> router_;

    std::map<std::string, Address> names_;
    std::map<std::string, Address> strategies_;
    std::map<std::string, Address> tokens_;
    uint64_t nextId_{1};
};

} // namespace sim
} // namespace tributary

#endif // TRIBUTARY_SIM_SCENARIO_H
