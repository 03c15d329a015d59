// TOKENLEDGER Simulator - Main Entry Point
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// tokenledger-sim replays a script of ledger commands against a persistent
// (LevelDB) or in-memory state and prints the result of every command and
// the final state hash. Every caller holds every role.
//
// Script syntax, one command per line, '#' starts a comment:
//   time <t>                        set the clock for following commands
//   as <account>                    set the caller
//   mint <to> <amount>
//   burn <amount>
//   transfer <to> <amount>
//   approve <spender> <amount>
//   transferfrom <from> <to> <amount>
//   fund <amount>                   move caller tokens into the reward pool
//   stake <amount> | unstake <amount> | claim
//   vest <beneficiary> <amount> <start> <cliff> <duration> [revocable]
//   release | revoke <beneficiary>
//   addtier <name> <minimum> <multiplierBps> [cap,cap...]
//   updatetier <index> <name> <minimum> <multiplierBps> [cap,cap...]
//   setrate <rate> | setminduration <seconds> | setearlyfee <bps>
//   setfee <bps> | setdistribution <burn> <rewards> <dev>
//   setdevwallet <account> | setexempt <account> <0|1>
//   pause <0|1>
//   balance <account> | allowance <owner> <spender> | staker <account>
//   pending <account> | releasable <account> | schedule <account>
//   hascap <account> <flag> | globals | tiers | hash
//
// Accounts are 40 hex digits, one of @staking, @rewards, @escrow, or any
// other word, which names a deterministic address derived from it.

#include "tokenledger/core/types.h"
#include "tokenledger/crypto/sha256.h"
#include "tokenledger/db/database.h"
#include "tokenledger/db/memorydb.h"
#include "tokenledger/ledger/ledger.h"
#include "tokenledger/ledger/ledger_config.h"
#include "tokenledger/state/state_view.h"
#include "tokenledger/util/config.h"
#include "tokenledger/util/logging.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace tokenledger {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "TOKENLEDGER Simulator";

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: tokenledger-sim [options] [script]\n\n";
    std::cout << "Reads commands from script, or from stdin when no script is given.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Configuration file\n";
    std::cout << "  -datadir=DIR               Persist state in a LevelDB database under DIR\n";
    std::cout << "                             (default: in-memory state)\n";
    std::cout << "  -stoponerror               Stop at the first failing command\n";
    std::cout << "\nLedger Options:\n";
    std::cout << "  -transferfeebps=N          Transfer fee in basis points (default: 100)\n";
    std::cout << "  -burnratio=N               Burn share of fees in percent (default: 50)\n";
    std::cout << "  -rewardsratio=N            Rewards share of fees in percent (default: 25)\n";
    std::cout << "  -devratio=N                Dev share of fees in percent (default: 25)\n";
    std::cout << "  -devwallet=ADDR            Dev fee recipient\n";
    std::cout << "  -feeexempt=ADDR            Fee exempt account (can repeat)\n";
    std::cout << "  -rewardrate=N              Reward rate per second per unit, scaled by 1e18\n";
    std::cout << "  -minstakingduration=N      Seconds before unstaking is fee free\n";
    std::cout << "  -earlyunstakefeebps=N      Early unstake fee in basis points (default: 500)\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  -debug=CATEGORY            Log only these categories (can repeat)\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error (default: warn)\n";
    std::cout << "  -logfile=FILE              Also write the log to FILE\n";
    std::cout << "  -printtoconsole=0/1        Log to the console (default: 1)\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 TOKENLEDGER Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Logging Setup
// ============================================================================

bool SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    logger.SetLevel(level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (auto logFile = config.TryGetString(util::ConfigKeys::LOGFILE)) {
        auto fileSink = std::make_shared<util::FileSink>(*logFile, util::LogLevel::Debug);
        if (!fileSink->IsOpen()) {
            std::cerr << "Error: Cannot open log file: " << *logFile << "\n";
            return false;
        }
        logger.AddSink(fileSink);
        if (level > util::LogLevel::Debug) {
            logger.SetLevel(util::LogLevel::Debug);
        }
    }

    for (const auto& category : config.GetList(util::ConfigKeys::DEBUG)) {
        logger.EnableCategory(category);
    }
    return true;
}

// ============================================================================
// State Setup
// ============================================================================

std::unique_ptr<db::Database> OpenState(const util::ConfigManager& config) {
    auto dataDir = config.TryGetString(util::ConfigKeys::DATADIR);
    if (!dataDir) {
        LOG_INFO(util::LogCategory::DB) << "Using in-memory state";
        return std::make_unique<db::MemoryDatabase>();
    }

    auto [status, database] = db::OpenDatabase(*dataDir);
    if (!status.ok()) {
        std::cerr << "Error: Cannot open state in " << *dataDir << ": "
                  << status.ToString() << "\n";
        return nullptr;
    }
    return std::move(database);
}

// ============================================================================
// Script Runner
// ============================================================================

class ScriptRunner {
public:
    ScriptRunner(ledger::Ledger& ledger, ledger::PauseSwitch& pause, bool stopOnError)
        : ledger_(ledger), pause_(pause), stopOnError_(stopOnError) {}

    /// Execute every line; false when a line could not be run
    bool Run(std::istream& input);

    size_t Failures() const { return failures_; }
    size_t Commands() const { return commands_; }

private:
    using Args = std::vector<std::string>;

    bool Dispatch(const Args& args, Status* result);

    bool ResolveAccount(const std::string& token, Address* account) const;
    bool ParseUInt(const std::string& token, uint64_t* value) const;
    bool ParseInt(const std::string& token, int64_t* value) const;
    static std::set<std::string> ParseCapabilities(const Args& args, size_t index);

    ledger::CallContext Context() const { return ledger::CallContext(caller_, now_); }

    ledger::Ledger& ledger_;
    ledger::PauseSwitch& pause_;
    bool stopOnError_;

    Address caller_;
    Timestamp now_{0};
    size_t failures_{0};
    size_t commands_{0};
};

bool ScriptRunner::ResolveAccount(const std::string& token, Address* account) const {
    if (token == "@staking") {
        *account = StakingPoolAddress();
        return true;
    }
    if (token == "@rewards") {
        *account = RewardPoolAddress();
        return true;
    }
    if (token == "@escrow") {
        *account = VestingEscrowAddress();
        return true;
    }

    std::string digits = token;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.size() == Address::SIZE * 2) {
        return ledger::ParseAddress(token, account).ok();
    }

    Hash256 digest = SHA256Hash("tokenledger-sim:" + token);
    *account = Address(digest.data(), Address::SIZE);
    return true;
}

bool ScriptRunner::ParseUInt(const std::string& token, uint64_t* value) const {
    if (token.empty() || token[0] == '-' || token[0] == '+') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(token.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    *value = parsed;
    return true;
}

bool ScriptRunner::ParseInt(const std::string& token, int64_t* value) const {
    if (token.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(token.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    *value = parsed;
    return true;
}

std::set<std::string> ScriptRunner::ParseCapabilities(const Args& args, size_t index) {
    std::set<std::string> caps;
    if (index >= args.size()) {
        return caps;
    }
    std::stringstream ss(args[index]);
    std::string flag;
    while (std::getline(ss, flag, ',')) {
        if (!flag.empty()) {
            caps.insert(flag);
        }
    }
    return caps;
}

bool ScriptRunner::Run(std::istream& input) {
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(input, line)) {
        ++lineNumber;

        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }

        Args args;
        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token) {
            args.push_back(token);
        }
        if (args.empty()) {
            continue;
        }

        Status result;
        if (!Dispatch(args, &result)) {
            std::cerr << "line " << lineNumber << ": cannot parse '"
                      << util::ConfigManager::Trim(line) << "'\n";
            return false;
        }

        ++commands_;
        if (!result.ok()) {
            ++failures_;
            std::cout << "line " << lineNumber << ": " << args[0]
                      << " failed: " << result.ToString() << "\n";
            if (stopOnError_) {
                return true;
            }
        }
    }
    return true;
}

bool ScriptRunner::Dispatch(const Args& args, Status* result) {
    const std::string& cmd = args[0];
    const size_t n = args.size();
    Address a;
    Address b;
    uint64_t x = 0;
    uint64_t y = 0;
    uint64_t z = 0;

    *result = Status::Ok();

    // Session
    if (cmd == "time" && n == 2) {
        return ParseInt(args[1], &now_);
    }
    if (cmd == "as" && n == 2) {
        return ResolveAccount(args[1], &caller_);
    }
    if (cmd == "pause" && n == 2 && ParseUInt(args[1], &x)) {
        pause_.SetPaused(x != 0);
        return true;
    }

    // Tokens
    if (cmd == "mint" && n == 3 && ResolveAccount(args[1], &a) && ParseUInt(args[2], &x)) {
        *result = ledger_.Mint(Context(), a, x);
        return true;
    }
    if (cmd == "burn" && n == 2 && ParseUInt(args[1], &x)) {
        *result = ledger_.Burn(Context(), x);
        return true;
    }
    if (cmd == "transfer" && n == 3 && ResolveAccount(args[1], &a) && ParseUInt(args[2], &x)) {
        *result = ledger_.Transfer(Context(), a, x);
        return true;
    }
    if (cmd == "approve" && n == 3 && ResolveAccount(args[1], &a) && ParseUInt(args[2], &x)) {
        *result = ledger_.Approve(Context(), a, x);
        return true;
    }
    if (cmd == "transferfrom" && n == 4 && ResolveAccount(args[1], &a) &&
        ResolveAccount(args[2], &b) && ParseUInt(args[3], &x)) {
        *result = ledger_.TransferFrom(Context(), a, b, x);
        return true;
    }
    if (cmd == "fund" && n == 2 && ParseUInt(args[1], &x)) {
        *result = ledger_.FundRewardPool(Context(), x);
        return true;
    }

    // Staking
    if (cmd == "stake" && n == 2 && ParseUInt(args[1], &x)) {
        *result = ledger_.Stake(Context(), x);
        return true;
    }
    if (cmd == "unstake" && n == 2 && ParseUInt(args[1], &x)) {
        *result = ledger_.Unstake(Context(), x);
        return true;
    }
    if (cmd == "claim" && n == 1) {
        *result = ledger_.Claim(Context());
        return true;
    }

    // Vesting
    if (cmd == "vest" && (n == 6 || n == 7) && ResolveAccount(args[1], &a) &&
        ParseUInt(args[2], &x)) {
        int64_t start = 0;
        int64_t cliff = 0;
        int64_t duration = 0;
        if (!ParseInt(args[3], &start) || !ParseInt(args[4], &cliff) ||
            !ParseInt(args[5], &duration)) {
            return false;
        }
        bool revocable = n == 7 && args[6] != "0";
        *result = ledger_.CreateVestingSchedule(Context(), a, x, start, cliff, duration, revocable);
        return true;
    }
    if (cmd == "release" && n == 1) {
        *result = ledger_.Release(Context());
        return true;
    }
    if (cmd == "revoke" && n == 2 && ResolveAccount(args[1], &a)) {
        *result = ledger_.Revoke(Context(), a);
        return true;
    }

    // Administration
    if (cmd == "addtier" && (n == 4 || n == 5) && ParseUInt(args[2], &x) && ParseUInt(args[3], &y)) {
        *result = ledger_.AddTier(Context(), staking::Tier(args[1], x, y, ParseCapabilities(args, 4)));
        return true;
    }
    if (cmd == "updatetier" && (n == 5 || n == 6) && ParseUInt(args[1], &z) &&
        ParseUInt(args[3], &x) && ParseUInt(args[4], &y)) {
        *result = ledger_.UpdateTier(Context(), static_cast<size_t>(z),
                                     staking::Tier(args[2], x, y, ParseCapabilities(args, 5)));
        return true;
    }
    if (cmd == "setrate" && n == 2 && ParseUInt(args[1], &x)) {
        *result = ledger_.SetRewardRate(Context(), x);
        return true;
    }
    if (cmd == "setminduration" && n == 2) {
        int64_t duration = 0;
        if (!ParseInt(args[1], &duration)) {
            return false;
        }
        *result = ledger_.SetMinStakingDuration(Context(), duration);
        return true;
    }
    if (cmd == "setearlyfee" && n == 2 && ParseUInt(args[1], &x)) {
        *result = ledger_.SetEarlyUnstakeFee(Context(), x);
        return true;
    }
    if (cmd == "setfee" && n == 2 && ParseUInt(args[1], &x)) {
        *result = ledger_.SetTransferFee(Context(), x);
        return true;
    }
    if (cmd == "setdistribution" && n == 4 && ParseUInt(args[1], &x) &&
        ParseUInt(args[2], &y) && ParseUInt(args[3], &z)) {
        if (x > PERCENT_DENOMINATOR || y > PERCENT_DENOMINATOR || z > PERCENT_DENOMINATOR) {
            *result = Status::InvalidRatio("ratio above 100");
            return true;
        }
        economics::FeeDistribution distribution;
        distribution.burnRatio = static_cast<uint32_t>(x);
        distribution.rewardsRatio = static_cast<uint32_t>(y);
        distribution.devRatio = static_cast<uint32_t>(z);
        *result = ledger_.SetFeeDistribution(Context(), distribution);
        return true;
    }
    if (cmd == "setdevwallet" && n == 2 && ResolveAccount(args[1], &a)) {
        *result = ledger_.SetDevWallet(Context(), a);
        return true;
    }
    if (cmd == "setexempt" && n == 3 && ResolveAccount(args[1], &a) && ParseUInt(args[2], &x)) {
        *result = ledger_.SetFeeExempt(Context(), a, x != 0);
        return true;
    }

    // Queries
    if (cmd == "balance" && n == 2 && ResolveAccount(args[1], &a)) {
        Amount balance = 0;
        *result = ledger_.GetBalance(a, &balance);
        if (result->ok()) {
            std::cout << "balance " << args[1] << " = " << balance << "\n";
        }
        return true;
    }
    if (cmd == "allowance" && n == 3 && ResolveAccount(args[1], &a) && ResolveAccount(args[2], &b)) {
        Amount allowance = 0;
        *result = ledger_.GetAllowance(a, b, &allowance);
        if (result->ok()) {
            std::cout << "allowance " << args[1] << " -> " << args[2] << " = " << allowance << "\n";
        }
        return true;
    }
    if (cmd == "staker" && n == 2 && ResolveAccount(args[1], &a)) {
        std::optional<staking::StakerInfo> info;
        *result = ledger_.GetStakerInfo(a, &info);
        if (result->ok()) {
            std::cout << "staker " << args[1] << " = "
                      << (info ? info->ToString() : std::string("none")) << "\n";
        }
        return true;
    }
    if (cmd == "pending" && n == 2 && ResolveAccount(args[1], &a)) {
        Amount pending = 0;
        *result = ledger_.GetPendingRewards(a, now_, &pending);
        if (result->ok()) {
            std::cout << "pending " << args[1] << " = " << pending << "\n";
        }
        return true;
    }
    if (cmd == "releasable" && n == 2 && ResolveAccount(args[1], &a)) {
        Amount releasable = 0;
        *result = ledger_.GetReleasable(a, now_, &releasable);
        if (result->ok()) {
            std::cout << "releasable " << args[1] << " = " << releasable << "\n";
        }
        return true;
    }
    if (cmd == "schedule" && n == 2 && ResolveAccount(args[1], &a)) {
        std::optional<vesting::VestingSchedule> schedule;
        *result = ledger_.GetSchedule(a, &schedule);
        if (result->ok()) {
            std::cout << "schedule " << args[1] << " = "
                      << (schedule ? schedule->ToString() : std::string("none")) << "\n";
        }
        return true;
    }
    if (cmd == "hascap" && n == 3 && ResolveAccount(args[1], &a)) {
        bool has = false;
        *result = ledger_.HasTierCapability(a, args[2], &has);
        if (result->ok()) {
            std::cout << "hascap " << args[1] << " " << args[2] << " = " << (has ? 1 : 0) << "\n";
        }
        return true;
    }
    if (cmd == "globals" && n == 1) {
        state::GlobalState globals;
        *result = ledger_.GetGlobalState(&globals);
        if (result->ok()) {
            std::cout << globals.ToString() << "\n";
        }
        return true;
    }
    if (cmd == "tiers" && n == 1) {
        staking::TierTable tiers;
        *result = ledger_.GetTiers(&tiers);
        if (result->ok()) {
            for (size_t i = 0; i < tiers.Size(); ++i) {
                std::cout << "tier " << i << " = " << tiers.GetTier(i)->ToString() << "\n";
            }
        }
        return true;
    }
    if (cmd == "hash" && n == 1) {
        std::cout << "hash = " << ledger_.GetStateHash().ToHex() << "\n";
        return true;
    }

    return false;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager args;
    util::ConfigParseResult parsed = args.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }

    if (args.GetBool("help", false) || args.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (args.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    // Config file first, command line overrides it
    util::ConfigManager config;
    ledger::RegisterLedgerConfigKeys(config);
    config.AllowKey("stoponerror");
    if (auto confPath = args.TryGetString(util::ConfigKeys::CONF)) {
        util::ConfigParseResult fileResult = config.ParseFile(*confPath);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.errorFile << ":" << fileResult.errorLine
                      << ": " << fileResult.errorMessage << "\n";
            return 1;
        }
    }
    parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }

    if (!SetupLogging(config)) {
        return 1;
    }

    for (const auto& warning : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    ledger::LedgerParams params;
    Status status = ledger::LoadLedgerConfig(config, &params);
    if (!status.ok()) {
        std::cerr << "Error: Invalid configuration: " << status.ToString() << "\n";
        return 1;
    }

    std::unique_ptr<db::Database> database = OpenState(config);
    if (!database) {
        return 1;
    }
    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION
                                         << " using " << database->Name();

    state::StateViewDB state(std::move(database));
    ledger::AllowAllAccessControl access;
    ledger::PauseSwitch pause;
    ledger::LogEventSink events;
    ledger::Ledger ledger(state, access, pause, &events);

    // Initialization runs at the last committed time so it never trips the clock check
    state::GlobalState current;
    status = ledger.GetGlobalState(&current);
    if (status.ok()) {
        status = ledger.Initialize(ledger::CallContext(Address(), current.lastTimestamp), params);
    }
    if (!status.ok()) {
        std::cerr << "Error: Cannot initialize ledger: " << status.ToString() << "\n";
        return 1;
    }

    ScriptRunner runner(ledger, pause, config.GetBool("stoponerror", false));
    bool completed = false;

    const auto& positionals = config.GetPositionals();
    if (positionals.empty()) {
        completed = runner.Run(std::cin);
    } else {
        std::ifstream script(positionals.front());
        if (!script) {
            std::cerr << "Error: Cannot open script: " << positionals.front() << "\n";
            return 1;
        }
        completed = runner.Run(script);
    }

    std::cout << runner.Commands() << " commands, " << runner.Failures() << " failed\n";
    std::cout << "state hash " << ledger.GetStateHash().ToHex() << "\n";

    util::Logger::Instance().Shutdown();
    return completed ? 0 : 1;
}

} // namespace tokenledger

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return tokenledger::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
