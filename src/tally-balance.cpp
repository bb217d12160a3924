// TALLY Balance Tool
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Command-line demonstration of the balance calculator. Builds a fixed set
// of example transactions and prints the balance of one wallet.
//
// A failed calculation is reported on stderr and still exits 0. A bad
// command line, an unreadable configuration file or an unknown fixture
// exits 1.

#include <tally/core/transaction.h>
#include <tally/util/config.h>
#include <tally/util/logging.h>
#include <tally/wallet/balance.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace tally;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* ALICE = "ALiCEqZUF4VYuxTu1UQvzDqbpGYYFrxH6kQxWFB8Nqp3";
constexpr const char* BOB = "BOBqZUF4VYuxTu1UQvzDqbpGYYFrxH6kQxWFB8Nqp3";

// ============================================================================
// Example Transactions
// ============================================================================

/// Alice: +100 -50 +<last>, Bob: +200 -75
std::vector<Transaction> MakeFixture(Amount lastDeposit) {
    return {
        Transaction::Deposit(ALICE, 100),
        Transaction::Withdrawal(ALICE, 50),
        Transaction::Deposit(BOB, 200),
        Transaction::Withdrawal(BOB, 75),
        Transaction::Deposit(ALICE, lastDeposit),
    };
}

bool LoadFixture(const std::string& name, std::vector<Transaction>& out) {
    if (name == "standard") {
        out = MakeFixture(25);
        return true;
    }
    if (name == "alternate") {
        out = MakeFixture(150);
        return true;
    }
    return false;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "TALLY Balance Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: tally-balance [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -address=<addr>      Wallet to query (default: " << ALICE << ")\n";
    std::cout << "  -fixture=<name>      Example transactions: standard, alternate\n";
    std::cout << "  -lenient             Sum without validation\n";
    std::cout << "  -conf=<file>         Read options from a config file\n";
    std::cout << "  -loglevel=<level>    trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  -debuglogfile=<file> Also write logs to a file\n";
    std::cout << "  -printtoconsole=0/1  Log to the console (default: 1)\n";
    std::cout << "  -help                Show this help message\n";
    std::cout << "  -version             Show version\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "TALLY Balance Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 TALLY Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Initialization
// ============================================================================

bool LoadConfiguration(int argc, char* argv[], util::ConfigManager& config) {
    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }

    if (config.HasKey(util::ConfigKeys::CONF)) {
        result = config.ParseFile(config.GetPath(util::ConfigKeys::CONF));
        if (!result.success) {
            std::cerr << "Error reading config file: " << result.ToString() << "\n";
            return false;
        }
    }

    config.SetDefault(util::ConfigKeys::ADDRESS, ALICE);
    config.SetDefault(util::ConfigKeys::FIXTURE, "standard");
    config.SetDefault(util::ConfigKeys::LOGLEVEL, "warn");
    return true;
}

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    std::string levelName = config.GetString(util::ConfigKeys::LOGLEVEL, "warn");
    auto level = util::ParseLogLevel(levelName);
    logger.SetLevel(level.value_or(util::LogLevel::Warn));

    // Console logs go to stderr; stdout carries only the result
    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        logger.AddSink(std::make_shared<util::ConsoleSink>(std::cerr, util::LogLevel::Trace));
    }

    std::string logPath = config.GetPath(util::ConfigKeys::DEBUGLOGFILE);
    if (!logPath.empty()) {
        auto fileSink = std::make_shared<util::FileSink>(logPath, util::LogLevel::Trace);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            LOG_WARN(util::LogCategory::DEFAULT) << "Cannot open log file: " << logPath;
        }
    }

    if (!level) {
        LOG_WARN(util::LogCategory::CONFIG)
            << "Unknown log level '" << levelName << "', using warn";
    }
}

void WarnUnknownKeys(util::ConfigManager& config) {
    for (const char* key : {util::ConfigKeys::CONF, util::ConfigKeys::ADDRESS,
                            util::ConfigKeys::FIXTURE, util::ConfigKeys::LENIENT,
                            util::ConfigKeys::LOGLEVEL, util::ConfigKeys::DEBUGLOGFILE,
                            util::ConfigKeys::PRINTTOCONSOLE, util::ConfigKeys::HELP,
                            util::ConfigKeys::VERSION}) {
        config.AllowKey(key);
    }
    for (const auto& problem : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << problem;
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfiguration(argc, argv, config)) {
        return 1;
    }

    if (config.GetBool(util::ConfigKeys::HELP, false) || config.HasKey("h")) {
        PrintUsage();
        return 0;
    }
    if (config.GetBool(util::ConfigKeys::VERSION, false)) {
        PrintVersion();
        return 0;
    }

    SetupLogging(config);
    WarnUnknownKeys(config);

    std::string fixture = config.GetString(util::ConfigKeys::FIXTURE, "standard");
    std::vector<Transaction> transactions;
    if (!LoadFixture(fixture, transactions)) {
        std::cerr << "Error: unknown fixture '" << fixture << "'\n";
        return 1;
    }

    std::string address = config.GetString(util::ConfigKeys::ADDRESS, ALICE);
    LOG_DEBUG(util::LogCategory::DEFAULT)
        << "Querying " << address << " over " << transactions.size()
        << " transactions (" << fixture << ")";

    if (config.GetBool(util::ConfigKeys::LENIENT, false)) {
        Amount sum = wallet::SumForWallet(address, transactions);
        std::cout << "Balance for " << address << ": " << sum << "\n";
    } else {
        auto result = wallet::CalculateBalance(address, transactions);
        if (result.IsOk()) {
            std::cout << "Balance for " << address << ": " << result.GetBalance() << "\n";
        } else {
            std::cerr << "Error calculating balance: "
                      << wallet::BalanceErrorToString(result.GetError()) << "\n";
        }
    }

    util::Logger::Instance().Flush();
    return 0;
}
