// TRIBUTARY - Scenario Simulator
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Runs a scenario script against an in-memory ledger deployment.

#include "tributary/protocol/params.h"
#include "tributary/sim/scenario.h"
#include "tributary/util/config.h"
#include "tributary/util/logging.h"
#include "tributary/util/time.h"

#include <getopt.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace tributary {

// ============================================================================
// Options
// ============================================================================

struct SimOptions {
    std::string configFile;
    std::string scriptFile;
    std::string logLevel;
    std::vector<std::string> overrides;
    bool keepGoing{false};
};

void PrintHelp() {
    std::cout << "TRIBUTARY Scenario Simulator\n\n";
    std::cout << "Usage: tributary-sim [options] [script]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -c, --conf=FILE            Config file path\n";
    std::cout << "  -s, --script=FILE          Scenario script (default: stdin)\n";
    std::cout << "  -l, --loglevel=LEVEL       Log level: trace, debug, info, warn, error\n";
    std::cout << "  -o, --set=SECTION.KEY=VAL  Override a config value (can repeat)\n";
    std::cout << "  -k, --keep-going           Continue after a failing command\n";
    std::cout << "\nConfig keys ([protocol] section):\n";
    std::cout << "  epochduration, rewardduration, maxbribesplit, bribesplit,\n";
    std::cout << "  minepochperiod, maxepochperiod, minpricemultiplier,\n";
    std::cout << "  maxpricemultiplier, absmininitprice, bribedustpolicy\n";
    std::cout << "\n";
}

bool ParseCommandLine(int argc, char* argv[], SimOptions& options) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"conf", required_argument, nullptr, 'c'},
        {"script", required_argument, nullptr, 's'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"set", required_argument, nullptr, 'o'},
        {"keep-going", no_argument, nullptr, 'k'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hc:s:l:o:k", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                PrintHelp();
                return false;
            case 'c':
                options.configFile = optarg;
                break;
            case 's':
                options.scriptFile = optarg;
                break;
            case 'l':
                options.logLevel = optarg;
                break;
            case 'o':
                options.overrides.push_back(optarg);
                break;
            case 'k':
                options.keepGoing = true;
                break;
            default:
                std::cerr << "Error parsing command line. Use --help for usage.\n";
                return false;
        }
    }
    if (optind < argc && options.scriptFile.empty()) {
        options.scriptFile = argv[optind];
    }
    return true;
}

// ============================================================================
// Setup
// ============================================================================

void SetupLogging(const util::ConfigManager& config, const SimOptions& options) {
    namespace Keys = util::ConfigKeys;
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    std::string levelName = options.logLevel.empty()
        ? config.GetString(Keys::LOGLEVEL, "warn")
        : options.logLevel;
    util::LogLevel level = util::LogLevelFromString(levelName);
    logger.SetLevel(level);

    if (config.GetBool(Keys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useStderr = true;
        consoleConfig.showTimestamp = false;
        consoleConfig.showLedgerTime = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetString(Keys::LOGFILE, "");
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = util::LogLevel::Debug;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: Cannot open log file " << logFile << "\n";
        }
    }

    std::string categories = config.GetString(Keys::LOGCATEGORIES, "");
    if (!categories.empty()) {
        std::istringstream iss(categories);
        std::string cat;
        while (std::getline(iss, cat, ',')) {
            if (!cat.empty()) {
                logger.EnableCategory(cat);
            }
        }
    }
}

bool LoadConfig(const SimOptions& options, util::ConfigManager& config) {
    namespace Keys = util::ConfigKeys;

    if (!options.configFile.empty()) {
        util::ConfigParseResult parsed = config.ParseFile(options.configFile);
        if (!parsed.success) {
            std::cerr << "Error: " << parsed.ToString() << "\n";
            return false;
        }
    }
    for (const auto& assignment : options.overrides) {
        util::ConfigParseResult parsed = config.ParseOverride(assignment);
        if (!parsed.success) {
            std::cerr << "Error: " << parsed.ToString() << "\n";
            return false;
        }
    }

    for (const char* key : {Keys::NETWORK, Keys::LOGLEVEL, Keys::LOGFILE,
                            Keys::LOGCATEGORIES, Keys::PRINTTOCONSOLE}) {
        config.AllowKey(key);
    }
    config.AllowKey(Keys::START_TIME, util::ConfigSections::SIM);
    config.AllowKey(Keys::SCRIPT, util::ConfigSections::SIM);
    protocol::AllowProtocolKeys(config);

    for (const auto& problem : config.Validate()) {
        std::cerr << "Warning: " << problem << "\n";
    }
    return true;
}

// ============================================================================
// Main
// ============================================================================

int AppMain(int argc, char* argv[]) {
    namespace Keys = util::ConfigKeys;

    SimOptions options;
    if (!ParseCommandLine(argc, argv, options)) {
        return 0;
    }

    util::ConfigManager config;
    if (!LoadConfig(options, config)) {
        return 1;
    }
    SetupLogging(config, options);

    protocol::Params params;
    util::ConfigParseResult loaded = protocol::LoadParams(config, params);
    if (!loaded.success) {
        std::cerr << "Error: " << loaded.ToString() << "\n";
        return 1;
    }

    int64_t startTime = config.GetInt(Keys::START_TIME, util::ToUnixTime(util::GetSystemTime()),
                                      util::ConfigSections::SIM);

    std::string scriptFile = options.scriptFile;
    if (scriptFile.empty()) {
        scriptFile = config.GetString(Keys::SCRIPT, "", util::ConfigSections::SIM);
    }

    sim::Scenario scenario(params, startTime);

    sim::ScriptResult result;
    if (scriptFile.empty() || scriptFile == "-") {
        result = scenario.Run(std::cin, std::cout, !options.keepGoing);
    } else {
        std::ifstream in(scriptFile);
        if (!in) {
            std::cerr << "Error: Cannot open script " << scriptFile << "\n";
            return 1;
        }
        result = scenario.Run(in, std::cout, !options.keepGoing);
    }

    util::Logger::Instance().Flush();
    if (!result.success) {
        std::cerr << "Scenario failed at line " << result.failedLine << ": "
                  << result.error << "\n";
        return 2;
    }
    std::cout << result.commands << " commands executed\n";
    return 0;
}

} // namespace tributary

int main(int argc, char* argv[]) {
    try {
        return tributary::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
