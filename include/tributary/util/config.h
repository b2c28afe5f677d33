// TRIBUTARY - Configuration File Parser
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License
//
// Parses INI-style configuration for the ledger and the simulator.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - Amount values accept exponent notation: 1.5e18

#ifndef TRIBUTARY_UTIL_CONFIG_H
#define TRIBUTARY_UTIL_CONFIG_H

#include "tributary/core/types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tributary {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "tributary.conf";

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or origin of the value
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message" for diagnostics
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files, strings and command-line arguments.
 *
 * Later sources overwrite earlier ones; defaults registered with
 * SetDefault() never overwrite a value that is already present.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Apply a single "key=value" override (e.g. from the command line).
     * "section.key=value" targets a section; a bare "key" sets true.
     * Overrides always replace existing values.
     */
    ConfigParseResult ParseOverride(const std::string& assignment,
                                    const std::string& source = "<command-line>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& defaultValue,
                          const std::string& section = "") const;

    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Get a 256-bit token amount (see ParseAmount for accepted syntax)
    std::optional<Amount> TryGetAmount(const std::string& key,
                                       const std::string& section = "") const;

    /// Get a duration in seconds. Accepts suffixes s, m, h, d, w.
    std::optional<int64_t> TryGetDuration(const std::string& key,
                                          const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if none is present
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    void RequireKey(const std::string& key, const std::string& section = "");
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Report missing required keys and, if any keys were allowed, unknown ones
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    static std::string ExpandEnvVars(const std::string& value);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseLines(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool isDefault);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
};

/// Parse "90", "30s", "15m", "1h", "7d" or "2w" into seconds
std::optional<int64_t> ParseDuration(const std::string& str);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigSections {
    constexpr const char* PROTOCOL = "protocol";
    constexpr const char* SIM = "sim";
}

namespace ConfigKeys {
    // General
    constexpr const char* NETWORK = "network";          // main | regtest
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* LOGCATEGORIES = "logcategories";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    // [protocol]
    constexpr const char* EPOCH_DURATION = "epochduration";
    constexpr const char* REWARD_DURATION = "rewardduration";
    constexpr const char* MAX_BRIBE_SPLIT = "maxbribesplit";
    constexpr const char* BRIBE_SPLIT = "bribesplit";
    constexpr const char* MIN_EPOCH_PERIOD = "minepochperiod";
    constexpr const char* MAX_EPOCH_PERIOD = "maxepochperiod";
    constexpr const char* MIN_PRICE_MULTIPLIER = "minpricemultiplier";
    constexpr const char* MAX_PRICE_MULTIPLIER = "maxpricemultiplier";
    constexpr const char* ABS_MIN_INIT_PRICE = "absmininitprice";
    constexpr const char* BRIBE_DUST_POLICY = "bribedustpolicy";

    // [sim]
    constexpr const char* START_TIME = "starttime";
    constexpr const char* SCRIPT = "script";
}

} // namespace util
} // namespace tributary

#endif // TRIBUTARY_UTIL_CONFIG_H
