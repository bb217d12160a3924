// TALLY - Configuration
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Options for the tools, read from the command line and from a flat
// key=value file:
//
//     # comment (also ';')
//     address=ALiCEqZUF4VYuxTu1UQvzDqbpGYYFrxH6kQxWFB8Nqp3
//     fixture = "alternate"
//     lenient            (bare key means true)
//     noprinttoconsole   ("no" prefix means false)
//
// A value set on the command line is never replaced by one from a file.

#ifndef TALLY_UTIL_CONFIG_H
#define TALLY_UTIL_CONFIG_H

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <string>
#include <vector>

namespace tally {
namespace util {

// ============================================================================
// Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorSource;    // File path or "<command-line>"
    int errorLine{0};           // 0 when not tied to a line

    static ConfigParseResult Ok() { return {}; }

    static ConfigParseResult Fail(std::string message, std::string source, int line = 0) {
        return {false, std::move(message), std::move(source), line};
    }

    /// "source:line: message" or "ok"
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

class ConfigManager {
public:
    static constexpr const char* COMMAND_LINE = "<command-line>";
    static constexpr const char* DEFAULT_SOURCE = "<default>";

    /**
     * Parse "-key=value", "--key=value", "-key" (true) and "-nokey" (false).
     * argv[0] is skipped. Any argument not starting with '-' is an error.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Parse a key=value file; keys already set on the command line are kept
    ConfigParseResult ParseFile(const std::string& path);

    bool HasKey(const std::string& key) const;

    std::string GetString(const std::string& key, const std::string& fallback) const;

    /// true/false, 1/0, yes/no, on/off; anything else yields the fallback
    bool GetBool(const std::string& key, bool fallback) const;

    /// String value with a leading "~/" replaced by $HOME
    std::string GetPath(const std::string& key, const std::string& fallback = "") const;

    /// Store a value only if the key has none
    void SetDefault(const std::string& key, const std::string& value);

    /// Declare a known key; once any is declared, Validate reports the rest
    void AllowKey(const std::string& key);

    /// One "Unknown option: key (source)" line per undeclared key
    std::vector<std::string> Validate() const;

private:
    struct Value {
        std::string text;
        std::string source;
    };

    /// Split "key=value", "key" and "nokey" into a key and value
    static bool SplitOption(const std::string& option, std::string& key, std::string& value);
    static bool IsKeyName(const std::string& key);

    std::map<std::string, Value> values_;
    std::set<std::string> allowed_;
};

// ============================================================================
// Option Names
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* ADDRESS = "address";
    constexpr const char* FIXTURE = "fixture";
    constexpr const char* LENIENT = "lenient";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUGLOGFILE = "debuglogfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* HELP = "help";
    constexpr const char* VERSION = "version";
}

} // namespace util
} // namespace tally

#endif // TALLY_UTIL_CONFIG_H
