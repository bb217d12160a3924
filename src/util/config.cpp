// TALLY - Configuration Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tally {
namespace util {

namespace {

std::string Trim(const std::string& text) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), notSpace);
    auto end = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

/// Strip one pair of matching outer quotes
std::string StripQuotes(const std::string& text) {
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
        text.back() == text.front()) {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

std::string Lower(const std::string& text) {
    std::string out(text.size(), '\0');
    std::transform(text.begin(), text.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
    }
    std::ostringstream oss;
    oss << errorSource;
    if (errorLine > 0) {
        oss << ':' << errorLine;
    }
    oss << ": " << errorMessage;
    return oss.str();
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::IsKeyName(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

bool ConfigManager::SplitOption(const std::string& option, std::string& key,
                                std::string& value) {
    size_t eq = option.find('=');
    if (eq != std::string::npos) {
        key = Trim(option.substr(0, eq));
        value = StripQuotes(Trim(option.substr(eq + 1)));
    } else if (option.size() > 2 && option.compare(0, 2, "no") == 0 &&
               std::islower(static_cast<unsigned char>(option[2]))) {
        key = option.substr(2);
        value = "false";
    } else {
        key = option;
        value = "true";
    }
    return IsKeyName(key);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        size_t dashes = arg.find_first_not_of('-');
        if (dashes == 0 || dashes > 2 || dashes == std::string::npos) {
            return ConfigParseResult::Fail("Unexpected argument: " + arg, COMMAND_LINE);
        }

        std::string key;
        std::string value;
        if (!SplitOption(arg.substr(dashes), key, value)) {
            return ConfigParseResult::Fail("Invalid option: " + arg, COMMAND_LINE);
        }
        values_[key] = Value{value, COMMAND_LINE};
    }
    return ConfigParseResult::Ok();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Fail("Cannot open config file", path);
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        std::string option = Trim(line);
        if (option.empty() || option[0] == '#' || option[0] == ';') {
            continue;
        }

        std::string key;
        std::string value;
        if (!SplitOption(option, key, value)) {
            return ConfigParseResult::Fail("Invalid option: " + option, path, lineNumber);
        }

        auto it = values_.find(key);
        if (it != values_.end() && it->second.source == COMMAND_LINE) {
            continue;
        }
        values_[key] = Value{value, path + ":" + std::to_string(lineNumber)};
    }
    return ConfigParseResult::Ok();
}

// ============================================================================
// Access
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return values_.count(key) != 0;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& fallback) const {
    auto it = values_.find(key);
    return it == values_.end() ? fallback : it->second.text;
}

bool ConfigManager::GetBool(const std::string& key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    std::string text = Lower(it->second.text);
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        return false;
    }
    return fallback;
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& fallback) const {
    std::string path = GetString(key, fallback);
    if (path == "~" || path.compare(0, 2, "~/") == 0) {
        if (const char* home = std::getenv("HOME")) {
            path.replace(0, 1, home);
        }
    }
    return path;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    values_.emplace(key, Value{value, DEFAULT_SOURCE});
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key) {
    allowed_.insert(key);
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> problems;
    if (allowed_.empty()) {
        return problems;
    }
    for (const auto& [key, value] : values_) {
        if (allowed_.count(key) == 0) {
            problems.push_back("Unknown option: " + key + " (" + value.source + ")");
        }
    }
    return problems;
}

} // namespace util
} // namespace tally
