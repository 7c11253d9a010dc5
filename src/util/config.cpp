// DELAYPAY - Configuration File Parser Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace delaypay {
namespace util {

// ============================================================================
// ConfigManager Implementation
// ============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.size() < 2) {
        return str;
    }

    char quote = str.front();
    if ((quote != '"' && quote != '\'') || str.back() != quote) {
        return str;
    }

    std::string inner = str.substr(1, str.size() - 2);
    if (quote == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.size()) {
            char next = inner[++i];
            switch (next) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case '\\': out += '\\'; break;
                case '"': out += '"'; break;
                default: out += '\\'; out += next; break;
            }
        } else {
            out += inner[i];
        }
    }
    return out;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size()) {
            size_t nameStart;
            size_t nameEnd;
            size_t next;
            if (value[i + 1] == '{') {
                nameStart = i + 2;
                nameEnd = value.find('}', nameStart);
                if (nameEnd == std::string::npos) {
                    result += value.substr(i);
                    break;
                }
                next = nameEnd + 1;
            } else {
                nameStart = i + 1;
                nameEnd = nameStart;
                while (nameEnd < value.size() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                next = nameEnd;
            }

            if (nameEnd > nameStart) {
                std::string name = value.substr(nameStart, nameEnd - nameStart);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = next;
                continue;
            }
        }
        result += value[i++];
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& fullKey, const std::string& value,
                          const std::string& source, int lineNum, bool overwrite) {
    lists_[fullKey].push_back(value);

    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault && !overwrite) {
        return;
    }

    ConfigEntry entry;
    entry.key = fullKey;
    entry.value = value;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[fullKey] = entry;
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              bool overwrite, ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        if (!currentSection.empty() && !IsValidKey(currentSection)) {
            result = ConfigParseResult::Error(
                "Invalid section name: " + currentSection, source, lineNum);
            return false;
        }
        return true;
    }

    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag: "key" is true, "nokey" is false
        key = trimmed;
        value = "true";
        if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }

    Store(MakeKey(key, currentSection), value, source, lineNum, overwrite);
    return true;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path, path);
    }

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return ParseString(content.str(), path, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();
    while (std::getline(stream, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, overwrite, result)) {
            return result;
        }
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.size() < 2 || arg[0] != '-') {
            args_.push_back(arg);
            continue;
        }

        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            return ConfigParseResult::Error("Invalid option: " + arg, "<command-line>");
        }
        arg = arg.substr(start);

        std::string key;
        std::string value;
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            key = arg;
            value = "true";
            if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(key[2]))) {
                key = key.substr(2);
                value = "false";
            }
        }

        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option: -" + arg, "<command-line>");
        }
        Store(key, value, "<command-line>", 0, true);
    }
    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) != 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }

    int64_t value;
    size_t pos;
    try {
        value = std::stoll(*str, &pos);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    std::string suffix = Trim(str->substr(pos));
    if (suffix.empty()) {
        return value;
    }
    if (suffix.size() != 1) {
        return std::nullopt;
    }
    switch (std::tolower(static_cast<unsigned char>(suffix[0]))) {
        case 'k': return value * 1024;
        case 'm': return value * 1024 * 1024;
        case 'g': return value * 1024LL * 1024 * 1024;
        default:  return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto value = TryGetInt(key, section);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::string fullKey = MakeKey(key, section);
    std::vector<std::string> raw;

    auto listIt = lists_.find(fullKey);
    if (listIt != lists_.end()) {
        raw = listIt->second;
    } else if (auto value = TryGetString(key, section)) {
        raw.push_back(*value);
    }

    std::vector<std::string> result;
    for (const std::string& value : raw) {
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    }
    return result;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    lists_.erase(fullKey);
    Store(fullKey, value, "<programmatic>", 0, true);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.count(fullKey)) {
        return;
    }

    ConfigEntry entry;
    entry.key = fullKey;
    entry.value = value;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = entry;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    args_.clear();
}

std::string ConfigManager::GetDataDir() const {
    std::string dir = GetPath(ConfigKeys::DATADIR);
    return dir.empty() ? GetDefaultDataDir() : dir;
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    oss << "# " << entries_.size() << " entries\n";
    for (const auto& kv : entries_) {
        const ConfigEntry& entry = kv.second;
        oss << entry.key << "=" << entry.value << "  # " << entry.source;
        if (entry.lineNumber > 0) {
            oss << ":" << entry.lineNumber;
        }
        oss << "\n";
    }
    return oss.str();
}

// ============================================================================
// Global Configuration
// ============================================================================

ConfigManager& GetConfig() {
    static ConfigManager config;
    return config;
}

ConfigParseResult InitConfig(ConfigManager& config, int argc, const char* const argv[]) {
    ConfigParseResult cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.success) {
        return cmdResult;
    }

    bool explicitConf = config.HasKey(ConfigKeys::CONF);
    std::string confPath = ResolvePath(config.GetDataDir(),
                                       config.GetPath(ConfigKeys::CONF, DEFAULT_CONFIG_FILENAME));

    std::ifstream probe(confPath);
    if (!probe.is_open()) {
        if (explicitConf) {
            return ConfigParseResult::Error("Cannot open file: " + confPath, confPath);
        }
        return ConfigParseResult::Success();
    }
    probe.close();

    // Values already set on the command line are kept
    return config.ParseFile(confPath, false);
}

// ============================================================================
// Settings
// ============================================================================

std::string ResolvePath(const std::string& base, const std::string& path) {
    if (path.empty() || path[0] == '/' || base.empty()) {
        return path;
    }
    if (base.back() == '/') {
        return base + path;
    }
    return base + "/" + path;
}

std::string Settings::LedgerPath() const {
    return ResolvePath(dataDir, "ledger");
}

Settings Settings::FromConfig(const ConfigManager& config) {
    Settings s;
    s.dataDir = config.GetDataDir();
    s.logLevel = config.GetString(ConfigKeys::LOGLEVEL, s.logLevel);
    s.logFile = ResolvePath(s.dataDir, config.GetPath(ConfigKeys::LOGFILE, "delaypay.log"));
    s.printToConsole = config.GetBool(ConfigKeys::PRINTTOCONSOLE, s.printToConsole);
    s.ledgerBackend = config.GetString(ConfigKeys::LEDGER_BACKEND, s.ledgerBackend);
    s.dbCacheMiB = config.GetUInt(ConfigKeys::LEDGER_DBCACHE, s.dbCacheMiB);
    s.admins = config.GetList(ConfigKeys::ADMIN);
    s.payoutJournal = ResolvePath(s.dataDir,
                                  config.GetPath(ConfigKeys::PAYOUT_JOURNAL, "payouts.journal"));
    s.maxAmount = config.GetUInt(ConfigKeys::BATCH_MAXAMOUNT, s.maxAmount);
    return s;
}

} // namespace util
} // namespace delaypay
