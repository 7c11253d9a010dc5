// DELAYPAY - Configuration File Parser
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// Parses INI-style configuration files and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]; keys inside become "section.key"
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - Repeated keys accumulate into a list (see GetList)

#ifndef DELAYPAY_UTIL_CONFIG_H
#define DELAYPAY_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace delaypay {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".delaypay";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "delaypay.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string source;    // File path, "<command-line>", "<default>", ...
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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Manages configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line options (-key=value)
 * 2. Data directory config file (<datadir>/delaypay.conf)
 * 3. Built-in defaults
 *
 * Within one file the first assignment of a key wins for scalar lookups;
 * every assignment is kept for GetList.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and ${VAR} are expanded)
     * @param overwrite If true, replace values that are already set
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /// Parse configuration text; sourceName is used in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments.
     *
     * Options take the form -key=value, --key=value, -key (true) or
     * -nokey (false). Every other argument is kept in order as a
     * positional argument, see GetArgs().
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Positional (non-option) command-line arguments
    const std::vector<std::string>& GetArgs() const { return args_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; a k/m/g suffix multiplies by 1024^n
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Like TryGetInt but rejects negative values
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Every value given for key, in order; comma-separated values are split
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Get path value (with ~ and ${VAR} expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically (overwrites)
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if the key is not present yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();

    size_t Size() const { return entries_.size(); }

    /// Data directory: the datadir key if set, else the default
    std::string GetDataDir() const;

    /// $HOME/.delaypay
    static std::string GetDefaultDataDir();

    /// Expand ${VAR} and $VAR; unset variables expand to nothing
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand a leading ~ to the home directory
    static std::string ExpandTilde(const std::string& path);

    /// Dump all configuration to string
    std::string Dump() const;

private:
    /// "section.key", or "key" in the global section
    static std::string MakeKey(const std::string& key, const std::string& section);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, bool overwrite,
                   ConfigParseResult& result);

    void Store(const std::string& fullKey, const std::string& value,
               const std::string& source, int lineNum, bool overwrite);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;
    std::vector<std::string> args_;
};

// ============================================================================
// Global Configuration
// ============================================================================

/// Get global configuration manager
ConfigManager& GetConfig();

/**
 * Initialize a configuration from the command line.
 *
 * Parses the command line, then <datadir>/<conf> if it exists. A missing
 * config file is not an error unless -conf was given explicitly.
 */
ConfigParseResult InitConfig(ConfigManager& config, int argc, const char* const argv[]);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LEDGER_BACKEND = "ledger.backend";
    constexpr const char* LEDGER_DBCACHE = "ledger.dbcache";
    constexpr const char* ADMIN = "admin";
    constexpr const char* PAYOUT_JOURNAL = "payout.journal";
    constexpr const char* BATCH_MAXAMOUNT = "batch.maxamount";
}

// ============================================================================
// Settings
// ============================================================================

/// Typed view of the configuration keys, paths resolved against dataDir
struct Settings {
    std::string dataDir;
    std::string logLevel{"info"};
    std::string logFile;
    bool printToConsole{true};
    std::string ledgerBackend{"leveldb"};
    uint64_t dbCacheMiB{8};
    std::vector<std::string> admins;
    std::string payoutJournal;
    uint64_t maxAmount{0};

    /// Directory of the ledger database
    std::string LedgerPath() const;

    static Settings FromConfig(const ConfigManager& config);
};

/// Resolve a path relative to base; absolute paths are returned unchanged
std::string ResolvePath(const std::string& base, const std::string& path);

} // namespace util
} // namespace delaypay

#endif // DELAYPAY_UTIL_CONFIG_H
