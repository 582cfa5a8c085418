// STRATA - Configuration File Parser
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// INI-style configuration:
//   # comment            ; comment
//   key=value            key="quoted value"
//   [section]            flag            noflag
// Integer values accept k/m/g suffixes (powers of 1024).

#ifndef STRATA_UTIL_CONFIG_H
#define STRATA_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace util {

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File or string name where this was defined
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        return {false, msg, source, line};
    }

    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration values keyed by (section, key).
 *
 * Values parsed from a file or string replace earlier parsed values and
 * always take precedence over SetDefault(). Lookups are thread-safe.
 */
class ConfigManager {
public:
    static constexpr size_t MAX_LINE_LENGTH = 4096;
    static constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

    ConfigManager() = default;

    ConfigParseResult ParseFile(const std::string& filePath);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt if missing or not an integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// nullopt if missing, not an integer, or negative
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    std::optional<double> TryGetDouble(const std::string& key,
                                       const std::string& section = "") const;
    double GetDouble(const std::string& key, double defaultValue,
                     const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only used when nothing else defines the key
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Introspection
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();
    size_t Size() const;

    /// One "section:key=value" line per entry
    std::string Dump() const;

    static std::optional<bool> ParseBool(const std::string& str);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    ConfigParseResult ParseStream(std::istream& in, const std::string& sourceName);

    std::map<std::string, ConfigEntry> entries_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* NETWORK = "network";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* INMEMORY = "inmemory";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    // Chain state
    constexpr const char* DBCACHE = "dbcache";
    constexpr const char* PAR = "par";
    constexpr const char* PARTHRESHOLD = "parthreshold";
    constexpr const char* MAXORPHANS = "maxorphans";
    constexpr const char* CHECKPOINTINTERVAL = "checkpointinterval";
    constexpr const char* COMMITMENTINTERVAL = "commitmentinterval";

    // Mempool
    constexpr const char* MAXMEMPOOL = "maxmempool";
    constexpr const char* MAXMEMPOOLTX = "maxmempooltx";
    constexpr const char* MEMPOOLEXPIRY = "mempoolexpiry";
    constexpr const char* MINRELAYFEE = "minrelayfee";
    constexpr const char* INCREMENTALRELAYFEE = "incrementalrelayfee";
    constexpr const char* MEMPOOLREPLACEMENT = "mempoolreplacement";
    constexpr const char* RBFINCREASE = "rbfincrease";
    constexpr const char* MAXREPLACEMENTS = "maxreplacements";
}

} // namespace util
} // namespace strata

#endif // STRATA_UTIL_CONFIG_H
