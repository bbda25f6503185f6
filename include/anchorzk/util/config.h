// ANCHORZK - Configuration Parser
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// INI-style configuration files and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally quoted: key="value with spaces"
// - Section headers: [section]
// - A bare key is a boolean flag; "nokey" negates it
// - Boolean values: true/false, yes/no, on/off, 1/0

#ifndef ANCHORZK_UTIL_CONFIG_H
#define ANCHORZK_UTIL_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace anchorzk {
namespace util {

/// Largest accepted config file
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Longest accepted line in a config file
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Where a value came from, lowest priority first
enum class ConfigOrigin {
    Default,
    File,
    Override   // command line or Set()
};

// ============================================================================
// Entries and Results
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // empty for the global section
    std::string source;    // file path, "<command-line>", "<default>", ...
    ConfigOrigin origin{ConfigOrigin::File};
    int lineNumber{0};
    bool isDefault{false};
};

struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() { return {}; }
    static ConfigParseResult Error(std::string msg, std::string file = "", int line = 0) {
        return {false, std::move(msg), std::move(file), line};
    }

    /// "file:line: message", or just the message when no location is known
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files, command-line arguments and defaults.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments and Set()
 * 2. Config file values
 * 3. SetDefault() values
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @param overwrite If false, keys already set by a higher-priority
     *        source keep their value
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /// Parse configuration text. `sourceName` appears in error messages.
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments of the form -key=value, --key=value,
     * -key value, -flag and -noflag. Non-option arguments are ignored.
     * Command-line values always overwrite.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt if missing or not a base-10 integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// nullopt if missing, negative or malformed
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Entry metadata for a key, if present
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value with command-line priority
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if the key is absent
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register an allowed key. Once any key is registered, Validate()
    /// reports every other key as unknown.
    void AllowKey(const std::string& key, const std::string& section = "");

    std::vector<std::string> Validate() const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    static std::optional<bool> ParseBool(const std::string& str);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    /// Whether `incoming` may replace the value stored under its key
    bool Accepts(const ConfigEntry& incoming, bool overwrite) const;
    void Store(ConfigEntry entry, bool overwrite);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

} // namespace util
} // namespace anchorzk

#endif // ANCHORZK_UTIL_CONFIG_H
