// ANCHORZK - Configuration Parser Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/util/config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <sstream>

namespace anchorzk {
namespace util {

namespace {

constexpr const char* COMMAND_LINE = "<command-line>";

std::string Strip(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return first < last ? std::string(first, last) : std::string();
}

bool IsKeyChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == '.';
}

bool IsValidKey(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), IsKeyChar);
}

/// "noX" with a lower-case X names the negation of flag X
bool SplitNegation(const std::string& word, std::string& flag) {
    if (word.size() <= 2 || word.compare(0, 2, "no") != 0 ||
        !std::islower(static_cast<unsigned char>(word[2]))) {
        return false;
    }
    flag = word.substr(2);
    return true;
}

/// Strip matching quotes. Double quotes also honour \n \t \\ and \".
std::string Unquote(const std::string& raw) {
    if (raw.size() < 2 || (raw.front() != '"' && raw.front() != '\'') ||
        raw.back() != raw.front()) {
        return raw;
    }
    const bool escapes = raw.front() == '"';
    std::string out;
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
        char c = raw[i];
        if (escapes && c == '\\' && i + 2 < raw.size()) {
            switch (raw[i + 1]) {
                case 'n':  out += '\n'; ++i; continue;
                case 't':  out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"':  out += '"';  ++i; continue;
                default: break;
            }
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string ConfigParseResult::ToString() const {
    if (errorFile.empty()) {
        return errorMessage;
    }
    std::ostringstream out;
    out << errorFile;
    if (errorLine > 0) {
        out << ':' << errorLine;
    }
    out << ": " << errorMessage;
    return out.str();
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    static const char* const TRUE_WORDS[] = {"1", "true", "yes", "on"};
    static const char* const FALSE_WORDS[] = {"0", "false", "no", "off"};

    std::string word;
    std::transform(str.begin(), str.end(), std::back_inserter(word),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* w : TRUE_WORDS) {
        if (word == w) return true;
    }
    for (const char* w : FALSE_WORDS) {
        if (word == w) return false;
    }
    return std::nullopt;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + "." + key;
}

// ============================================================================
// Storage
// ============================================================================

bool ConfigManager::Accepts(const ConfigEntry& incoming, bool overwrite) const {
    auto it = entries_.find(MakeKey(incoming.key, incoming.section));
    if (overwrite || it == entries_.end()) {
        return true;
    }
    const ConfigEntry& current = it->second;
    if (current.origin != incoming.origin) {
        return current.origin < incoming.origin;
    }
    // Two files: the first one read keeps the key
    return current.source == incoming.source;
}

void ConfigManager::Store(ConfigEntry entry, bool overwrite) {
    if (!Accepts(entry, overwrite)) {
        return;
    }
    std::string fullKey = MakeKey(entry.key, entry.section);
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream in(content);
    std::string raw;
    std::string section;

    for (int lineNum = 1; std::getline(in, raw); ++lineNum) {
        if (raw.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }

        std::string line = Strip(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos) {
                return ConfigParseResult::Error(
                    "Missing closing bracket in section header", sourceName, lineNum);
            }
            section = Strip(line.substr(1, close - 1));
            continue;
        }

        ConfigEntry entry;
        entry.section = section;
        entry.source = sourceName;
        entry.origin = ConfigOrigin::File;
        entry.lineNumber = lineNum;

        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            entry.key = Strip(line.substr(0, eq));
            entry.value = Unquote(Strip(line.substr(eq + 1)));
        } else if (SplitNegation(line, entry.key)) {
            entry.value = "false";
        } else {
            entry.key = line;
            entry.value = "true";
        }

        if (!IsValidKey(entry.key)) {
            return ConfigParseResult::Error("Invalid key: '" + entry.key + "'",
                                            sourceName, lineNum);
        }
        Store(std::move(entry), overwrite);
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }

    std::streamoff size = file.tellg();
    if (size > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            filePath);
    }
    file.seekg(0);

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return ParseString(content, filePath, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        size_t nameStart = arg.find_first_not_of('-');
        if (arg.size() < 2 || arg[0] != '-' || nameStart == std::string::npos) {
            continue;
        }
        std::string name = arg.substr(nameStart);

        ConfigEntry entry;
        entry.source = COMMAND_LINE;
        entry.origin = ConfigOrigin::Override;

        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            entry.key = name.substr(0, eq);
            entry.value = name.substr(eq + 1);
        } else if (SplitNegation(name, entry.key)) {
            entry.value = "false";
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            entry.key = name;
            entry.value = argv[++i];
        } else {
            entry.key = name;
            entry.value = "true";
        }

        if (!IsValidKey(entry.key)) {
            return ConfigParseResult::Error("Invalid option: '" + arg + "'", COMMAND_LINE);
        }
        Store(std::move(entry), true);
    }
    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) != 0;
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key,
                                                   const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    if (auto entry = GetEntry(key, section)) {
        return entry->value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    std::optional<std::string> text = TryGetString(key, section);
    if (!text) {
        return std::nullopt;
    }
    const char* first = text->c_str();
    const char* last = first + text->size();
    if (first != last && *first == '+') {
        ++first;
    }
    if (first == last) {
        return std::nullopt;
    }

    int64_t parsed = 0;
    std::from_chars_result r = std::from_chars(first, last, parsed);
    if (r.ec != std::errc() || r.ptr != last) {
        return std::nullopt;
    }
    return parsed;
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    std::optional<int64_t> signedValue = TryGetInt(key, section);
    if (signedValue && *signedValue >= 0) {
        return static_cast<uint64_t>(*signedValue);
    }
    return std::nullopt;
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    std::optional<std::string> text = TryGetString(key, section);
    return text ? ParseBool(*text) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    entry.origin = ConfigOrigin::Override;
    Store(std::move(entry), true);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    if (HasKey(key, section)) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.origin = ConfigOrigin::Default;
    entry.isDefault = true;
    Store(std::move(entry), false);
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> unknown;
    if (allowedKeys_.empty()) {
        return unknown;
    }
    for (const auto& item : entries_) {
        if (allowedKeys_.count(item.first) == 0) {
            unknown.push_back("Unknown key: " + item.first +
                              " (defined in " + item.second.source + ")");
        }
    }
    return unknown;
}

void ConfigManager::Clear() {
    entries_.clear();
    allowedKeys_.clear();
}

} // namespace util
} // namespace anchorzk
