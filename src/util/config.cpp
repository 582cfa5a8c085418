// STRATA - Configuration File Parser Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/util/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace strata {
namespace util {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
    }
    std::ostringstream ss;
    if (!errorSource.empty()) {
        ss << errorSource;
        if (errorLine > 0) {
            ss << ":" << errorLine;
        }
        ss << ": ";
    }
    ss << errorMessage;
    return ss.str();
}

// ============================================================================
// Static Helpers
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

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
    if (str.length() < 2) {
        return str;
    }
    char first = str.front();
    char last = str.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        return str.substr(1, str.length() - 2);
    }
    return str;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
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
        return true;
    }

    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag; "noflag" negates
        key = trimmed;
        value = "true";
        if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = Unquote(Trim(trimmed.substr(eqPos + 1)));
    }

    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = false;
    entries_[MakeKey(key, currentSection)] = std::move(entry);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& sourceName) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            filePath);
    }

    return ParseStream(file, filePath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(MakeKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }

    size_t pos = 0;
    int64_t value = 0;
    try {
        value = std::stoll(*str, &pos);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    std::string suffix = ToLower(Trim(str->substr(pos)));
    if (suffix.empty()) {
        return value;
    }
    if (suffix.size() != 1) {
        return std::nullopt;
    }
    switch (suffix[0]) {
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

std::optional<double> ConfigManager::TryGetDouble(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        double value = std::stod(*str, &pos);
        if (!Trim(str->substr(pos)).empty()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

double ConfigManager::GetDouble(const std::string& key, double defaultValue,
                                const std::string& section) const {
    return TryGetDouble(key, section).value_or(defaultValue);
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    std::lock_guard<std::mutex> lock(mutex_);
    ConfigEntry& entry = entries_[MakeKey(key, section)];
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<set>";
    entry.lineNumber = 0;
    entry.isDefault = false;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string fullKey = MakeKey(key, section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Introspection
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> sections;
    for (const auto& [fullKey, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

void ConfigManager::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t ConfigManager::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string ConfigManager::Dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream ss;
    for (const auto& [fullKey, entry] : entries_) {
        ss << fullKey << "=" << entry.value;
        if (entry.isDefault) {
            ss << " (default)";
        }
        ss << "\n";
    }
    return ss.str();
}

} // namespace util
} // namespace strata
