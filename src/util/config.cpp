// QUORUM - Configuration Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/util/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace quorum {
namespace util {

namespace {

const char* const WHITESPACE = " \t\r\n";

std::string Trim(const std::string& str) {
    size_t first = str.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(WHITESPACE) - first + 1);
}

std::string Lower(std::string str) {
    for (char& c : str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

bool IsValidKey(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), IsKeyChar);
}

/// "nofoo" -> "foo"; empty if `key` is not a negated flag
std::string NegatedFlag(const std::string& key) {
    if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(key[2]))) {
        return key.substr(2);
    }
    return "";
}

/// Strip matching quotes; double quotes also take escapes
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }

    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '\\' && i + 1 < inner.size()) {
            char next = inner[i + 1];
            switch (next) {
                case 'n': c = '\n'; ++i; break;
                case 't': c = '\t'; ++i; break;
                case 'r': c = '\r'; ++i; break;
                case '"':
                case '\\': c = next; ++i; break;
                default: break;
            }
        }
        out += c;
    }
    return out;
}

std::optional<bool> ParseBool(const std::string& str) {
    std::string value = Lower(Trim(str));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return std::nullopt;
}

/// "section.key" -> ("section", "key"); otherwise the global section
std::pair<std::string, std::string> SplitQualifiedKey(const std::string& name) {
    size_t dot = name.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
        return {"", name};
    }
    return {name.substr(0, dot), name.substr(dot + 1)};
}

std::string Describe(const std::string& section, const std::string& key) {
    return section.empty() ? key : "[" + section + "] " + key;
}

} // anonymous namespace

// ============================================================================
// Storage
// ============================================================================

const ConfigEntry* ConfigManager::Find(const std::string& key,
                                       const std::string& section) const {
    auto sectionIt = sections_.find(section);
    if (sectionIt == sections_.end()) {
        return nullptr;
    }
    auto keyIt = sectionIt->second.find(key);
    return keyIt == sectionIt->second.end() ? nullptr : &keyIt->second;
}

void ConfigManager::Assign(const std::string& section, const std::string& key,
                           std::string value, const std::string& source, int line) {
    ConfigEntry& entry = sections_[section][key];
    if (entry.values.empty() || entry.isDefault) {
        entry.values.clear();
        entry.source = source;
        entry.line = line;
        entry.isDefault = false;
    }
    entry.values.push_back(std::move(value));
}

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    const std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return ConfigParseResult::Error("cannot open " + path);
    }
    if (static_cast<size_t>(file.tellg()) > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Error("file exceeds " + std::to_string(MAX_CONFIG_SIZE) +
                                        " bytes", path);
    }
    file.seekg(0);
    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseStream(std::istream& stream, const std::string& source) {
    std::string section;
    std::string pending;
    int pendingStart = 0;
    int lineNum = 0;
    std::string raw;

    while (std::getline(stream, raw)) {
        ++lineNum;
        if (raw.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error("line longer than " +
                                            std::to_string(MAX_LINE_LENGTH) + " characters",
                                            source, lineNum);
        }

        if (pending.empty()) {
            pendingStart = lineNum;
        }
        if (!raw.empty() && raw.back() == '\\') {
            raw.pop_back();
            pending += raw;
            continue;
        }
        pending += raw;

        ConfigParseResult result = ParseLine(pending, source, pendingStart, section);
        pending.clear();
        if (!result.success) {
            return result;
        }
    }

    if (!pending.empty()) {
        return ParseLine(pending, source, pendingStart, section);
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseLine(const std::string& line, const std::string& source,
                                           int lineNum, std::string& section) {
    const std::string text = Trim(line);
    if (text.empty() || text[0] == '#' || text[0] == ';') {
        return ConfigParseResult::Success();
    }

    if (text[0] == '[') {
        if (text.back() != ']') {
            return ConfigParseResult::Error("unterminated section header", source, lineNum);
        }
        section = Trim(text.substr(1, text.size() - 2));
        return ConfigParseResult::Success();
    }

    if (text.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            return ConfigParseResult::Error("include depth exceeded", source, lineNum);
        }
        ++includeDepth_;
        ConfigParseResult result = ParseFile(Unquote(Trim(text.substr(8))));
        --includeDepth_;
        return result;
    }

    std::string key;
    std::string value;
    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        key = text;
        std::string negated = NegatedFlag(key);
        value = negated.empty() ? "true" : "false";
        if (!negated.empty()) {
            key = negated;
        }
    } else {
        key = Trim(text.substr(0, eq));
        value = ExpandEnvVars(Unquote(Trim(text.substr(eq + 1))));
    }

    if (!IsValidKey(key)) {
        return ConfigParseResult::Error("invalid key '" + key + "'", source, lineNum);
    }

    Assign(section, key, std::move(value), source, lineNum);
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    const std::string source = "<command-line>";

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        size_t nameStart = arg.find_first_not_of('-');
        if (arg.empty() || arg[0] != '-' || nameStart == std::string::npos) {
            continue;
        }

        std::string name = arg.substr(nameStart);
        std::string value;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.erase(eq);
        } else if (std::string negated = NegatedFlag(name); !negated.empty()) {
            name = negated;
            value = "false";
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            value = argv[++i];
        } else {
            value = "true";
        }

        auto [section, key] = SplitQualifiedKey(name);
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("invalid option " + arg, source);
        }

        ConfigEntry& entry = sections_[section][key];
        entry.values = {value};
        entry.source = source;
        entry.line = 0;
        entry.isDefault = false;
    }
    return ConfigParseResult::Success();
}

// ============================================================================
// Lookup
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return entry->Value();
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
    std::string text = Trim(*str);
    if (text.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    // strtoull would accept a sign and wrap negatives around
    std::string text = Trim(*str);
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    return str ? ParseBool(*str) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> items;
    const ConfigEntry* entry = Find(key, section);
    if (!entry) {
        return items;
    }

    for (const auto& value : entry->values) {
        size_t start = 0;
        while (start <= value.size()) {
            size_t comma = value.find(',', start);
            if (comma == std::string::npos) {
                comma = value.size();
            }
            std::string item = Trim(value.substr(start, comma - start));
            if (!item.empty()) {
                items.push_back(std::move(item));
            }
            start = comma + 1;
        }
    }
    return items;
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Mutation
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry& entry = sections_[section][key];
    entry.values = {value};
    entry.source = "<set>";
    entry.line = 0;
    entry.isDefault = false;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    if (HasKey(key, section)) {
        return;
    }
    ConfigEntry& entry = sections_[section][key];
    entry.values = {value};
    entry.source = "<default>";
    entry.isDefault = true;
}

void ConfigManager::Clear() {
    sections_.clear();
    required_.clear();
    includeDepth_ = 0;
}

size_t ConfigManager::Size() const {
    size_t count = 0;
    for (const auto& [section, keys] : sections_) {
        count += keys.size();
    }
    return count;
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::vector<std::string> names;
    for (const auto& [section, keys] : sections_) {
        if (!section.empty() && !keys.empty()) {
            names.push_back(section);
        }
    }
    return names;
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto it = sections_.find(section);
    if (it != sections_.end()) {
        for (const auto& [key, entry] : it->second) {
            keys.push_back(key);
        }
    }
    return keys;
}

void ConfigManager::RequireKey(const std::string& key, const std::string& section) {
    required_.emplace(section, key);
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    for (const auto& [section, key] : required_) {
        if (!HasKey(key, section)) {
            errors.push_back("missing required key " + Describe(section, key));
        }
    }
    return errors;
}

// ============================================================================
// Expansion
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$' || i + 1 == value.size()) {
            out += value[i++];
            continue;
        }

        std::string name;
        size_t next;
        if (value[i + 1] == '{') {
            size_t close = value.find('}', i + 2);
            if (close == std::string::npos) {
                out += value[i++];
                continue;
            }
            name = value.substr(i + 2, close - i - 2);
            next = close + 1;
        } else {
            size_t end = i + 1;
            while (end < value.size() &&
                   (std::isalnum(static_cast<unsigned char>(value[end])) || value[end] == '_')) {
                ++end;
            }
            name = value.substr(i + 1, end - i - 1);
            next = end;
        }

        if (name.empty()) {
            out += value[i++];
            continue;
        }
        if (const char* env = std::getenv(name.c_str())) {
            out += env;
        }
        i = next;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        const struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : nullptr;
    }
    return home ? std::string(home) + path.substr(1) : path;
}

// ============================================================================
// Output
// ============================================================================

std::string ConfigManager::GenerateSampleConfig() {
    std::ostringstream oss;
    oss << "# " << DEFAULT_CONFIG_FILENAME << "\n"
        << "\n"
        << "[logging]\n"
        << "# trace, debug, info, warn, error or off\n"
        << "#loglevel=info\n"
        << "#printtoconsole=1\n"
        << "#logfile=~/quorum.log\n"
        << "# Only log these categories (governance, voting, execution, config, crypto)\n"
        << "#debug=governance,voting\n"
        << "\n"
        << "[governance]\n"
        << "# Signing-domain name\n"
        << "name=Governor\n"
        << "# For-votes needed to pass\n"
        << "quorumvotes=400000\n"
        << "# Weight a proposer must exceed\n"
        << "proposalthreshold=100000\n"
        << "# Actions per proposal, 1 to 10\n"
        << "proposalmaxoperations=10\n"
        << "# Blocks a vote stays open\n"
        << "votingperiod=17280\n"
        << "# Blocks from vote start until a proposal expires\n"
        << "proposallifetime=40320\n"
        << "#token=0x0000000000000000000000000000000000000000\n"
        << "chainid=1\n"
        << "#contract=0x0000000000000000000000000000000000000000\n";
    return oss.str();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    for (const auto& [section, keys] : sections_) {
        if (keys.empty()) {
            continue;
        }
        if (!section.empty()) {
            oss << "[" << section << "]\n";
        }
        for (const auto& [key, entry] : keys) {
            std::string origin = entry.isDefault ? "(default)" : entry.source;
            if (!entry.isDefault && entry.line > 0) {
                origin += ":" + std::to_string(entry.line);
            }
            for (const auto& value : entry.values) {
                oss << key << "=" << value << "  # " << origin << "\n";
            }
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace util
} // namespace quorum
