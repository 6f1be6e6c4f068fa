// QUORUM - Configuration
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// INI-style configuration for the governance engine:
//
//   # comment            ; comment
//   [governance]         section header; keys below belong to it
//   quorumvotes = 400    key/value, whitespace trimmed
//   name = "Governor"    single or double quotes; double quotes take \n \t \" \\
//   debug = voting       a repeated key appends to a list
//   printtoconsole       bare key means true, "nokey" means false
//   include other.conf   parse another file in place
//   logfile = $HOME/q    ${VAR} and $VAR are expanded
//
// A trailing backslash joins a line with the next. Command-line options
// (-key=value, --section.key value, -nokey) override file values.

#ifndef QUORUM_UTIL_CONFIG_H
#define QUORUM_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quorum {
namespace util {

constexpr const char* DEFAULT_CONFIG_FILENAME = "quorum.conf";
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;
constexpr int MAX_INCLUDE_DEPTH = 10;

/// One key within a section. The first value is the scalar value; later
/// values come from repeated assignments.
struct ConfigEntry {
    std::vector<std::string> values;
    std::string source;     // file, "<command-line>", "<default>" or "<set>"
    int line{0};
    bool isDefault{false};

    const std::string& Value() const { return values.front(); }
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
};

/**
 * Holds parsed configuration. The global section is the empty string.
 * Getters never throw: a missing or unparsable value yields nullopt from
 * the TryGet* form and the default from the Get* form.
 */
class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& filePath);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& defaultValue,
                          const std::string& section = "") const;

    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Decimal, full 64-bit range; a sign is rejected
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    /// true/false, yes/no, on/off, 1/0 (any case)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Every value of a key, each split on commas, empty items dropped
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// String value with a leading ~ and environment variables expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Replace the key with a single value
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Only if the key is absent; parsed values later replace it
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    /// Named sections holding at least one key, sorted
    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void RequireKey(const std::string& key, const std::string& section = "");
    /// One message per missing required key
    std::vector<std::string> Validate() const;

    void Clear();
    size_t Size() const;

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    /// Commented configuration with the engine's keys
    static std::string GenerateSampleConfig();

    /// Current contents in file syntax, each value annotated with its origin
    std::string Dump() const;

private:
    const ConfigEntry* Find(const std::string& key, const std::string& section) const;
    void Assign(const std::string& section, const std::string& key, std::string value,
                const std::string& source, int line);

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);
    ConfigParseResult ParseLine(const std::string& line, const std::string& source,
                                int lineNum, std::string& section);

    // section -> key -> entry
    std::map<std::string, std::map<std::string, ConfigEntry>> sections_;
    std::set<std::pair<std::string, std::string>> required_;
    int includeDepth_{0};
};

/// Keys understood by the engine and its logging
namespace ConfigKeys {
    constexpr const char* LOGGING_SECTION = "logging";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* DEBUG = "debug";

    constexpr const char* GOVERNANCE_SECTION = "governance";
    constexpr const char* NAME = "name";
    constexpr const char* QUORUMVOTES = "quorumvotes";
    constexpr const char* PROPOSALTHRESHOLD = "proposalthreshold";
    constexpr const char* PROPOSALMAXOPERATIONS = "proposalmaxoperations";
    constexpr const char* VOTINGPERIOD = "votingperiod";
    constexpr const char* PROPOSALLIFETIME = "proposallifetime";
    constexpr const char* TOKEN = "token";
    constexpr const char* CHAINID = "chainid";
    constexpr const char* CONTRACT = "contract";
}

} // namespace util
} // namespace quorum

#endif // QUORUM_UTIL_CONFIG_H
