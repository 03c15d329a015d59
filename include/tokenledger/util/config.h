// TOKENLEDGER - Configuration
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// INI-style settings for the ledger and the simulator:
//
//   # comment            ; comment
//   key=value            key="quoted \"value\""
//   flag                 noflag            (true / false)
//   [tier.0]             starts a section
//   long=a,\             trailing backslash joins the next line
//        b
//
// A key given more than once keeps every value for GetList; scalar getters
// see the last one. Command-line options replace file values.

#ifndef TOKENLEDGER_UTIL_CONFIG_H
#define TOKENLEDGER_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tokenledger {
namespace util {

/// Longest accepted physical line
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() { return {true, "", "", 0}; }

    static ConfigParseResult Error(const std::string& msg, const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

class ConfigManager {
public:
    // ========================================================================
    // Sources
    // ========================================================================

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Accepts -key=value, --key=value, -key value, -flag and -noflag.
     * Anything not starting with '-' is kept as a positional argument.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);

    const std::vector<std::string>& GetPositionals() const { return positionals_; }

    /// Replace any value, including a repeated one
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Only takes effect if the key has no value yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Lookup
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Empty when missing or not a whole decimal number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Rejects signs as well as garbage and overflow
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    /// true/yes/on/1 and false/no/off/0, any case
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Every value given for the key, each split on commas and trimmed
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Named sections in sorted order
    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    size_t Size() const { return slots_.size(); }
    void Clear();

    /// Current values grouped by section, each annotated with where it came from
    std::string Dump() const;

    // ========================================================================
    // Validation
    // ========================================================================

    void AllowKey(const std::string& key);

    /// Allow key in every section whose name starts with sectionPrefix
    void AllowSectionKey(const std::string& sectionPrefix, const std::string& key);

    /// One warning per key nobody registered; empty if nothing was registered
    std::vector<std::string> Validate() const;

    static std::string Trim(const std::string& str);

private:
    /// (section, key); the global section is ""
    using SlotKey = std::pair<std::string, std::string>;

    struct Slot {
        std::vector<std::string> values;
        std::string origin;
        bool isDefault{false};
    };

    enum class Merge {
        Replace,
        Append,
    };

    void Assign(const SlotKey& slotKey, const std::string& value,
                const std::string& origin, Merge merge);

    const Slot* Find(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    std::map<SlotKey, Slot> slots_;
    std::vector<std::string> positionals_;

    std::set<std::string> allowedKeys_;
    std::map<std::string, std::set<std::string>> allowedSectionKeys_;
};

// ============================================================================
// Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    constexpr const char* TRANSFERFEEBPS = "transferfeebps";
    constexpr const char* BURNRATIO = "burnratio";
    constexpr const char* REWARDSRATIO = "rewardsratio";
    constexpr const char* DEVRATIO = "devratio";
    constexpr const char* DEVWALLET = "devwallet";
    constexpr const char* FEEEXEMPT = "feeexempt";

    constexpr const char* REWARDRATE = "rewardrate";
    constexpr const char* MINSTAKINGDURATION = "minstakingduration";
    constexpr const char* EARLYUNSTAKEFEEBPS = "earlyunstakefeebps";

    // [tier.0], [tier.1], ... in ascending minimum stake
    constexpr const char* TIER_SECTION_PREFIX = "tier.";
    constexpr const char* TIER_NAME = "name";
    constexpr const char* TIER_MINIMUMSTAKE = "minimumstake";
    constexpr const char* TIER_MULTIPLIERBPS = "multiplierbps";
    constexpr const char* TIER_CAPABILITIES = "capabilities";
}

} // namespace util
} // namespace tokenledger

#endif // TOKENLEDGER_UTIL_CONFIG_H
