// TOKENLEDGER - Configuration Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/util/config.h"
#include "tokenledger/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <tuple>

namespace tokenledger {
namespace util {

namespace {

const char* const COMMAND_LINE = "<command-line>";

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Strip matching quotes; escapes are honoured only inside double quotes
std::string Unquote(const std::string& raw) {
    if (raw.size() < 2 || raw.front() != raw.back() ||
        (raw.front() != '"' && raw.front() != '\'')) {
        return raw;
    }

    std::string body = raw.substr(1, raw.size() - 2);
    if (raw.front() == '\'') {
        return body;
    }

    std::string out;
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] != '\\' || i + 1 == body.size()) {
            out += body[i];
            continue;
        }
        switch (body[i + 1]) {
            case 'n':  out += '\n'; ++i; break;
            case 't':  out += '\t'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '"':  out += '"';  ++i; break;
            default:   out += '\\'; break;
        }
    }
    return out;
}

/// First character outside [A-Za-z0-9_.-], or '\0'
char BadKeyChar(const std::string& key) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return c;
        }
    }
    return '\0';
}

/// "noflag" -> ("flag", "false"); anything else -> (name, "true")
std::pair<std::string, std::string> BareFlag(const std::string& name) {
    if (name.size() > 2 && name.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(name[2]))) {
        return {name.substr(2), "false"};
    }
    return {name, "true"};
}

std::string Origin(const std::string& source, int line) {
    return line > 0 ? source + ":" + std::to_string(line) : source;
}

} // namespace

std::string ConfigManager::Trim(const std::string& str) {
    const char* ws = " \t\r\n";
    size_t first = str.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(ws) - first + 1);
}

// ============================================================================
// Storage
// ============================================================================

void ConfigManager::Assign(const SlotKey& slotKey, const std::string& value,
                           const std::string& origin, Merge merge) {
    Slot& slot = slots_[slotKey];
    if (merge == Merge::Append && !slot.isDefault && !slot.values.empty()) {
        slot.values.push_back(value);
    } else {
        slot.values.assign(1, value);
    }
    slot.origin = origin;
    slot.isDefault = false;
}

const ConfigManager::Slot* ConfigManager::Find(const std::string& key,
                                               const std::string& section) const {
    auto it = slots_.find(SlotKey(section, key));
    return it == slots_.end() ? nullptr : &it->second;
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    Assign(SlotKey(section, key), value, "<programmatic>", Merge::Replace);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    SlotKey slotKey(section, key);
    if (slots_.count(slotKey) == 0) {
        Slot& slot = slots_[slotKey];
        slot.values.push_back(value);
        slot.origin = "(default)";
        slot.isDefault = true;
    }
}

void ConfigManager::Clear() {
    slots_.clear();
    positionals_.clear();
    allowedKeys_.clear();
    allowedSectionKeys_.clear();
}

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string section;

    auto parseLogical = [&](const std::string& raw, int lineNum) {
        std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            return ConfigParseResult::Success();
        }

        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos) {
                return ConfigParseResult::Error("Section header without ']'", source, lineNum);
            }
            section = Trim(line.substr(1, close - 1));
            return ConfigParseResult::Success();
        }

        std::string key;
        std::string value;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::tie(key, value) = BareFlag(line);
        } else {
            key = Trim(line.substr(0, eq));
            value = Unquote(Trim(line.substr(eq + 1)));
        }

        if (key.empty()) {
            return ConfigParseResult::Error("Missing key before '='", source, lineNum);
        }
        if (char bad = BadKeyChar(key)) {
            return ConfigParseResult::Error("Invalid character '" + std::string(1, bad) +
                                            "' in key", source, lineNum);
        }

        Assign(SlotKey(section, key), value, Origin(source, lineNum), Merge::Append);
        return ConfigParseResult::Success();
    };

    std::string pending;
    std::string physical;
    int lineNum = 0;

    while (std::getline(in, physical)) {
        ++lineNum;
        if (physical.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error("Line longer than " + std::to_string(MAX_LINE_LENGTH) +
                                            " characters", source, lineNum);
        }

        if (!physical.empty() && physical.back() == '\\') {
            physical.pop_back();
            pending += physical;
            continue;
        }

        ConfigParseResult result = parseLogical(pending + physical, lineNum);
        pending.clear();
        if (!result.success) {
            return result;
        }
    }

    // A continuation on the last line still counts
    if (!pending.empty()) {
        return parseLogical(pending, lineNum);
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file) {
        return ConfigParseResult::Error("Cannot open file: " + filePath, filePath);
    }

    ConfigParseResult result = ParseStream(file, filePath);
    if (result.success) {
        LOG_DEBUG(LogCategory::CONFIG) << "Read settings from " << filePath;
    }
    return result;
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream in(content);
    return ParseStream(in, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, char* argv[]) {
    positionals_.clear();
    std::set<std::string> given;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') {
            positionals_.push_back(arg);
            continue;
        }

        arg.erase(0, arg.find_first_not_of('-'));
        if (arg.empty()) {
            continue;
        }

        std::string key;
        std::string value;
        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            key = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        } else {
            std::tie(key, value) = BareFlag(arg);
            bool negated = key != arg;
            if (!negated && i + 1 < argc && argv[i + 1][0] != '-') {
                value = argv[++i];
            }
        }

        if (char bad = BadKeyChar(key)) {
            return ConfigParseResult::Error("Invalid character '" + std::string(1, bad) +
                                            "' in option", COMMAND_LINE);
        }

        // The first occurrence replaces file values, later ones accumulate
        Merge merge = given.insert(key).second ? Merge::Replace : Merge::Append;
        Assign(SlotKey("", key), value, COMMAND_LINE, merge);
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
    const Slot* slot = Find(key, section);
    if (!slot) {
        return std::nullopt;
    }
    return slot->values.back();
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto raw = TryGetString(key, section);
    if (!raw) {
        return std::nullopt;
    }
    std::string text = Trim(*raw);
    if (text.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
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
    auto raw = TryGetString(key, section);
    if (!raw) {
        return std::nullopt;
    }
    std::string text = Trim(*raw);
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
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
    auto raw = TryGetString(key, section);
    if (!raw) {
        return std::nullopt;
    }
    std::string text = Lower(Trim(*raw));
    if (text == "true" || text == "yes" || text == "on" || text == "1") {
        return true;
    }
    if (text == "false" || text == "no" || text == "off" || text == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> items;
    const Slot* slot = Find(key, section);
    if (!slot) {
        return items;
    }

    for (const auto& value : slot->values) {
        std::istringstream parts(value);
        std::string item;
        while (std::getline(parts, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
    }
    return items;
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::vector<std::string> sections;
    for (const auto& entry : slots_) {
        const std::string& section = entry.first.first;
        if (!section.empty() && (sections.empty() || sections.back() != section)) {
            sections.push_back(section);
        }
    }
    return sections;
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& entry : slots_) {
        if (entry.first.first == section) {
            keys.push_back(entry.first.second);
        }
    }
    return keys;
}

std::string ConfigManager::Dump() const {
    std::ostringstream out;
    out << "# " << slots_.size() << " settings\n";

    const std::string* current = nullptr;
    for (const auto& [slotKey, slot] : slots_) {
        if (!current || *current != slotKey.first) {
            current = &slotKey.first;
            out << "\n";
            if (!current->empty()) {
                out << "[" << *current << "]\n";
            }
        }
        out << slotKey.second << "=" << slot.values.back() << "  # " << slot.origin << "\n";
    }
    return out.str();
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key) {
    allowedKeys_.insert(key);
}

void ConfigManager::AllowSectionKey(const std::string& sectionPrefix, const std::string& key) {
    allowedSectionKeys_[sectionPrefix].insert(key);
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> warnings;
    if (allowedKeys_.empty() && allowedSectionKeys_.empty()) {
        return warnings;
    }

    for (const auto& [slotKey, slot] : slots_) {
        const std::string& section = slotKey.first;
        const std::string& key = slotKey.second;

        bool known = false;
        if (section.empty()) {
            known = allowedKeys_.count(key) > 0;
        } else {
            for (const auto& [prefix, keys] : allowedSectionKeys_) {
                if (section.compare(0, prefix.size(), prefix) == 0 && keys.count(key) > 0) {
                    known = true;
                    break;
                }
            }
        }

        if (!known) {
            std::string name = section.empty() ? key : section + ":" + key;
            warnings.push_back("Unknown key: " + name + " (from " + slot.origin + ")");
        }
    }
    return warnings;
}

} // namespace util
} // namespace tokenledger
