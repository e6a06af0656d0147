// VEIL - Configuration
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// INI-style configuration for the VEIL tools.
//
// File format:
// - Lines starting with # or ; are comments
// - key=value pairs, grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
//
// Command-line arguments of the form -section.key=value override file
// values for that section.

#ifndef VEIL_UTIL_CONFIG_H
#define VEIL_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace veil {
namespace util {

constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<string>" or "<command-line>"
    int lineNumber{0};
};

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
};

/**
 * Holds configuration values gathered from files, strings and the
 * command line. Later sources overwrite earlier ones.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Accepts -key=value, --key value and -section.key=value forms
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Accepts decimal or 0x-prefixed hexadecimal
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Path value with ~ expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    /// Render all entries back into INI text
    std::string Dump() const;

private:
    std::map<std::string, ConfigEntry> entries_;

    static std::string MakeKey(const std::string& key, const std::string& section);

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* SECTION_PUZZLE = "puzzle";
    constexpr const char* DEGREE = "degree";
    constexpr const char* MAX_DEGREE = "max_degree";
    constexpr const char* SEED = "seed";
    constexpr const char* EPOCH = "epoch";
    constexpr const char* MINIMUM_PROOF_TARGET = "minimum_proof_target";
    constexpr const char* THREADS = "threads";
    constexpr const char* NONCE_START = "nonce_start";
    constexpr const char* NONCE_COUNT = "nonce_count";

    constexpr const char* SECTION_STORAGE = "storage";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* BACKEND = "backend";

    constexpr const char* SECTION_LOG = "log";
    constexpr const char* LEVEL = "level";
    constexpr const char* FILE = "file";
}

} // namespace util
} // namespace veil

#endif // VEIL_UTIL_CONFIG_H
