#pragma once

#include <string>
#include <map>
#include <mutex>
#include <optional>
#include <iosfwd>
#include "relay/common/noncopyable.h"

namespace relay {
namespace common {

// INI style settings: [section] then key = value. '#' and ';' start comments.
class Config : noncopyable {
public:
    using Settings = std::map<std::string, std::map<std::string, std::string>>;

    Config() = default;
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    bool Has(const std::string& section, const std::string& key) const;
    std::optional<std::string> Lookup(const std::string& section, const std::string& key) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;

    // dotenv: KEY=VALUE lines, optional "export " prefix, quoted values.
    static std::map<std::string, std::string> ParseEnvText(const std::string& text);
    // Exports entries not already present in the process environment.
    // Returns the number of variables set; a missing file yields 0.
    static int LoadEnvFile(const std::string& filename);

    static std::string Trim(const std::string& s);

private:
    static Settings ParseIni(std::istream& in);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace relay
