#include "relay/common/Config.h"
#include "relay/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace relay {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

Config::Settings Config::ParseIni(std::istream& in) {
    Settings parsed;
    std::string line, section = "global";
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos != std::string::npos) {
            std::string key = Trim(line.substr(0, delimiterPos));
            std::string value = Trim(line.substr(delimiterPos + 1));
            if (!key.empty()) parsed[section][key] = value;
        } else {
            LOG_WARN << "Config: ignoring line without '=' in [" << section << "]: " << line;
        }
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    Settings parsed = ParseIni(file);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }

    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    Settings parsed = ParseIni(in);

    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

bool Config::Has(const std::string& section, const std::string& key) const {
    return Lookup(section, key).has_value();
}

std::optional<std::string> Config::Lookup(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return std::nullopt;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return std::nullopt;
    return kit->second;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    auto v = Lookup(section, key);
    return v ? *v : defaultVal;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        LOG_WARN << "Config: [" << section << "] " << key << " is not an integer: " << val;
        return defaultVal;
    }
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stod(val);
    } catch (const std::logic_error&) {
        LOG_WARN << "Config: [" << section << "] " << key << " is not a number: " << val;
        return defaultVal;
    }
}

static std::string UnquoteEnvValue(const std::string& raw) {
    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'') && raw.back() == raw.front()) {
        const char quote = raw.front();
        std::string inner = raw.substr(1, raw.size() - 2);
        if (quote == '\'') return inner;

        std::string out;
        out.reserve(inner.size());
        for (size_t i = 0; i < inner.size(); ++i) {
            if (inner[i] == '\\' && i + 1 < inner.size()) {
                const char n = inner[i + 1];
                if (n == 'n') { out.push_back('\n'); ++i; continue; }
                if (n == 'r') { out.push_back('\r'); ++i; continue; }
                if (n == '"' || n == '\\') { out.push_back(n); ++i; continue; }
            }
            out.push_back(inner[i]);
        }
        return out;
    }

    // Unquoted: an inline comment needs whitespace before '#'.
    std::string v = raw;
    for (size_t i = 1; i < v.size(); ++i) {
        if (v[i] == '#' && std::isspace(static_cast<unsigned char>(v[i - 1]))) {
            v.resize(i);
            break;
        }
    }
    return Config::Trim(v);
}

std::map<std::string, std::string> Config::ParseEnvText(const std::string& text) {
    std::map<std::string, std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 7, "export ") == 0) line = Trim(line.substr(7));

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = Trim(line.substr(0, eq));
        if (key.empty()) continue;
        out[key] = UnquoteEnvValue(Trim(line.substr(eq + 1)));
    }
    return out;
}

int Config::LoadEnvFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_DEBUG << "No env file at " << filename;
        return 0;
    }
    std::stringstream ss;
    ss << file.rdbuf();

    int applied = 0;
    for (const auto& [key, value] : ParseEnvText(ss.str())) {
        if (::getenv(key.c_str()) != nullptr) continue;
        if (::setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++applied;
        } else {
            LOG_WARN << "setenv failed for " << key;
        }
    }
    LOG_INFO << "Loaded " << applied << " variable(s) from " << filename;
    return applied;
}

} // namespace common
} // namespace relay
