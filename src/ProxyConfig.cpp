#include "relay/ProxyConfig.h"
#include "relay/common/Config.h"
#include "relay/network/InetAddress.h"
#include "relay/protocol/HttpHeaders.h"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace relay {

using relay::common::Config;

const char* const ProxyConfig::kDefaultTargetUrl = "https://api.perplexity.ai/chat/completions";

namespace {

struct Source {
    const Config& ini;
    const ProxyConfig::EnvLookup& env;

    // Returns the raw value and where it came from, or nullopt when unset everywhere.
    std::optional<std::string> Get(const char* envName, const char* section, const char* key,
                                   std::string* origin) const {
        if (env) {
            std::optional<std::string> v = env(envName);
            if (v && !v->empty()) {
                *origin = envName;
                return v;
            }
        }
        std::optional<std::string> v = ini.Lookup(section, key);
        if (v) {
            *origin = std::string("[") + section + "] " + key;
            return v;
        }
        return std::nullopt;
    }
};

bool ParseLong(const std::string& text, long lo, long hi, long* out) {
    try {
        size_t used = 0;
        long v = std::stol(text, &used, 10);
        if (used != text.size() || v < lo || v > hi) return false;
        *out = v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ParseSeconds(const std::string& text, double* out) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size() || !(v > 0.0) || v > 86400.0) return false;
        *out = v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ParseBool(const std::string& text, bool* out) {
    const std::string v = relay::protocol::ToLowerCopy(text);
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        *out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        *out = false;
        return true;
    }
    return false;
}

bool Invalid(std::string* error, const std::string& origin, const std::string& value, const char* expected) {
    if (error) *error = origin + ": invalid value '" + value + "' (expected " + expected + ")";
    return false;
}

} // namespace

ProxyConfig::EnvLookup ProxyConfig::ProcessEnv() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = ::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

bool ProxyConfig::Load(const Config& ini, const EnvLookup& env, ProxyConfig* out, std::string* error) {
    Source src{ini, env};
    ProxyConfig cfg;
    std::string origin;
    long n = 0;

    if (auto v = src.Get("PORT", "server", "port", &origin)) {
        if (!ParseLong(Config::Trim(*v), 0, 65535, &n)) return Invalid(error, origin, *v, "a port number 0-65535");
        cfg.port_ = static_cast<uint16_t>(n);
    }
    if (auto v = src.Get("LISTEN_HOST", "server", "listen_host", &origin)) {
        cfg.listenHost_ = Config::Trim(*v);
        if (!relay::network::InetAddress(cfg.listenHost_, 0).valid()) {
            return Invalid(error, origin, *v, "a numeric IP address");
        }
    }
    if (auto v = src.Get("RELAY_THREADS", "server", "threads", &origin)) {
        if (!ParseLong(Config::Trim(*v), 0, 256, &n)) return Invalid(error, origin, *v, "a thread count 0-256");
        cfg.threads_ = static_cast<int>(n);
    }

    std::string target = kDefaultTargetUrl;
    if (auto v = src.Get("TARGET_URL", "upstream", "url", &origin)) {
        target = Config::Trim(*v);
        if (target.empty()) {
            if (error) *error = origin + ": upstream URL is empty";
            return false;
        }
    }
    std::string urlError;
    std::optional<relay::protocol::Url> url = relay::protocol::Url::Parse(target, &urlError);
    if (!url) {
        if (error) *error = "upstream URL: " + urlError;
        return false;
    }
    cfg.upstream_ = *url;

    if (auto v = src.Get("UPSTREAM_TIMEOUT_SEC", "upstream", "timeout_sec", &origin)) {
        if (!ParseSeconds(Config::Trim(*v), &cfg.upstreamTimeoutSec_)) return Invalid(error, origin, *v, "seconds > 0");
    }
    if (auto v = src.Get("UPSTREAM_TLS_VERIFY", "upstream", "tls_verify", &origin)) {
        if (!ParseBool(Config::Trim(*v), &cfg.tlsVerify_)) return Invalid(error, origin, *v, "0 or 1");
    }
    if (auto v = src.Get("UPSTREAM_CA_FILE", "upstream", "ca_file", &origin)) {
        cfg.caFile_ = Config::Trim(*v);
    }
    if (auto v = src.Get("MAX_BODY_BYTES", "limits", "max_body_bytes", &origin)) {
        if (!ParseLong(Config::Trim(*v), 1, 1L << 30, &n)) return Invalid(error, origin, *v, "a byte count 1-1073741824");
        cfg.maxBodyBytes_ = static_cast<size_t>(n);
    }
    if (auto v = src.Get("SHUTDOWN_DRAIN_SEC", "shutdown", "drain_sec", &origin)) {
        if (!ParseSeconds(Config::Trim(*v), &cfg.drainSec_)) return Invalid(error, origin, *v, "seconds > 0");
    }
    if (auto v = src.Get("LOG_LEVEL", "log", "level", &origin)) {
        bool ok = false;
        cfg.logLevel_ = relay::common::Logger::ParseLevel(Config::Trim(*v), &ok);
        if (!ok) {
            LOG_WARN << origin << ": unknown log level '" << *v << "', using INFO";
        }
    }

    *out = cfg;
    return true;
}

std::string ProxyConfig::Describe() const {
    std::ostringstream os;
    os << "listen        " << listenHost_ << ":" << port_ << "\n"
       << "threads       " << threads_ << "\n"
       << "upstream      " << upstream_.toString() << "\n"
       << "timeout_sec   " << upstreamTimeoutSec_ << "\n"
       << "tls_verify    " << (tlsVerify_ ? 1 : 0) << "\n"
       << "ca_file       " << (caFile_.empty() ? "(system default)" : caFile_) << "\n"
       << "max_body      " << maxBodyBytes_ << "\n"
       << "drain_sec     " << drainSec_ << "\n"
       << "log_level     " << relay::common::Logger::LevelName(logLevel_) << "\n";
    return os.str();
}

} // namespace relay
