#pragma once

#include "relay/common/Logger.h"
#include "relay/protocol/Url.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace relay {
namespace common {
class Config;
}

// Settings of one relayd process. Built once by Load() and read-only afterwards;
// components keep a copy or a const reference.
class ProxyConfig {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

    static const char* const kDefaultTargetUrl;

    // Precedence: env, then the [section] key of ini, then the built-in default.
    // An empty environment value counts as unset. Returns false with *error
    // describing the first invalid setting.
    static bool Load(const relay::common::Config& ini, const EnvLookup& env,
                     ProxyConfig* out, std::string* error);

    // getenv() backed lookup.
    static EnvLookup ProcessEnv();

    const std::string& listenHost() const { return listenHost_; }
    uint16_t port() const { return port_; }
    int threads() const { return threads_; }
    const relay::protocol::Url& upstream() const { return upstream_; }
    double upstreamTimeoutSec() const { return upstreamTimeoutSec_; }
    bool tlsVerify() const { return tlsVerify_; }
    const std::string& caFile() const { return caFile_; }
    size_t maxBodyBytes() const { return maxBodyBytes_; }
    double drainSec() const { return drainSec_; }
    relay::common::LogLevel logLevel() const { return logLevel_; }

    // Multi-line, human readable; printed by relayd -C.
    std::string Describe() const;

private:
    std::string listenHost_{"0.0.0.0"};
    uint16_t port_{3000};
    int threads_{4};
    relay::protocol::Url upstream_;
    double upstreamTimeoutSec_{120.0};
    bool tlsVerify_{true};
    std::string caFile_;
    size_t maxBodyBytes_{10 * 1024 * 1024};
    double drainSec_{10.0};
    relay::common::LogLevel logLevel_{relay::common::LogLevel::INFO};
};

} // namespace relay
