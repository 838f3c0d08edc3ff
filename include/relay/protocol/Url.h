#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relay {
namespace protocol {

// Absolute http/https URL split into the parts an HTTP/1.1 client needs.
struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;     // IPv6 literals without brackets
    uint16_t port{0};
    std::string target{"/"}; // path plus query, never empty
    bool explicitPort{false};

    bool tls() const { return scheme == "https"; }
    // Value for the Host header: the port is omitted when it is the scheme default.
    std::string hostHeader() const;
    std::string toString() const;

    static std::optional<Url> Parse(const std::string& text, std::string* error);
};

} // namespace protocol
} // namespace relay
