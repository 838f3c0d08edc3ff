#include "relay/protocol/Url.h"
#include "relay/protocol/HttpHeaders.h"

#include <cctype>

namespace relay {
namespace protocol {

static std::optional<Url> Reject(std::string* error, const std::string& why) {
    if (error) *error = why;
    return std::nullopt;
}

std::optional<Url> Url::Parse(const std::string& text, std::string* error) {
    Url u;
    const size_t sep = text.find("://");
    if (sep == std::string::npos) {
        return Reject(error, "missing scheme in URL '" + text + "'");
    }
    u.scheme = ToLowerCopy(text.substr(0, sep));
    if (u.scheme == "http") {
        u.port = 80;
    } else if (u.scheme == "https") {
        u.port = 443;
    } else {
        return Reject(error, "unsupported URL scheme '" + u.scheme + "'");
    }

    std::string rest = text.substr(sep + 3);
    const size_t pathStart = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, pathStart);
    if (pathStart != std::string::npos) {
        std::string target = rest.substr(pathStart);
        const size_t hash = target.find('#');
        if (hash != std::string::npos) target.erase(hash);
        if (target.empty() || target[0] == '?') target.insert(0, "/");
        u.target = target;
    }

    if (authority.find('@') != std::string::npos) {
        return Reject(error, "credentials in URL are not supported");
    }

    std::string portText;
    if (!authority.empty() && authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            return Reject(error, "unterminated IPv6 literal in URL");
        }
        u.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return Reject(error, "invalid authority in URL");
            portText = authority.substr(close + 2);
        }
    } else {
        const size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            u.host = authority.substr(0, colon);
            portText = authority.substr(colon + 1);
        } else {
            u.host = authority;
        }
        u.host = ToLowerCopy(u.host);
    }
    if (u.host.empty()) {
        return Reject(error, "missing host in URL '" + text + "'");
    }

    if (!portText.empty()) {
        long p = 0;
        for (unsigned char c : portText) {
            if (!std::isdigit(c) || p > 65535) return Reject(error, "invalid port in URL");
            p = p * 10 + (c - '0');
        }
        if (p <= 0 || p > 65535) return Reject(error, "invalid port in URL");
        u.port = static_cast<uint16_t>(p);
        u.explicitPort = true;
    }
    return u;
}

std::string Url::hostHeader() const {
    const bool v6 = host.find(':') != std::string::npos;
    std::string h = v6 ? "[" + host + "]" : host;
    const uint16_t defaultPort = tls() ? 443 : 80;
    if (port != defaultPort) {
        h += ":" + std::to_string(port);
    }
    return h;
}

std::string Url::toString() const {
    return scheme + "://" + hostHeader() + target;
}

} // namespace protocol
} // namespace relay
