#pragma once

#include "relay/protocol/HttpHeaders.h"

#include <string>

namespace relay {

// Header rules for both legs of a forwarded exchange. All functions are pure.
class HeaderSanitizer {
public:
    // Inbound -> upstream. Strips hop-by-hop and transport fields, forces
    // content-type to application/json and passes the caller's authorization
    // through verbatim (empty when absent). Idempotent.
    static relay::protocol::HeaderMap Sanitize(const relay::protocol::HeaderMap& incoming);

    // Upstream -> caller. Drops transfer-encoding, content-length and connection.
    static relay::protocol::HeaderList FilterResponseHeaders(const relay::protocol::HeaderList& upstream);

    static bool IsStripped(const std::string& name);
    static bool IsSensitive(const std::string& name);

    // Value safe for the log: credentials keep their scheme word, the secret becomes ***.
    static std::string Redact(const std::string& name, const std::string& value);
    // "name: value; name: value" with every sensitive value redacted.
    static std::string FormatForLog(const relay::protocol::HeaderMap& headers);
};

} // namespace relay
