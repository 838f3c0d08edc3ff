#pragma once

#include "relay/protocol/HttpHeaders.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace relay {
namespace upstream {

class ByteStream;

// Chosen once per request before the call is issued; never changes afterwards.
enum class ResponseMode {
    kBuffered,
    kStream,
};

struct UpstreamRequest {
    relay::protocol::HeaderMap headers;
    std::string body;
    ResponseMode mode{ResponseMode::kBuffered};
};

struct UpstreamHead {
    int status{0};
    std::string reason;
    relay::protocol::HeaderList headers;
};

// Upstream text that parsed as a JSON object or array. Relayed byte for byte.
struct JsonBody {
    std::string text;
};

// Buffered JSON object or array | any other buffered body | live byte stream.
using UpstreamBody = std::variant<JsonBody, std::string, std::shared_ptr<ByteStream>>;

struct UpstreamResponse {
    UpstreamHead head;
    UpstreamBody body;
};

// Transport level failure. Upstream HTTP error statuses are not failures;
// status and payload are only set when the connection broke after an error
// response had started.
struct UpstreamError {
    std::string message;
    std::optional<int> status;
    std::optional<std::string> payload;
    bool timedOut{false};
};

struct UpstreamCallbacks {
    std::function<void(UpstreamResponse&&)> onResponse;
    std::function<void(const UpstreamError&)> onError;
};

} // namespace upstream
} // namespace relay
