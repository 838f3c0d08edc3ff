#pragma once

#include "relay/protocol/HttpHeaders.h"

#include <cstddef>
#include <functional>
#include <memory>

namespace relay {
namespace protocol {

class HttpResponse;

// Downstream side of one request/response exchange. A handler either calls
// Send() once, or BeginStream() followed by Write()s and End(). Abort()
// drops the connection, which the client sees as a truncated response.
//
// Must be used on the event loop thread of the connection it belongs to.
class ResponseWriter {
public:
    // completed is false when the client went away or the exchange was aborted.
    using CompletionCallback = std::function<void(bool completed)>;

    virtual ~ResponseWriter() = default;

    virtual void Send(const HttpResponse& response) = 0;

    // Headers that the transport owns (framing, connection management) and
    // headers with invalid names or values are dropped, not sent.
    virtual void BeginStream(int status, const HeaderList& headers) = 0;
    virtual void Write(const char* data, size_t len) = 0;
    virtual void End() = 0;
    virtual void Abort() = 0;

    virtual bool HeadersSent() const = 0;
    virtual bool IsOpen() const = 0;

    // Runs exactly once, after the last byte was queued or the exchange failed.
    virtual void SetCompletionCallback(CompletionCallback cb) = 0;

    // onBackpressure fires when unsent output passes the high water mark,
    // onDrain once it has been flushed afterwards.
    virtual void SetFlowControl(std::function<void()> onBackpressure, std::function<void()> onDrain) = 0;
};

using ResponseWriterPtr = std::shared_ptr<ResponseWriter>;

} // namespace protocol
} // namespace relay
