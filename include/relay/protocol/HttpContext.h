#pragma once

#include "relay/protocol/HttpRequest.h"
#include "relay/network/Buffer.h"

#include <chrono>

namespace relay {
namespace protocol {

// Incremental HTTP/1.x request parser working directly on the connection buffer.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static const size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpContext(size_t maxBodyBytes = 10 * 1024 * 1024)
        : state_(kExpectRequestLine), maxBodyBytes_(maxBodyBytes) {}

    // return false if some error; errorStatus() tells which response to send
    bool parseRequest(relay::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    bool headersDone() const { return state_ == kExpectBody || state_ == kGotAll; }
    int errorStatus() const { return errorStatus_; }

    // Set once the header block carried "Expect: 100-continue" and the body
    // is still outstanding. Cleared by the caller after answering.
    bool expectContinue() const { return expectContinue_; }
    void clearExpectContinue() { expectContinue_ = false; }

    void reset() {
        state_ = kExpectRequestLine;
        HttpRequest dummy;
        request_.swap(dummy);
        chunked_ = false;
        contentLength_ = 0;
        bodyRemaining_ = 0;
        chunkSize_ = 0;
        expectingChunkSize_ = true;
        headerBytes_ = 0;
        errorStatus_ = 0;
        expectContinue_ = false;
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool finishHeaders();
    bool fail(int status) { errorStatus_ = status; return false; }

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t maxBodyBytes_;

    // Body parsing state
    bool chunked_{false};
    size_t contentLength_{0};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
    size_t headerBytes_{0};
    int errorStatus_{0};
    bool expectContinue_{false};
};

} // namespace protocol
} // namespace relay
