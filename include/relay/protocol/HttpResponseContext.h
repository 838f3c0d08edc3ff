#pragma once

#include "relay/protocol/HttpHeaders.h"

#include <cstddef>
#include <functional>
#include <string>

namespace relay {
namespace protocol {

// Incremental HTTP/1.x response parser for the upstream side.
// - Supports Content-Length, Transfer-Encoding: chunked and close-delimited bodies.
// - Interim 1xx responses are skipped.
// - Body bytes are handed out de-chunked, through the body callback when one
//   is set, otherwise collected in body().
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectBody, kGotAll, kError };
    using BodyCallback = std::function<void(const char* data, size_t len)>;

    static const size_t kMaxHeaderBytes = 64 * 1024;

    void setBodyCallback(const BodyCallback& cb) { bodyCallback_ = cb; }

    // Returns false on a protocol error; error() describes it.
    bool feed(const char* data, size_t len);
    // The peer closed the connection. Returns true when that completes the
    // response (close-delimited body); a truncated message is an error.
    bool finishOnClose();

    bool headersComplete() const { return state_ == kExpectBody || state_ == kGotAll; }
    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    const std::string& error() const { return error_; }

    int statusCode() const { return statusCode_; }
    const std::string& reason() const { return reason_; }
    const HeaderList& headers() const { return headers_; }
    std::string getHeader(const std::string& name) const {
        const std::string* v = FindHeader(headers_, name);
        return v ? *v : std::string();
    }
    bool chunked() const { return chunked_; }
    bool closeDelimited() const { return needsCloseToFinish_; }
    const std::string& body() const { return body_; }

private:
    enum ChunkState { kChunkSize, kChunkData, kChunkDataEnd, kChunkTrailer };

    bool parseHeaderBlock(const std::string& headerBlock);
    bool consumeBody(const char* data, size_t len, size_t* consumed);
    bool consumeChunked(const char* data, size_t len, size_t* consumed);
    void emitBody(const char* data, size_t len);
    bool fail(const std::string& what);

    ParseState state_{kExpectStatusLine};
    std::string headerBuf_;

    int statusCode_{0};
    std::string reason_;
    HeaderList headers_;

    bool chunked_{false};
    size_t bodyRemaining_{0};
    bool needsCloseToFinish_{false};

    ChunkState chunkState_{kChunkSize};
    std::string chunkLineBuf_;
    size_t chunkRemaining_{0};

    BodyCallback bodyCallback_;
    std::string body_;
    std::string error_;
};

} // namespace protocol
} // namespace relay
