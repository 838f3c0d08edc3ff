#include "relay/network/Buffer.h"
#include "relay/protocol/HttpContext.h"
#include "relay/common/Config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace relay {
namespace protocol {

const size_t HttpContext::kMaxHeaderBytes;

static bool ParseDecimal(const std::string& s, size_t* out) {
    if (s.empty()) return false;
    size_t v = 0;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
        const size_t next = v * 10 + (c - '0');
        if (next < v) return false;
        v = next;
    }
    *out = v;
    return true;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end) {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::finishHeaders() {
    chunked_ = false;
    contentLength_ = 0;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty()) {
        if (ToLowerCopy(te).find("chunked") == std::string::npos) {
            return fail(400);
        }
        chunked_ = true;
    } else if (request_.hasHeader("Content-Length")) {
        if (!ParseDecimal(request_.getHeader("Content-Length"), &contentLength_)) {
            return fail(400);
        }
        if (contentLength_ > maxBodyBytes_) {
            return fail(413);
        }
        bodyRemaining_ = contentLength_;
    }

    if (chunked_ || bodyRemaining_ > 0) {
        state_ = kExpectBody;
        if (request_.getVersion() == HttpRequest::kHttp11 &&
            IEquals(request_.getHeader("Expect"), "100-continue")) {
            expectContinue_ = true;
        }
    } else {
        state_ = kGotAll;
    }
    return true;
}

// return false if any error
bool HttpContext::parseRequest(relay::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    bool ok = true;
    bool hasMore = true;
    while (hasMore) {
        if (state_ == kExpectRequestLine) {
            const char* crlf = buf->FindCRLF();
            if (crlf) {
                ok = processRequestLine(buf->Peek(), crlf);
                if (ok) {
                    headerBytes_ = crlf + 2 - buf->Peek();
                    buf->RetrieveUntil(crlf + 2);
                    state_ = kExpectHeaders;
                } else {
                    ok = fail(400);
                    hasMore = false;
                }
            } else {
                if (buf->ReadableBytes() > kMaxHeaderBytes) ok = fail(431);
                hasMore = false;
            }
        } else if (state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (crlf) {
                headerBytes_ += crlf + 2 - buf->Peek();
                if (headerBytes_ > kMaxHeaderBytes) {
                    ok = fail(431);
                    break;
                }
                const char* colon = std::find(buf->Peek(), crlf, ':');
                if (colon != crlf) {
                    if (colon == buf->Peek() || !IsValidHeaderName(std::string(buf->Peek(), colon))) {
                        ok = fail(400);
                        break;
                    }
                    request_.addHeader(buf->Peek(), colon, crlf);
                } else if (crlf == buf->Peek()) {
                    // empty line, end of headers
                    buf->RetrieveUntil(crlf + 2);
                    if (!finishHeaders()) {
                        ok = false;
                        break;
                    }
                    hasMore = (state_ != kGotAll);
                    continue;
                } else {
                    ok = fail(400);
                    break;
                }
                buf->RetrieveUntil(crlf + 2);
            } else {
                if (headerBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) ok = fail(431);
                hasMore = false;
            }
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                // Parse chunk-size lines and chunk data.
                while (true) {
                    if (expectingChunkSize_) {
                        const char* crlf = buf->FindCRLF();
                        if (!crlf) {
                            hasMore = false;
                            break;
                        }
                        std::string line(buf->Peek(), crlf);
                        buf->RetrieveUntil(crlf + 2);

                        // Strip chunk extensions.
                        auto semi = line.find(';');
                        if (semi != std::string::npos) line = line.substr(0, semi);
                        line = relay::common::Config::Trim(line);

                        char* endp = nullptr;
                        const unsigned long long sz = std::strtoull(line.c_str(), &endp, 16);
                        if (line.empty() || endp != line.c_str() + line.size()) {
                            ok = fail(400);
                            hasMore = false;
                            break;
                        }
                        chunkSize_ = static_cast<size_t>(sz);
                        if (request_.body().size() + chunkSize_ > maxBodyBytes_) {
                            ok = fail(413);
                            hasMore = false;
                            break;
                        }
                        expectingChunkSize_ = false;
                    }

                    if (chunkSize_ == 0) {
                        // Trailer fields are dropped; wait for the terminating empty line.
                        while (true) {
                            const char* tl = buf->FindCRLF();
                            if (!tl) break;
                            const bool last = (tl == buf->Peek());
                            buf->RetrieveUntil(tl + 2);
                            if (last) {
                                state_ = kGotAll;
                                break;
                            }
                        }
                        hasMore = false;
                        break;
                    }

                    // Need chunkSize_ bytes + CRLF.
                    if (buf->ReadableBytes() < chunkSize_ + 2) {
                        hasMore = false;
                        break;
                    }
                    request_.appendBody(buf->Peek(), chunkSize_);
                    buf->Retrieve(chunkSize_);
                    const char* p = buf->Peek();
                    if (p[0] != '\r' || p[1] != '\n') {
                        ok = fail(400);
                        hasMore = false;
                        break;
                    }
                    buf->Retrieve(2);
                    expectingChunkSize_ = true;
                }
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    buf->Retrieve(n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ == 0) {
                    state_ = kGotAll;
                }
                hasMore = false;
            }
        } else {
            hasMore = false;
        }
    }
    return ok;
}

} // namespace protocol
} // namespace relay
