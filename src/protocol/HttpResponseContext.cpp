#include "relay/protocol/HttpResponseContext.h"
#include "relay/common/Config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace relay {
namespace protocol {

const size_t HttpResponseContext::kMaxHeaderBytes;

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

bool HttpResponseContext::fail(const std::string& what) {
    state_ = kError;
    error_ = "Parse Error: " + what;
    return false;
}

void HttpResponseContext::emitBody(const char* data, size_t len) {
    if (len == 0) return;
    if (bodyCallback_) {
        bodyCallback_(data, len);
    } else {
        body_.append(data, len);
    }
}

bool HttpResponseContext::parseHeaderBlock(const std::string& headerBlock) {
    headers_.clear();
    reason_.clear();

    size_t lineEnd = headerBlock.find("\r\n");
    const std::string statusLine = headerBlock.substr(0, lineEnd);
    size_t pos = lineEnd + 2;

    // HTTP/1.1 200 OK
    if (statusLine.rfind("HTTP/1.", 0) != 0 || statusLine.size() < 12 || statusLine[8] != ' ') {
        return fail("Invalid status line");
    }
    const std::string code = statusLine.substr(9, 3);
    if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return fail("Invalid status code");
    }
    statusCode_ = std::atoi(code.c_str());
    if (statusLine.size() > 12) {
        if (statusLine[12] != ' ') return fail("Invalid status line");
        reason_ = statusLine.substr(13);
    }

    while (pos < headerBlock.size()) {
        const size_t next = headerBlock.find("\r\n", pos);
        if (next == std::string::npos || next == pos) break;
        const std::string line = headerBlock.substr(pos, next - pos);
        pos = next + 2;

        if (line[0] == ' ' || line[0] == '\t') {
            // obsolete line folding
            if (headers_.empty()) return fail("Invalid header value char");
            headers_.back().second += " " + relay::common::Config::Trim(line);
            continue;
        }
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return fail("Invalid header token");
        }
        std::string key = line.substr(0, colon);
        std::string val = line.substr(colon + 1);
        while (!val.empty() && (val.front() == ' ' || val.front() == '\t')) val.erase(val.begin());
        while (!val.empty() && (val.back() == ' ' || val.back() == '\t')) val.pop_back();
        headers_.emplace_back(std::move(key), std::move(val));
    }

    chunked_ = false;
    needsCloseToFinish_ = false;
    bodyRemaining_ = 0;

    if (statusCode_ == 204 || statusCode_ == 304 || (statusCode_ >= 100 && statusCode_ < 200)) {
        state_ = kGotAll;
        return true;
    }

    const std::string te = getHeader("Transfer-Encoding");
    const std::string* cl = FindHeader(headers_, "Content-Length");
    if (!te.empty() && ToLowerCopy(te).find("chunked") != std::string::npos) {
        chunked_ = true;
        chunkState_ = kChunkSize;
        state_ = kExpectBody;
    } else if (cl) {
        // "5, 5" is tolerated when every element agrees.
        std::string first;
        size_t start = 0;
        while (start <= cl->size()) {
            size_t comma = cl->find(',', start);
            if (comma == std::string::npos) comma = cl->size();
            const std::string part = relay::common::Config::Trim(cl->substr(start, comma - start));
            if (first.empty()) {
                first = part;
            } else if (part != first) {
                return fail("Invalid Content-Length");
            }
            start = comma + 1;
        }
        if (!ParseDecimal(first, &bodyRemaining_)) {
            return fail("Invalid Content-Length");
        }
        state_ = bodyRemaining_ == 0 ? kGotAll : kExpectBody;
    } else {
        needsCloseToFinish_ = true;
        state_ = kExpectBody;
    }
    return true;
}

bool HttpResponseContext::consumeChunked(const char* data, size_t len, size_t* consumed) {
    *consumed = 0;
    while (*consumed < len && state_ == kExpectBody) {
        const char* p = data + *consumed;
        const size_t avail = len - *consumed;

        if (chunkState_ == kChunkSize || chunkState_ == kChunkTrailer) {
            const char* lf = static_cast<const char*>(std::memchr(p, '\n', avail));
            if (!lf) {
                chunkLineBuf_.append(p, avail);
                *consumed = len;
                if (chunkLineBuf_.size() > 8192) return fail("Chunk line too long");
                return true;
            }
            chunkLineBuf_.append(p, lf - p);
            *consumed += (lf - p) + 1;
            std::string line;
            line.swap(chunkLineBuf_);
            if (!line.empty() && line.back() == '\r') line.pop_back();

            if (chunkState_ == kChunkTrailer) {
                // Trailer fields are not relayed.
                if (line.empty()) state_ = kGotAll;
                continue;
            }

            const size_t semi = line.find(';');
            if (semi != std::string::npos) line = line.substr(0, semi);
            line = relay::common::Config::Trim(line);
            char* endp = nullptr;
            const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
            if (line.empty() || endp != line.c_str() + line.size()) {
                return fail("Invalid character in chunk size");
            }
            chunkRemaining_ = static_cast<size_t>(n);
            chunkState_ = chunkRemaining_ == 0 ? kChunkTrailer : kChunkData;
            continue;
        }

        if (chunkState_ == kChunkData) {
            const size_t take = std::min(chunkRemaining_, avail);
            emitBody(p, take);
            chunkRemaining_ -= take;
            *consumed += take;
            if (chunkRemaining_ == 0) {
                chunkState_ = kChunkDataEnd;
            }
            continue;
        }

        // kChunkDataEnd: CRLF after chunk data
        if (chunkLineBuf_.empty() && p[0] == '\r') {
            chunkLineBuf_.push_back('\r');
            *consumed += 1;
            continue;
        }
        if (p[0] != '\n') {
            return fail("Expected LF after chunk data");
        }
        chunkLineBuf_.clear();
        *consumed += 1;
        chunkState_ = kChunkSize;
    }
    return true;
}

bool HttpResponseContext::consumeBody(const char* data, size_t len, size_t* consumed) {
    if (chunked_) {
        return consumeChunked(data, len, consumed);
    }
    if (needsCloseToFinish_) {
        emitBody(data, len);
        *consumed = len;
        return true;
    }
    const size_t take = std::min(bodyRemaining_, len);
    emitBody(data, take);
    bodyRemaining_ -= take;
    *consumed = take;
    if (bodyRemaining_ == 0) state_ = kGotAll;
    return true;
}

bool HttpResponseContext::feed(const char* data, size_t len) {
    if (state_ == kError) return false;
    if (state_ == kGotAll || !data || len == 0) return true;

    if (state_ == kExpectStatusLine) {
        // Accumulate until CRLFCRLF.
        const size_t searchFrom = headerBuf_.size() >= 3 ? headerBuf_.size() - 3 : 0;
        headerBuf_.append(data, len);
        const size_t hdrPos = headerBuf_.find("\r\n\r\n", searchFrom);
        if (hdrPos == std::string::npos) {
            if (headerBuf_.size() > kMaxHeaderBytes) return fail("Header overflow");
            return true;
        }
        const size_t headerEnd = hdrPos + 4;
        const std::string headerBlock = headerBuf_.substr(0, headerEnd);
        const std::string rest = headerBuf_.substr(headerEnd);
        headerBuf_.clear();

        if (!parseHeaderBlock(headerBlock)) return false;

        if (statusCode_ >= 100 && statusCode_ < 200) {
            // Interim response; the final one follows.
            state_ = kExpectStatusLine;
            headers_.clear();
            return rest.empty() ? true : feed(rest.data(), rest.size());
        }
        if (state_ == kExpectBody && !rest.empty()) {
            size_t consumed = 0;
            return consumeBody(rest.data(), rest.size(), &consumed);
        }
        return true;
    }

    // extra bytes after the message are ignored; the connection is not reused
    size_t consumed = 0;
    return consumeBody(data, len, &consumed);
}

bool HttpResponseContext::finishOnClose() {
    if (state_ == kGotAll) return true;
    if (state_ == kExpectBody && needsCloseToFinish_) {
        state_ = kGotAll;
        return true;
    }
    return false;
}

} // namespace protocol
} // namespace relay
