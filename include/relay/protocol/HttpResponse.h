#pragma once

#include "relay/protocol/HttpHeaders.h"
#include "relay/network/Buffer.h"

#include <string>

namespace relay {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k100Continue = 100,
        k200Ok = 200,
        k204NoContent = 204,
        k304NotModified = 304,
        k400BadRequest = 400,
        k404NotFound = 404,
        k413PayloadTooLarge = 413,
        k415UnsupportedMediaType = 415,
        k431HeaderFieldsTooLarge = 431,
        k500InternalServerError = 500,
        k502BadGateway = 502,
        k503ServiceUnavailable = 503,
    };

    explicit HttpResponse(bool close = false)
        : statusCode_(kUnknown), closeConnection_(close) {}

    // Any three digit status is accepted; the reason phrase defaults from the code.
    void setStatusCode(int code) { statusCode_ = code; }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { setHeader("Content-Type", contentType); }

    // Appends, keeping earlier fields with the same name.
    void addHeader(const std::string& key, const std::string& value) {
        headers_.emplace_back(key, value);
    }
    // Replaces every field with this name.
    void setHeader(const std::string& key, const std::string& value) {
        RemoveHeader(&headers_, key);
        headers_.emplace_back(key, value);
    }
    void removeHeader(const std::string& key) { RemoveHeader(&headers_, key); }
    bool hasHeader(const std::string& key) const { return FindHeader(headers_, key) != nullptr; }
    std::string getHeader(const std::string& key) const {
        const std::string* v = FindHeader(headers_, key);
        return v ? *v : std::string();
    }
    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    // Complete message with Content-Length framing. headOnly keeps the
    // Content-Length of the body but leaves the body out (HEAD).
    void appendToBuffer(relay::network::Buffer* output, bool headOnly = false) const;
    // Status line and header block only. With chunked the body follows as
    // chunks, otherwise it is delimited by closing the connection.
    void appendHeadToBuffer(relay::network::Buffer* output, bool chunked) const;

    static const char* ReasonPhrase(int code);
    static bool StatusHasNoBody(int code) {
        return (code >= 100 && code < 200) || code == 204 || code == 304;
    }

private:
    void appendStatusAndHeaders(relay::network::Buffer* output) const;

    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    HeaderList headers_;
    std::string body_;
};

} // namespace protocol
} // namespace relay
