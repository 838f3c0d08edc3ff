#include "relay/HeaderSanitizer.h"
#include "relay/common/Logger.h"
#include <cassert>
#include <string>

using namespace relay;
using namespace relay::protocol;
using namespace relay::common;

void testStripsTransportHeaders() {
    HeaderMap in;
    in["Host"] = "localhost:3000";
    in["Connection"] = "keep-alive";
    in["Keep-Alive"] = "timeout=5";
    in["Transfer-Encoding"] = "chunked";
    in["Content-Length"] = "42";
    in["Content-Type"] = "text/plain";
    in["TE"] = "trailers";
    in["Upgrade"] = "websocket";
    in["Proxy-Authorization"] = "Basic abc";
    in["Accept"] = "text/event-stream";
    in["X-Request-Id"] = "r-1";

    HeaderMap out = HeaderSanitizer::Sanitize(in);
    assert(out.size() == 4);
    assert(out.at("accept") == "text/event-stream");
    assert(out.at("x-request-id") == "r-1");
    assert(out.at("content-type") == "application/json");
    // Always present, empty when the caller sent none.
    assert(out.count("authorization") == 1);
    assert(out.at("authorization").empty());
    assert(out.count("host") == 0);
    assert(out.count("proxy-authorization") == 0);
    LOG_INFO << "Strip Transport Headers PASS";
}

void testAuthorizationPassThrough() {
    HeaderMap in;
    in["authorization"] = "Bearer pplx-secret";
    in["CONTENT-TYPE"] = "application/json; charset=utf-8";
    HeaderMap out = HeaderSanitizer::Sanitize(in);
    assert(out.at("Authorization") == "Bearer pplx-secret");
    assert(out.at("Content-Type") == "application/json");
    assert(HeaderSanitizer::Sanitize(out) == out);
    LOG_INFO << "Authorization Pass-Through PASS";
}

void testResponseFilter() {
    HeaderList up = {
        {"Content-Type", "application/json"},
        {"Transfer-Encoding", "chunked"},
        {"Set-Cookie", "a=1"},
        {"content-length", "12"},
        {"Set-Cookie", "b=2"},
        {"Connection", "close"},
        {"X-RateLimit-Remaining", "9"},
    };
    HeaderList out = HeaderSanitizer::FilterResponseHeaders(up);
    assert(out.size() == 4);
    assert(out[0].first == "Content-Type");
    assert(out[1].second == "a=1");
    assert(out[2].second == "b=2");
    assert(out[3].first == "X-RateLimit-Remaining");
    assert(!FindHeader(out, "connection"));
    LOG_INFO << "Response Filter PASS";
}

void testRedaction() {
    assert(HeaderSanitizer::Redact("Authorization", "Bearer pplx-secret") == "Bearer ***");
    assert(HeaderSanitizer::Redact("authorization", "pplx-secret") == "***");
    assert(HeaderSanitizer::Redact("X-Api-Key", "k") == "***");
    assert(HeaderSanitizer::Redact("authorization", "").empty());
    assert(HeaderSanitizer::Redact("Accept", "text/event-stream") == "text/event-stream");

    HeaderMap h;
    h["authorization"] = "Bearer pplx-secret";
    h["accept"] = "*/*";
    const std::string line = HeaderSanitizer::FormatForLog(h);
    assert(line == "accept: */*; authorization: Bearer ***");
    assert(line.find("pplx-secret") == std::string::npos);
    LOG_INFO << "Redaction PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testStripsTransportHeaders();
    testAuthorizationPassThrough();
    testResponseFilter();
    testRedaction();
    return 0;
}
