#include "relay/ForwardingHandler.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/upstream/ByteStream.h"
#include "relay/common/Logger.h"
#include <zlib.h>
#include <cassert>
#include <cstring>
#include <json/json.h>
#include <memory>
#include <string>

using namespace relay;
using namespace relay::protocol;
using namespace relay::upstream;
using namespace relay::common;

static HttpRequest jsonPost(const std::string& body, const std::string& type = "application/json") {
    HttpRequest req;
    const char method[] = "POST";
    req.setMethod(method, method + 4);
    if (!type.empty()) req.setHeader("Content-Type", type);
    req.setBody(body);
    return req;
}

static const size_t kLimit = 1024 * 1024;

static std::string pack(const std::string& input, int windowBits) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    assert(deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) == Z_OK);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());
    std::string out(input.size() + 64, '\0');
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());
    assert(deflate(&zs, Z_FINISH) == Z_STREAM_END);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

static Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value v;
    std::string errs;
    assert(reader->parse(text.data(), text.data() + text.size(), &v, &errs));
    return v;
}

void testWantsStream() {
    HeaderMap h;
    assert(!ForwardingHandler::WantsStream(h));
    h["Accept"] = "application/json";
    assert(!ForwardingHandler::WantsStream(h));
    h["Accept"] = "application/json, text/event-stream";
    assert(ForwardingHandler::WantsStream(h));
    h.clear();
    h["accept"] = "text/event-stream";
    assert(ForwardingHandler::WantsStream(h));
    LOG_INFO << "Wants Stream PASS";
}

void testPrepareBody() {
    std::string body;
    HttpResponse reject;

    assert(ForwardingHandler::PrepareBody(jsonPost("{\"model\":\"sonar\",\"stream\":true}"), kLimit, &body, &reject));
    assert(body == "{\"model\":\"sonar\",\"stream\":true}");

    assert(ForwardingHandler::PrepareBody(jsonPost("[1,2]", "Application/JSON; charset=utf-8"), kLimit, &body, &reject));
    assert(body == "[1,2]");

    // Not JSON by content type, or nothing sent: forwarded as an empty object.
    assert(ForwardingHandler::PrepareBody(jsonPost("hello", "text/plain"), kLimit, &body, &reject));
    assert(body == "{}");
    assert(ForwardingHandler::PrepareBody(jsonPost("hello", ""), kLimit, &body, &reject));
    assert(body == "{}");
    assert(ForwardingHandler::PrepareBody(jsonPost(""), kLimit, &body, &reject));
    assert(body == "{}");

    {
        HttpResponse r;
        assert(!ForwardingHandler::PrepareBody(jsonPost("{\"model\":"), kLimit, &body, &r));
        assert(r.statusCode() == 400);
        Json::Value v = parse(r.body());
        assert(v["error"].asString() == "Invalid JSON body");
        assert(!v["detail"].asString().empty());
    }
    {
        HttpResponse r;
        assert(!ForwardingHandler::PrepareBody(jsonPost("\"just a string\""), kLimit, &body, &r));
        assert(r.statusCode() == 400);
    }
    LOG_INFO << "Prepare Body PASS";
}

void testCompressedBody() {
    const std::string json = "{\"model\":\"sonar\",\"n\":[1,2,3]}";
    std::string body;
    {
        HttpRequest req = jsonPost(pack(json, 16 + MAX_WBITS));
        req.setHeader("Content-Encoding", "gzip");
        HttpResponse r;
        assert(ForwardingHandler::PrepareBody(req, kLimit, &body, &r));
        assert(body == json);
    }
    {
        HttpRequest req = jsonPost(pack(json, MAX_WBITS));
        req.setHeader("Content-Encoding", "Deflate");
        HttpResponse r;
        assert(ForwardingHandler::PrepareBody(req, kLimit, &body, &r));
        assert(body == json);
    }
    {
        // Still strict once inflated.
        HttpRequest req = jsonPost(pack("\"text\"", 16 + MAX_WBITS));
        req.setHeader("Content-Encoding", "gzip");
        HttpResponse r;
        assert(!ForwardingHandler::PrepareBody(req, kLimit, &body, &r));
        assert(r.statusCode() == 400);
    }
    {
        HttpRequest req = jsonPost("\x1f\x8b garbage");
        req.setHeader("Content-Encoding", "gzip");
        HttpResponse r;
        assert(!ForwardingHandler::PrepareBody(req, kLimit, &body, &r));
        assert(r.statusCode() == 400);
        Json::Value v = parse(r.body());
        assert(v["error"].asString() == "Invalid JSON body");
    }
    {
        // Limit applies to the inflated size.
        const std::string big = "[\"" + std::string(4096, 'a') + "\"]";
        HttpRequest req = jsonPost(pack(big, 16 + MAX_WBITS));
        req.setHeader("Content-Encoding", "gzip");
        HttpResponse r;
        assert(req.body().size() < 1024);
        assert(!ForwardingHandler::PrepareBody(req, 1024, &body, &r));
        assert(r.statusCode() == 413);
    }
    {
        HttpRequest req = jsonPost("{}");
        req.setHeader("Content-Encoding", "br");
        HttpResponse r;
        assert(!ForwardingHandler::PrepareBody(req, kLimit, &body, &r));
        assert(r.statusCode() == 415);
        Json::Value v = parse(r.body());
        assert(v["error"].asString() == "Unsupported Content-Encoding");
        assert(v["detail"].asString() == "br");

        req.setHeader("Content-Encoding", "identity");
        assert(ForwardingHandler::PrepareBody(req, kLimit, &body, &r));
        assert(body == "{}");
    }
    LOG_INFO << "Compressed Request Body PASS";
}

void testErrorResponse() {
    {
        UpstreamError err;
        err.message = "connect ECONNREFUSED 127.0.0.1:9";
        HttpResponse r = ForwardingHandler::MakeErrorResponse(err);
        assert(r.statusCode() == 502);
        assert(r.getHeader("Content-Type") == "application/json; charset=utf-8");
        Json::Value v = parse(r.body());
        assert(v["error"].asString() == "Upstream request failed");
        assert(v["detail"].asString() == "connect ECONNREFUSED 127.0.0.1:9");
    }
    {
        UpstreamError err;
        err.message = "socket hang up";
        err.status = 429;
        err.payload = "{\"error\":{\"message\":\"rate limited\"}}";
        HttpResponse r = ForwardingHandler::MakeErrorResponse(err);
        assert(r.statusCode() == 429);
        assert(r.body() == *err.payload);
    }
    {
        UpstreamError err;
        err.message = "socket hang up";
        err.status = 500;
        err.payload = "Internal <b>Server</b> Error";
        HttpResponse r = ForwardingHandler::MakeErrorResponse(err);
        assert(r.statusCode() == 500);
        assert(parse(r.body()).asString() == "Internal <b>Server</b> Error");
    }
    assert(ForwardingHandler::JsonError("Server shutting down", "") == "{\"error\":\"Server shutting down\"}");
    LOG_INFO << "Error Response PASS";
}

void testBufferedResponse() {
    UpstreamHead head;
    head.status = 200;
    head.headers = {{"Content-Type", "application/json"},
                    {"Content-Length", "11"},
                    {"Connection", "keep-alive"},
                    {"X-Request-Id", "abc"}};
    {
        // Key order, number form and UTF-8 survive untouched.
        const std::string text = "{\"temperature\":0.1,\"name\":\"caf\xc3\xa9\",\"a\": [1, 2.50]}";
        HttpResponse r = ForwardingHandler::MakeBufferedResponse(head, UpstreamBody(JsonBody{text}));
        assert(r.statusCode() == 200);
        assert(r.body() == text);
        assert(r.getHeader("Content-Type") == "application/json");
        assert(r.getHeader("X-Request-Id") == "abc");
        assert(!r.hasHeader("Connection"));
        assert(!r.hasHeader("Content-Length"));
    }
    {
        UpstreamHead bare;
        bare.status = 404;
        HttpResponse r = ForwardingHandler::MakeBufferedResponse(bare, UpstreamBody(std::string("not here")));
        assert(r.statusCode() == 404);
        assert(r.body() == "not here");
        assert(r.getHeader("Content-Type") == "text/html; charset=utf-8");

        // JSON scalars are raw text and keep their upstream bytes.
        HttpResponse scalar = ForwardingHandler::MakeBufferedResponse(bare, UpstreamBody(std::string("\"abc\"")));
        assert(scalar.body() == "\"abc\"");
        assert(scalar.getHeader("Content-Type") == "text/html; charset=utf-8");
        scalar = ForwardingHandler::MakeBufferedResponse(bare, UpstreamBody(std::string("null")));
        assert(scalar.body() == "null");

        HttpResponse empty = ForwardingHandler::MakeBufferedResponse(bare, UpstreamBody(std::string()));
        assert(empty.body().empty());
        assert(!empty.hasHeader("Content-Type"));
    }
    {
        UpstreamHead bare;
        bare.status = 201;
        HttpResponse r = ForwardingHandler::MakeBufferedResponse(bare, UpstreamBody(JsonBody{"[1]"}));
        assert(r.body() == "[1]");
        assert(r.getHeader("Content-Type") == "application/json; charset=utf-8");
    }
    {
        HttpResponse r = ForwardingHandler::MakeBufferedResponse(
            head, UpstreamBody(std::make_shared<ByteStream>()));
        assert(r.statusCode() == 502);
    }
    LOG_INFO << "Buffered Response PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testWantsStream();
    testPrepareBody();
    testCompressedBody();
    testErrorResponse();
    testBufferedResponse();
    return 0;
}
