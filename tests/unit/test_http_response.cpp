#include "relay/protocol/HttpResponseContext.h"
#include "relay/common/Logger.h"
#include <cassert>
#include <string>

using namespace relay::protocol;
using namespace relay::common;

static bool feed(HttpResponseContext& ctx, const std::string& s) {
    return ctx.feed(s.data(), s.size());
}

void testContentLength() {
    HttpResponseContext ctx;
    assert(feed(ctx, "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Le"));
    assert(!ctx.headersComplete());
    assert(feed(ctx, "ngth: 11\r\n\r\n{\"ok\":"));
    assert(ctx.headersComplete());
    assert(!ctx.gotAll());
    assert(feed(ctx, "true}"));
    assert(ctx.gotAll());
    assert(ctx.statusCode() == 200);
    assert(ctx.reason() == "OK");
    assert(ctx.getHeader("content-type") == "application/json");
    assert(ctx.body() == "{\"ok\":true}");
    LOG_INFO << "Content-Length Response PASS";
}

void testChunkedWithCallback() {
    HttpResponseContext ctx;
    std::string seen;
    int calls = 0;
    ctx.setBodyCallback([&](const char* d, size_t n) {
        seen.append(d, n);
        ++calls;
    });
    assert(feed(ctx, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"));
    assert(feed(ctx, "9\r\ndata: a\n\n\r\n"));
    assert(seen == "data: a\n\n");
    // Split inside the size line and inside the data.
    assert(feed(ctx, "9"));
    assert(feed(ctx, "\r\ndata:"));
    assert(feed(ctx, " b\n\n\r\n0\r\nX-Checksum: 1\r\n\r\n"));
    assert(ctx.gotAll());
    assert(seen == "data: a\n\ndata: b\n\n");
    assert(calls >= 3);
    assert(ctx.body().empty());
    assert(ctx.chunked());
    LOG_INFO << "Chunked Response PASS";
}

void testInterimResponseSkipped() {
    HttpResponseContext ctx;
    assert(feed(ctx, "HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 404 Not Found\r\nContent-Length: 2\r\n\r\n{}"));
    assert(ctx.gotAll());
    assert(ctx.statusCode() == 404);
    assert(ctx.body() == "{}");
    LOG_INFO << "Interim Response PASS";
}

void testBodilessAndCloseDelimited() {
    {
        HttpResponseContext ctx;
        assert(feed(ctx, "HTTP/1.1 204 No Content\r\nX-A: 1\r\n\r\n"));
        assert(ctx.gotAll());
        assert(ctx.body().empty());
    }
    {
        HttpResponseContext ctx;
        assert(feed(ctx, "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"));
        assert(ctx.gotAll());
    }
    {
        HttpResponseContext ctx;
        assert(feed(ctx, "HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nsome"));
        assert(feed(ctx, " text"));
        assert(!ctx.gotAll());
        assert(ctx.closeDelimited());
        assert(ctx.finishOnClose());
        assert(ctx.gotAll());
        assert(ctx.body() == "some text");
    }
    {
        HttpResponseContext ctx;
        assert(feed(ctx, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort"));
        assert(!ctx.finishOnClose());
    }
    LOG_INFO << "Bodiless And Close-Delimited PASS";
}

void testParseErrors() {
    {
        HttpResponseContext ctx;
        assert(!feed(ctx, "SMTP ready\r\n\r\n"));
        assert(ctx.hasError());
        assert(ctx.error().find("Parse Error:") == 0);
    }
    {
        HttpResponseContext ctx;
        assert(!feed(ctx, "HTTP/1.1 200 OK\r\nContent-Length: 5, 6\r\n\r\n"));
    }
    {
        HttpResponseContext ctx;
        assert(feed(ctx, "HTTP/1.1 200 OK\r\nContent-Length: 3, 3\r\n\r\nabc"));
        assert(ctx.gotAll());
    }
    {
        HttpResponseContext ctx;
        assert(!feed(ctx, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"));
        assert(ctx.error() == "Parse Error: Invalid character in chunk size");
        // Sticky after the first error.
        assert(!feed(ctx, "0\r\n\r\n"));
    }
    LOG_INFO << "Parse Errors PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testContentLength();
    testChunkedWithCallback();
    testInterimResponseSkipped();
    testBodilessAndCloseDelimited();
    testParseErrors();
    return 0;
}
