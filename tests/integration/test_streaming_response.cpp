#include "RelayHarness.h"

#include "relay/RelayServer.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <signal.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>

using namespace relaytest;
using namespace relay;
using namespace relay::network;
using namespace relay::common;

static const char* const kSseHead =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: text/event-stream\r\n"
    "Cache-Control: no-cache\r\n"
    "Transfer-Encoding: chunked\r\n"
    "\r\n";

static std::string chunk(const std::string& s) {
    char size[16];
    snprintf(size, sizeof size, "%zx\r\n", s.size());
    return size + s + "\r\n";
}

// Set by the client once the first event reached it.
static std::atomic<bool> g_firstEventSeen{false};

static void upstreamScript(int fd, const CapturedRequest& req) {
    if (req.body.find("\"case\":\"ok\"") != std::string::npos) {
        sendAll(fd, kSseHead);
        sendAll(fd, chunk("data: a\n\n"));
        // The second event only goes out after the first one was relayed.
        for (int i = 0; i < 200 && !g_firstEventSeen; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        sendAll(fd, chunk("data: b\n\n"));
        sendAll(fd, "0\r\n\r\n");
    } else if (req.body.find("\"case\":\"fail-early\"") != std::string::npos) {
        sendAll(fd, kSseHead);
    } else if (req.body.find("\"case\":\"fail-late\"") != std::string::npos) {
        sendAll(fd, kSseHead);
        sendAll(fd, chunk("data: a\n\n"));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    } else if (req.body.find("\"case\":\"empty\"") != std::string::npos) {
        sendAll(fd, "HTTP/1.1 204 No Content\r\nX-Empty: 1\r\n\r\n");
    } else {
        sendAll(fd, "HTTP/1.1 429 Too Many Requests\r\nContent-Type: application/json\r\n"
                    "Content-Length: 22\r\n\r\n{\"error\":\"slow down!\"}");
    }
}

static const char* const kAcceptSse = "Accept: text/event-stream\r\n";

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    ::signal(SIGPIPE, SIG_IGN);

    ScriptedUpstream upstream(upstreamScript);
    EventLoop loop;
    RelayServer server(&loop, makeConfig(upstreamUrl(upstream.port())));
    std::string err;
    assert(server.Start(&err));
    const uint16_t port = server.listenAddress().toPort();

    std::thread client([&]() {
        {
            int fd = connectTo(port);
            assert(fd >= 0);
            sendAll(fd, proxyPost("{\"case\":\"ok\",\"stream\":true}", kAcceptSse));
            std::string raw;
            assert(recvUntil(fd, "data: a\n\n", &raw));
            assert(raw.find("data: b") == std::string::npos);
            g_firstEventSeen = true;
            raw += recvUntilClose(fd);
            ::close(fd);

            ClientResponse r = parseResponse(raw);
            assert(r.status == 200);
            assert(r.complete);
            assert(r.body == "data: a\n\ndata: b\n\n");
            assert(r.head.find("content-type: text/event-stream") != std::string::npos);
            assert(r.head.find("cache-control: no-cache") != std::string::npos);
            assert(r.head.find("transfer-encoding: chunked") != std::string::npos);

            const std::string& upHead = upstream.requests().back().head;
            assert(upHead.find("accept: text/event-stream") != std::string::npos);
            LOG_INFO << "Stream Relayed In Order PASS";
        }
        {
            ClientResponse r = roundTrip(port, proxyPost("{\"case\":\"fail-early\"}", kAcceptSse));
            assert(r.status == 502);
            assert(r.body.find("stream error: ") == 0);
            assert(r.head.find("content-type: text/plain; charset=utf-8") != std::string::npos);
            LOG_INFO << "Stream Failed Before Data PASS";
        }
        {
            ClientResponse r = roundTrip(port, proxyPost("{\"case\":\"fail-late\"}", kAcceptSse));
            assert(r.status == 200);
            assert(r.body == "data: a\n\n");
            assert(!r.complete);
            LOG_INFO << "Stream Failed After Data PASS";
        }
        {
            ClientResponse r = roundTrip(port, proxyPost("{\"case\":\"empty\"}", kAcceptSse));
            assert(r.status == 204);
            assert(r.body.empty());
            assert(r.head.find("x-empty: 1") != std::string::npos);
            LOG_INFO << "Bodiless Stream Answer PASS";
        }
        {
            ClientResponse r = roundTrip(port, proxyPost("{\"case\":\"limited\"}", kAcceptSse));
            assert(r.status == 429);
            assert(r.body == "{\"error\":\"slow down!\"}");
            LOG_INFO << "Stream Error Status Relayed PASS";
        }
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.RunAfter(30.0, [&]() { assert(false && "streaming test timed out"); });
    loop.Loop();
    client.join();
    assert(server.inflight() == 0);
    return 0;
}
