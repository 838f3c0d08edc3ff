#include "RelayHarness.h"

#include "relay/RelayServer.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <signal.h>

#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <json/json.h>

using namespace relaytest;
using namespace relay;
using namespace relay::network;
using namespace relay::common;

static Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value v;
    std::string errs;
    assert(reader->parse(text.data(), text.data() + text.size(), &v, &errs));
    return v;
}

static uint16_t deadPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    ::close(fd);
    return ntohs(addr.sin_port);
}

// Runs fn on a client thread against a relay pointed at targetUrl.
template <typename Fn>
static void withRelay(const std::string& targetUrl, const std::map<std::string, std::string>& extra, Fn fn) {
    EventLoop loop;
    RelayServer server(&loop, makeConfig(targetUrl, extra));
    std::string err;
    assert(server.Start(&err));
    const uint16_t port = server.listenAddress().toPort();
    std::thread client([&]() {
        fn(port);
        loop.QueueInLoop([&]() { loop.Quit(); });
    });
    loop.RunAfter(30.0, [&]() { assert(false && "upstream failure test timed out"); });
    loop.Loop();
    client.join();
    assert(server.inflight() == 0);
}

void testConnectionRefused() {
    const uint16_t dead = deadPort();
    withRelay(upstreamUrl(dead), {}, [dead](uint16_t port) {
        ClientResponse r = roundTrip(port, proxyPost("{\"model\":\"sonar\"}"));
        assert(r.status == 502);
        assert(r.head.find("content-type: application/json") != std::string::npos);
        Json::Value v = parseJson(r.body);
        assert(v["error"].asString() == "Upstream request failed");
        assert(v["detail"].asString() == "connect ECONNREFUSED 127.0.0.1:" + std::to_string(dead));

        // Stream mode fails the same way before any upstream head.
        r = roundTrip(port, proxyPost("{}", "Accept: text/event-stream\r\n"));
        assert(r.status == 502);
        assert(parseJson(r.body)["error"].asString() == "Upstream request failed");

        // The server keeps serving.
        r = roundTrip(port, "GET /healthz HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
        assert(r.status == 200);
    });
    LOG_INFO << "Connection Refused PASS";
}

void testTimeout() {
    ScriptedUpstream silent([](int fd, const CapturedRequest&) {
        ScriptedUpstream::waitForPeerClose(fd, 5000);
    });
    withRelay(upstreamUrl(silent.port()), {{"UPSTREAM_TIMEOUT_SEC", "0.5"}}, [](uint16_t port) {
        const auto start = std::chrono::steady_clock::now();
        ClientResponse r = roundTrip(port, proxyPost("{}"));
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        assert(r.status == 502);
        assert(parseJson(r.body)["detail"].asString() == "timeout of 500ms exceeded");
        assert(ms >= 450);
    });
    LOG_INFO << "Upstream Timeout PASS";
}

void testBrokenUpstreams() {
    ScriptedUpstream broken([](int fd, const CapturedRequest& req) {
        if (req.body.find("garbage") != std::string::npos) {
            sendAll(fd, "SSH-2.0-OpenSSH_9.6\r\n\r\n");
        } else if (req.body.find("hangup") != std::string::npos) {
            // Close without answering.
        } else if (req.body.find("json-error") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 500 Internal Server Error\r\nContent-Type: application/json\r\n"
                        "Content-Length: 100\r\n\r\n{\"error\":\"boom\"}");
        } else {
            sendAll(fd, "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 100\r\n\r\noverloaded");
        }
    });
    withRelay(upstreamUrl(broken.port()), {}, [](uint16_t port) {
        ClientResponse r = roundTrip(port, proxyPost("{\"x\":\"garbage\"}"));
        assert(r.status == 502);
        assert(parseJson(r.body)["detail"].asString().find("Parse Error") == 0);

        r = roundTrip(port, proxyPost("{\"x\":\"hangup\"}"));
        assert(r.status == 502);
        assert(parseJson(r.body)["detail"].asString() == "socket hang up");

        // Error response cut short: its status and what arrived are relayed.
        r = roundTrip(port, proxyPost("{\"x\":\"json-error\"}"));
        assert(r.status == 500);
        assert(r.body == "{\"error\":\"boom\"}");

        r = roundTrip(port, proxyPost("{\"x\":\"text-error\"}"));
        assert(r.status == 503);
        assert(parseJson(r.body).asString() == "overloaded");
    });
    LOG_INFO << "Broken Upstreams PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    ::signal(SIGPIPE, SIG_IGN);
    testConnectionRefused();
    testTimeout();
    testBrokenUpstreams();
    return 0;
}
