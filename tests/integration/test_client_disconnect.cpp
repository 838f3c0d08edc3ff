#include "RelayHarness.h"

#include "relay/RelayServer.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <signal.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

using namespace relaytest;
using namespace relay;
using namespace relay::network;
using namespace relay::common;

// The caller hangs up while the upstream is still thinking; the relay has to
// drop the upstream connection instead of waiting for the answer.
int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    ::signal(SIGPIPE, SIG_IGN);

    std::atomic<int> upstreamClosed{0};
    std::atomic<int> requestsSeen{0};
    ScriptedUpstream upstream([&](int fd, const CapturedRequest& req) {
        ++requestsSeen;
        if (req.body.find("\"phase\":\"streaming\"") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n"
                        "Transfer-Encoding: chunked\r\n\r\n9\r\ndata: a\n\n\r\n");
        }
        if (ScriptedUpstream::waitForPeerClose(fd, 5000)) ++upstreamClosed;
    });

    EventLoop loop;
    RelayServer server(&loop, makeConfig(upstreamUrl(upstream.port())));
    std::string err;
    assert(server.Start(&err));
    const uint16_t port = server.listenAddress().toPort();

    auto waitFor = [](const std::function<bool()>& cond) {
        for (int i = 0; i < 300 && !cond(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return cond();
    };

    std::thread client([&]() {
        {
            int fd = connectTo(port);
            assert(fd >= 0);
            sendAll(fd, proxyPost("{\"phase\":\"waiting\"}"));
            assert(waitFor([&]() { return requestsSeen.load() == 1; }));
            assert(server.inflight() == 1);
            ::close(fd);

            assert(waitFor([&]() { return upstreamClosed.load() == 1; }));
            assert(waitFor([&]() { return server.inflight() == 0; }));
            LOG_INFO << "Disconnect While Waiting PASS";
        }
        {
            int fd = connectTo(port);
            assert(fd >= 0);
            sendAll(fd, proxyPost("{\"phase\":\"streaming\"}", "Accept: text/event-stream\r\n"));
            std::string raw;
            assert(recvUntil(fd, "data: a\n\n", &raw));
            ::close(fd);

            assert(waitFor([&]() { return upstreamClosed.load() == 2; }));
            assert(waitFor([&]() { return server.inflight() == 0; }));
            LOG_INFO << "Disconnect Mid-Stream PASS";
        }
        {
            // Still serving afterwards.
            ClientResponse r = roundTrip(port, "GET /healthz HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
            assert(r.status == 200);
        }
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.RunAfter(30.0, [&]() { assert(false && "client disconnect test timed out"); });
    loop.Loop();
    client.join();
    return 0;
}
