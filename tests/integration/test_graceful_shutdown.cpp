#include "RelayHarness.h"

#include "relay/RelayServer.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <signal.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

using namespace relaytest;
using namespace relay;
using namespace relay::network;
using namespace relay::common;

static bool waitFor(const std::function<bool()>& cond, int timeoutMs = 3000) {
    for (int i = 0; i < timeoutMs / 10 && !cond(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

// In-flight requests finish during the drain; new connections are refused.
void testDrainLetsRequestsFinish() {
    std::atomic<int> seen{0};
    ScriptedUpstream upstream([&](int fd, const CapturedRequest&) {
        ++seen;
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        sendAll(fd, "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 13\r\n\r\n{\"slow\":true}");
    });

    EventLoop loop;
    RelayServer server(&loop, makeConfig(upstreamUrl(upstream.port())));
    std::string err;
    assert(server.Start(&err));
    const uint16_t port = server.listenAddress().toPort();
    bool drained = false;

    std::thread client([&]() {
        int fd = connectTo(port);
        assert(fd >= 0);
        sendAll(fd, proxyPost("{}"));
        assert(waitFor([&]() { return seen.load() == 1; }));

        loop.QueueInLoop([&]() {
            server.Shutdown(5.0, [&]() {
                drained = true;
                loop.Quit();
            });
        });
        assert(waitFor([&]() { return server.shuttingDown(); }));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(connectTo(port) < 0);

        ClientResponse r = parseResponse(recvUntilClose(fd));
        ::close(fd);
        assert(r.status == 200);
        assert(r.body == "{\"slow\":true}");
    });

    loop.RunAfter(20.0, [&]() { assert(false && "drain test timed out"); });
    loop.Loop();
    client.join();
    assert(drained);
    assert(server.inflight() == 0);
    LOG_INFO << "Drain PASS";
}

// Whatever is still running at the deadline gets cancelled.
void testDeadlineCancelsInflight() {
    std::atomic<bool> upstreamClosed{false};
    std::atomic<int> seen{0};
    ScriptedUpstream upstream([&](int fd, const CapturedRequest&) {
        ++seen;
        if (ScriptedUpstream::waitForPeerClose(fd, 10000)) upstreamClosed = true;
    });

    EventLoop loop;
    RelayServer server(&loop, makeConfig(upstreamUrl(upstream.port())));
    std::string err;
    assert(server.Start(&err));
    const uint16_t port = server.listenAddress().toPort();
    bool drained = false;
    ClientResponse response;

    std::thread client([&]() {
        int fd = connectTo(port);
        assert(fd >= 0);
        sendAll(fd, proxyPost("{}"));
        assert(waitFor([&]() { return seen.load() == 1; }));

        loop.QueueInLoop([&]() {
            server.Shutdown(0.3, [&]() {
                drained = true;
                loop.Quit();
            });
        });
        response = parseResponse(recvUntilClose(fd));
        ::close(fd);
    });

    const auto start = std::chrono::steady_clock::now();
    loop.RunAfter(20.0, [&]() { assert(false && "deadline test timed out"); });
    loop.Loop();
    client.join();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    assert(drained);
    assert(ms >= 300);
    assert(response.status == 503);
    assert(response.body == "{\"error\":\"request cancelled: server shutting down\"}");
    assert(waitFor([&]() { return upstreamClosed.load(); }));
    LOG_INFO << "Deadline Cancel PASS";
}

// Connections closed while the server is being torn down still finish their
// contexts; the registry they report to may already be gone.
void testDestroyedWithRequestInFlight() {
    std::atomic<bool> upstreamClosed{false};
    std::atomic<int> seen{0};
    ScriptedUpstream upstream([&](int fd, const CapturedRequest&) {
        ++seen;
        if (ScriptedUpstream::waitForPeerClose(fd, 10000)) upstreamClosed = true;
    });

    EventLoop loop;
    std::unique_ptr<RelayServer> server(new RelayServer(&loop, makeConfig(upstreamUrl(upstream.port()))));
    std::string err;
    assert(server->Start(&err));
    const uint16_t port = server->listenAddress().toPort();
    bool destroyed = false;
    int fd = -1;

    std::thread client([&]() {
        fd = connectTo(port);
        assert(fd >= 0);
        sendAll(fd, proxyPost("{}"));
        assert(waitFor([&]() { return seen.load() == 1; }));
        loop.QueueInLoop([&]() {
            server.reset();
            destroyed = true;
            // Give the upstream teardown queued by the cancellation a turn.
            loop.RunAfter(0.3, [&]() { loop.Quit(); });
        });
    });

    loop.RunAfter(20.0, [&]() { assert(false && "teardown test timed out"); });
    loop.Loop();
    client.join();

    assert(destroyed);
    ClientResponse r = parseResponse(recvUntilClose(fd, 2000));
    ::close(fd);
    assert(r.status == 0);
    assert(waitFor([&]() { return upstreamClosed.load(); }));
    LOG_INFO << "Destroyed With Request In Flight PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    ::signal(SIGPIPE, SIG_IGN);
    testDrainLetsRequestsFinish();
    testDeadlineCancelsInflight();
    testDestroyedWithRequestInFlight();
    return 0;
}
