#include "relay/network/TcpClient.h"
#include "relay/network/EventLoop.h"
#include "relay/network/InetAddress.h"
#include "relay/network/TcpServer.h"
#include "relay/common/Logger.h"
#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>
#include <thread>
#include <string>
#include <atomic>
#include <chrono>
#include <cassert>
#include <cstring>

using namespace relay::network;
using namespace relay::common;

static uint16_t pickFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    ::close(fd);
    assert(port != 0);
    return port;
}

// --- Echo Server ---
class TestEchoServer {
public:
    TestEchoServer(EventLoop* loop, const InetAddress& addr)
        : server_(loop, addr, "TestServer") {
        server_.SetConnectionCallback([](const TcpConnectionPtr& conn){
            if (conn->connected()) {
                LOG_INFO << "Server: New connection from " << conn->peerAddress().toIpPort();
            }
        });
        server_.SetMessageCallback([](const TcpConnectionPtr& conn, Buffer* buf, std::chrono::system_clock::time_point){
            std::string msg = buf->RetrieveAllAsString();
            LOG_INFO << "Server received: " << msg;
            conn->Send(msg);
        });
    }
    bool Start() {
        std::string err;
        return server_.Start(&err);
    }
    uint16_t port() const { return server_.listenAddress().toPort(); }
private:
    TcpServer server_;
};

// Nothing listens on the first address; the client moves on to the second.
void testEchoWithFallback(uint16_t echoPort) {
    EventLoop loop;
    const uint16_t deadPort = pickFreePort();
    std::vector<InetAddress> addrs = {InetAddress("127.0.0.1", deadPort), InetAddress("127.0.0.1", echoPort)};
    TcpClient client(&loop, addrs, "TestClient");

    std::string received;
    bool sawDisconnect = false;
    client.SetConnectionCallback([&](const TcpConnectionPtr& conn) {
        if (conn->connected()) {
            LOG_INFO << "Client: Connected to " << conn->peerAddress().toIpPort();
            assert(conn->peerAddress().toPort() == echoPort);
            conn->Send("Hello Relay");
        } else {
            sawDisconnect = true;
            loop.Quit();
        }
    });
    client.SetMessageCallback([&](const TcpConnectionPtr&, Buffer* buf, std::chrono::system_clock::time_point) {
        received += buf->RetrieveAllAsString();
        if (received == "Hello Relay") {
            client.Disconnect();
        }
    });
    client.SetConnectErrorCallback([&](const std::string& reason) {
        LOG_ERROR << "unexpected connect error: " << reason;
        assert(false);
    });
    loop.RunAfter(5.0, [&]() { assert(false && "echo timed out"); });
    client.Connect();
    loop.Loop();

    assert(received == "Hello Relay");
    assert(sawDisconnect);
    LOG_INFO << "Echo With Fallback PASS";
}

void testConnectRefused() {
    EventLoop loop;
    const uint16_t deadPort = pickFreePort();
    TcpClient client(&loop, {InetAddress("127.0.0.1", deadPort)}, "RefusedClient");
    std::string reason;
    client.SetConnectionCallback([](const TcpConnectionPtr&) { assert(false); });
    client.SetConnectErrorCallback([&](const std::string& r) {
        reason = r;
        loop.Quit();
    });
    loop.RunAfter(5.0, [&]() { assert(false && "no connect error"); });
    client.Connect();
    loop.Loop();

    assert(reason == "connect ECONNREFUSED 127.0.0.1:" + std::to_string(deadPort));
    LOG_INFO << "Connect Refused PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    std::atomic<bool> serverReady{false};
    std::atomic<uint16_t> echoPort{0};

    EventLoop* serverLoopPtr = nullptr;
    std::thread serverThread([&]() {
        EventLoop serverLoop;
        TestEchoServer server(&serverLoop, InetAddress(0, true));
        assert(server.Start());
        echoPort.store(server.port());
        serverLoopPtr = &serverLoop;
        serverReady.store(true);
        serverLoop.Loop();
    });

    for (int i = 0; i < 100 && !serverReady.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(serverReady.load());

    testEchoWithFallback(echoPort.load());
    testConnectRefused();

    serverLoopPtr->Quit();
    serverThread.join();
    return 0;
}
