#include "relay/protocol/HttpServer.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/network/EventLoop.h"
#include "relay/network/InetAddress.h"
#include "relay/common/Logger.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>

using namespace relay::protocol;
using namespace relay::network;
using namespace relay::common;

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

static void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

static std::string recvUntilClose(int fd, int timeoutMs = 3000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

static std::string roundTrip(uint16_t port, const std::string& request) {
    int fd = connectTo(port);
    sendAll(fd, request);
    std::string resp = recvUntilClose(fd);
    ::close(fd);
    return resp;
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    EventLoop loop;
    HttpServer server(&loop, InetAddress(0, true), "TestHttpServer");
    server.setHttpCallback([&](const HttpRequest& req, const ResponseWriterPtr& writer) {
        LOG_INFO << "HttpServer - Request: " << req.path();

        if (req.path() == "/hello") {
            HttpResponse resp;
            resp.setStatusCode(HttpResponse::k200Ok);
            resp.setContentType("text/plain");
            resp.setBody("Hello World!");
            writer->Send(resp);
        } else if (req.path() == "/later") {
            // Answered from a timer, after the handler returned.
            loop.RunAfter(0.1, [writer]() {
                HttpResponse resp;
                resp.setStatusCode(HttpResponse::k200Ok);
                resp.setContentType("text/plain");
                resp.setBody("Later!");
                writer->Send(resp);
            });
        } else if (req.path() == "/events") {
            HeaderList headers = {{"Content-Type", "text/event-stream"},
                                  {"Content-Length", "999"},
                                  {"Bad Header", "x"}};
            writer->BeginStream(200, headers);
            writer->Write("data: a\n\n", 9);
            loop.RunAfter(0.05, [writer]() {
                writer->Write("data: b\n\n", 9);
                writer->End();
            });
        } else if (req.path() == "/echo") {
            HttpResponse resp;
            resp.setStatusCode(HttpResponse::k200Ok);
            resp.setBody(req.body());
            writer->Send(resp);
        } else {
            HttpResponse resp;
            resp.setStatusCode(HttpResponse::k404NotFound);
            writer->Send(resp);
        }
    });
    std::string err;
    assert(server.start(&err));
    const uint16_t port = server.listenAddress().toPort();

    std::atomic<bool> clientDone{false};
    std::thread client([&]() {
        // Pipelined: the async answer must come before the next one.
        std::string resp = roundTrip(port,
            "GET /later HTTP/1.1\r\nHost: test\r\n\r\n"
            "GET /hello HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n");
        const size_t later = resp.find("Later!");
        const size_t hello = resp.find("Hello World!");
        assert(later != std::string::npos && hello != std::string::npos);
        assert(later < hello);
        assert(resp.find("Connection: keep-alive") != std::string::npos);
        LOG_INFO << "Async Keep-Alive PASS";

        resp = roundTrip(port, "GET /events HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n");
        assert(resp.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(resp.find("Transfer-Encoding: chunked\r\n") != std::string::npos);
        assert(resp.find("Content-Length") == std::string::npos);
        assert(resp.find("Bad Header") == std::string::npos);
        assert(resp.find("9\r\ndata: a\n\n\r\n9\r\ndata: b\n\n\r\n0\r\n\r\n") != std::string::npos);
        LOG_INFO << "Chunked Stream PASS";

        resp = roundTrip(port, "GET /events HTTP/1.0\r\nHost: test\r\n\r\n");
        assert(resp.find("Transfer-Encoding") == std::string::npos);
        assert(resp.find("\r\n\r\ndata: a\n\ndata: b\n\n") != std::string::npos);
        LOG_INFO << "HTTP/1.0 Stream PASS";

        resp = roundTrip(port,
            "POST /echo HTTP/1.1\r\nHost: test\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
            "4\r\n{\"a\"\r\n3\r\n:1}\r\n0\r\n\r\n");
        assert(resp.find("\r\n\r\n{\"a\":1}") != std::string::npos);
        LOG_INFO << "Chunked Request PASS";

        resp = roundTrip(port, "BROKEN\r\n\r\n");
        assert(resp.find("HTTP/1.1 400 Bad Request\r\n") == 0);
        assert(resp.find("{\"error\":\"Bad Request\"}") != std::string::npos);
        LOG_INFO << "Bad Request PASS";

        clientDone = true;
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.RunAfter(15.0, [&]() { assert(false && "http server test timed out"); });
    loop.Loop();
    client.join();
    assert(clientDone);
    return 0;
}
