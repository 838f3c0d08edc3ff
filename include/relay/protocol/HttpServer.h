#pragma once

#include "relay/network/TcpServer.h"
#include "relay/common/noncopyable.h"
#include "relay/protocol/ResponseWriter.h"

#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace protocol {

class HttpRequest;
struct HttpConnectionState;

// HTTP/1.1 server with asynchronous handlers. Requests on one connection are
// answered in order; bytes of a pipelined request stay buffered until the
// previous exchange has completed.
class HttpServer : relay::common::noncopyable {
public:
    using HttpCallback = std::function<void(const HttpRequest&, const ResponseWriterPtr&)>;

    static const size_t kHighWaterMark = 4 * 1024 * 1024;

    HttpServer(relay::network::EventLoop* loop,
               const relay::network::InetAddress& listenAddr,
               const std::string& name,
               relay::network::TcpServer::Option option = relay::network::TcpServer::kNoReusePort);

    relay::network::EventLoop* getLoop() const { return server_.getLoop(); }

    void setHttpCallback(const HttpCallback& cb) {
        httpCallback_ = cb;
    }

    void setThreadNum(int numThreads) {
        server_.SetThreadNum(numThreads);
    }

    void setMaxBodyBytes(size_t n) { maxBodyBytes_ = n; }

    bool start(std::string* error);
    void stopAccepting() { server_.StopAccepting(); }
    relay::network::InetAddress listenAddress() const { return server_.listenAddress(); }

private:
    void onConnection(const relay::network::TcpConnectionPtr& conn);
    void onMessage(const relay::network::TcpConnectionPtr& conn,
                   relay::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void processInput(const relay::network::TcpConnectionPtr& conn,
                      const std::shared_ptr<HttpConnectionState>& state);
    void onRequest(const relay::network::TcpConnectionPtr& conn,
                   const std::shared_ptr<HttpConnectionState>& state,
                   HttpRequest& req);
    void sendError(const relay::network::TcpConnectionPtr& conn, int status);

    relay::network::TcpServer server_;
    HttpCallback httpCallback_;
    size_t maxBodyBytes_;
};

} // namespace protocol
} // namespace relay
