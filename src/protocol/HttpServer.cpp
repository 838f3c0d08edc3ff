#include "relay/protocol/HttpServer.h"
#include "relay/protocol/HttpContext.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <stdio.h>

namespace relay {
namespace protocol {

using relay::network::Buffer;
using relay::network::TcpConnection;
using relay::network::TcpConnectionPtr;

const size_t HttpServer::kHighWaterMark;

namespace {

bool IsTransportHeader(const std::string& name) {
    return IEquals(name, "Transfer-Encoding") ||
           IEquals(name, "Content-Length") ||
           IEquals(name, "Connection") ||
           IEquals(name, "Keep-Alive");
}

class ConnectionResponseWriter : public ResponseWriter {
public:
    // Called once the exchange is over; keepOpen tells whether the next
    // request on this connection may be served.
    using FinishedCallback = std::function<void(bool keepOpen)>;

    // A HEAD exchange gets the same head as GET but never a body.
    ConnectionResponseWriter(const TcpConnectionPtr& conn, bool keepAlive, bool http11,
                             bool headRequest, FinishedCallback onFinished)
        : conn_(conn),
          keepAlive_(keepAlive),
          http11_(http11),
          headRequest_(headRequest),
          onFinished_(std::move(onFinished)) {}

    void Send(const HttpResponse& response) override {
        if (state_ != kPending) {
            LOG_WARN << "ResponseWriter::Send after headers were sent, ignored";
            return;
        }
        TcpConnectionPtr conn = conn_.lock();
        if (!conn) return;

        HttpResponse out(!keepAlive_);
        out.setStatusCode(response.statusCode());
        out.setStatusMessage(response.statusMessage());
        for (const auto& h : response.headers()) {
            if (!Acceptable(h.first, h.second)) continue;
            out.addHeader(h.first, h.second);
        }
        out.setBody(response.body());

        Buffer buf;
        out.appendToBuffer(&buf, headRequest_);
        conn->Send(buf.Peek(), buf.ReadableBytes());
        state_ = kDone;
        Finish(true, keepAlive_);
    }

    void BeginStream(int status, const HeaderList& headers) override {
        if (state_ != kPending) return;
        TcpConnectionPtr conn = conn_.lock();
        if (!conn) return;

        // HTTP/1.0 peers get a close-delimited body.
        chunked_ = http11_ && !headRequest_ && !HttpResponse::StatusHasNoBody(status);
        HttpResponse head(!keepAlive_ || !(chunked_ || headRequest_));
        head.setStatusCode(status);
        for (const auto& h : headers) {
            if (!Acceptable(h.first, h.second)) continue;
            head.addHeader(h.first, h.second);
        }
        Buffer buf;
        head.appendHeadToBuffer(&buf, chunked_);
        conn->Send(buf.Peek(), buf.ReadableBytes());
        state_ = kStreaming;
    }

    void Write(const char* data, size_t len) override {
        if (state_ != kStreaming || len == 0 || headRequest_) return;
        TcpConnectionPtr conn = conn_.lock();
        if (!conn) return;
        if (chunked_) {
            Buffer buf;
            char sizeLine[32];
            int n = snprintf(sizeLine, sizeof sizeLine, "%zx\r\n", len);
            buf.Append(sizeLine, static_cast<size_t>(n));
            buf.Append(data, len);
            buf.Append("\r\n", 2);
            conn->Send(buf.Peek(), buf.ReadableBytes());
        } else {
            conn->Send(data, len);
        }
    }

    void End() override {
        if (state_ != kStreaming) return;
        state_ = kDone;
        TcpConnectionPtr conn = conn_.lock();
        if (conn && chunked_) {
            conn->Send("0\r\n\r\n", 5);
        }
        Finish(true, keepAlive_ && (chunked_ || headRequest_));
    }

    void Abort() override {
        if (state_ == kDone) return;
        state_ = kDone;
        if (TcpConnectionPtr conn = conn_.lock()) {
            conn->ForceClose();
        }
        Finish(false, false);
    }

    bool HeadersSent() const override { return state_ != kPending; }

    bool IsOpen() const override {
        TcpConnectionPtr conn = conn_.lock();
        return state_ != kDone && conn && conn->connected();
    }

    void SetCompletionCallback(CompletionCallback cb) override {
        completionCallback_ = std::move(cb);
    }

    void SetFlowControl(std::function<void()> onBackpressure, std::function<void()> onDrain) override {
        onBackpressure_ = std::move(onBackpressure);
        onDrain_ = std::move(onDrain);
    }

    void OnHighWater() {
        if (state_ == kDone || paused_) return;
        paused_ = true;
        if (onBackpressure_) onBackpressure_();
    }

    void OnDrained() {
        if (!paused_) return;
        paused_ = false;
        if (onDrain_) onDrain_();
    }

    void OnPeerClosed() {
        if (state_ == kDone) return;
        state_ = kDone;
        Finish(false, false);
    }

private:
    enum State { kPending, kStreaming, kDone };

    static bool Acceptable(const std::string& name, const std::string& value) {
        if (!IsValidHeaderName(name) || !IsValidHeaderValue(value)) {
            LOG_DEBUG << "dropping invalid response header '" << name << "'";
            return false;
        }
        return !IsTransportHeader(name);
    }

    void Finish(bool completed, bool keepOpen) {
        if (finished_) return;
        finished_ = true;
        onBackpressure_ = nullptr;
        onDrain_ = nullptr;
        CompletionCallback cb = std::move(completionCallback_);
        completionCallback_ = nullptr;
        if (cb) cb(completed);
        FinishedCallback done = std::move(onFinished_);
        onFinished_ = nullptr;
        if (done) done(keepOpen);
    }

    std::weak_ptr<TcpConnection> conn_;
    const bool keepAlive_;
    const bool http11_;
    const bool headRequest_;
    bool chunked_{false};
    bool paused_{false};
    bool finished_{false};
    State state_{kPending};
    CompletionCallback completionCallback_;
    std::function<void()> onBackpressure_;
    std::function<void()> onDrain_;
    FinishedCallback onFinished_;
};

} // namespace

struct HttpConnectionState {
    explicit HttpConnectionState(size_t maxBodyBytes) : parser(maxBodyBytes) {}

    HttpContext parser;
    std::shared_ptr<ConnectionResponseWriter> active;
    bool closing{false};
};

HttpServer::HttpServer(relay::network::EventLoop* loop,
                       const relay::network::InetAddress& listenAddr,
                       const std::string& name,
                       relay::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option),
      maxBodyBytes_(10 * 1024 * 1024) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
    server_.SetWriteCompleteCallback([](const TcpConnectionPtr& conn) {
        auto* state = std::any_cast<std::shared_ptr<HttpConnectionState>>(conn->GetMutableContext());
        if (state && *state && (*state)->active) {
            (*state)->active->OnDrained();
        }
    });
}

bool HttpServer::start(std::string* error) {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.hostport();
    return server_.Start(error);
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(std::make_shared<HttpConnectionState>(maxBodyBytes_));
        conn->SetTcpNoDelay(true);
        conn->SetHighWaterMarkCallback([](const TcpConnectionPtr& c, size_t) {
            auto* state = std::any_cast<std::shared_ptr<HttpConnectionState>>(c->GetMutableContext());
            if (state && *state && (*state)->active) {
                (*state)->active->OnHighWater();
            }
        }, kHighWaterMark);
    } else {
        auto* state = std::any_cast<std::shared_ptr<HttpConnectionState>>(conn->GetMutableContext());
        if (state && *state) {
            std::shared_ptr<ConnectionResponseWriter> active = std::move((*state)->active);
            (*state)->active.reset();
            if (active) {
                LOG_DEBUG << "HttpServer: client " << conn->peerAddress().toIpPort()
                          << " went away during an exchange";
                active->OnPeerClosed();
            }
        }
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    (void)buf;
    (void)receiveTime;
    auto* state = std::any_cast<std::shared_ptr<HttpConnectionState>>(conn->GetMutableContext());
    if (!state || !*state) return;
    processInput(conn, *state);
}

void HttpServer::sendError(const TcpConnectionPtr& conn, int status) {
    HttpResponse response(true);
    response.setStatusCode(status);
    response.setContentType("application/json; charset=utf-8");
    response.setBody(std::string("{\"error\":\"") + HttpResponse::ReasonPhrase(status) + "\"}");
    Buffer out;
    response.appendToBuffer(&out);
    conn->Send(out.Peek(), out.ReadableBytes());
    conn->Shutdown();
}

void HttpServer::processInput(const TcpConnectionPtr& conn,
                              const std::shared_ptr<HttpConnectionState>& state) {
    Buffer* buf = conn->inputBuffer();
    if (state->closing) {
        buf->RetrieveAll();
        return;
    }

    // Support keep-alive / pipelining: one exchange at a time, the rest waits in the buffer.
    while (!state->active && conn->connected() && buf->ReadableBytes() > 0) {
        HttpContext& context = state->parser;
        if (!context.parseRequest(buf, std::chrono::system_clock::now())) {
            const int status = context.errorStatus() ? context.errorStatus() : 400;
            LOG_WARN << "HttpServer: bad request from " << conn->peerAddress().toIpPort()
                     << " (" << status << ")";
            state->closing = true;
            buf->RetrieveAll();
            sendError(conn, status);
            return;
        }
        if (context.expectContinue()) {
            context.clearExpectContinue();
            conn->Send("HTTP/1.1 100 Continue\r\n\r\n");
        }
        if (!context.gotAll()) {
            return;
        }
        HttpRequest req;
        req.swap(context.request());
        context.reset();
        onRequest(conn, state, req);
    }
}

void HttpServer::onRequest(const TcpConnectionPtr& conn,
                           const std::shared_ptr<HttpConnectionState>& state,
                           HttpRequest& req) {
    const std::string connection = ToLowerCopy(req.getHeader("Connection"));
    bool close = connection.find("close") != std::string::npos ||
                 (req.getVersion() == HttpRequest::kHttp10 && connection.find("keep-alive") == std::string::npos);

    std::weak_ptr<TcpConnection> weakConn(conn);
    std::weak_ptr<HttpConnectionState> weakState(state);
    auto writer = std::make_shared<ConnectionResponseWriter>(
        conn, !close, req.getVersion() == HttpRequest::kHttp11,
        req.getMethod() == HttpRequest::kHead,
        [this, weakConn, weakState](bool keepOpen) {
            TcpConnectionPtr c = weakConn.lock();
            std::shared_ptr<HttpConnectionState> s = weakState.lock();
            if (!c || !s) return;
            s->active.reset();
            if (!keepOpen) {
                s->closing = true;
                c->Shutdown();
                return;
            }
            // Resume outside the handler's stack.
            c->getLoop()->QueueInLoop([this, weakConn, weakState]() {
                TcpConnectionPtr c2 = weakConn.lock();
                std::shared_ptr<HttpConnectionState> s2 = weakState.lock();
                if (c2 && s2 && c2->connected()) processInput(c2, s2);
            });
        });
    state->active = writer;

    if (httpCallback_) {
        httpCallback_(req, writer);
    } else {
        HttpResponse response;
        response.setStatusCode(HttpResponse::k404NotFound);
        writer->Send(response);
    }
}

} // namespace protocol
} // namespace relay
