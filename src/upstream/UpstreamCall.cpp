#include "relay/upstream/UpstreamCall.h"
#include "relay/upstream/UpstreamClient.h"
#include "relay/upstream/ByteStream.h"
#include "relay/upstream/Resolver.h"
#include "relay/network/TcpClient.h"
#include "relay/network/TcpConnection.h"
#include "relay/network/TlsContext.h"
#include "relay/common/Logger.h"

#include <json/json.h>

#include <memory>
#include <stdio.h>

namespace relay {
namespace upstream {

using relay::network::Buffer;
using relay::network::InetAddress;
using relay::network::TcpClient;
using relay::network::TcpConnectionPtr;
using relay::protocol::Compression;
using relay::protocol::IEquals;

namespace {

// Headers this client writes itself.
bool IsClientOwned(const std::string& name) {
    return IEquals(name, "Host") || IEquals(name, "Content-Length") ||
           IEquals(name, "Connection") || IEquals(name, "Transfer-Encoding");
}

bool IsStructured(const std::string& text) {
    if (text.empty()) return false;
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    Json::Value v;
    if (!reader->parse(text.data(), text.data() + text.size(), &v, &errs)) {
        return false;
    }
    return v.isObject() || v.isArray();
}

} // namespace

UpstreamCall::UpstreamCall(std::shared_ptr<const UpstreamClient> client,
                           relay::network::EventLoop* loop,
                           uint64_t id,
                           UpstreamRequest request,
                           UpstreamCallbacks callbacks)
    : client_(std::move(client)),
      loop_(loop),
      id_(id),
      request_(std::move(request)),
      callbacks_(std::move(callbacks)) {
    parser_.setBodyCallback([this](const char* data, size_t len) { OnBodyBytes(data, len); });
}

UpstreamCall::~UpstreamCall() {
    LOG_DEBUG << "UpstreamCall#" << id_ << " destroyed";
}

std::string UpstreamCall::BuildRequest() const {
    const relay::protocol::Url& url = client_->options().url;
    std::string out;
    out.reserve(512 + request_.body.size());
    out += "POST " + url.target + " HTTP/1.1\r\n";
    out += "Host: " + url.hostHeader() + "\r\n";

    const relay::protocol::HeaderMap& headers = request_.headers;
    for (const auto& h : headers) {
        if (IsClientOwned(h.first)) continue;
        if (!relay::protocol::IsValidHeaderName(h.first) || !relay::protocol::IsValidHeaderValue(h.second)) {
            LOG_WARN << "UpstreamCall#" << id_ << " skipping malformed request header '" << h.first << "'";
            continue;
        }
        out += h.first + ": " + h.second + "\r\n";
    }
    if (headers.find("Accept") == headers.end()) {
        out += "Accept: application/json, text/plain, */*\r\n";
    }
    if (headers.find("Accept-Encoding") == headers.end()) {
        out += "Accept-Encoding: gzip, deflate\r\n";
    }
    if (headers.find("User-Agent") == headers.end()) {
        out += std::string("User-Agent: ") + UpstreamClient::kUserAgent + "\r\n";
    }
    out += "Content-Length: " + std::to_string(request_.body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += request_.body;
    return out;
}

void UpstreamCall::Start() {
    if (phase_ != kIdle) return;
    const relay::protocol::Url& url = client_->options().url;
    phase_ = kResolving;
    ArmTimer();

    LOG_DEBUG << "UpstreamCall#" << id_ << " POST " << url.toString()
              << (request_.mode == ResponseMode::kStream ? " (stream)" : " (buffered)");

    std::weak_ptr<UpstreamCall> weakSelf(shared_from_this());
    client_->resolver()->Resolve(loop_, url.host, url.port,
        [weakSelf](const std::vector<InetAddress>& addrs, const std::string& error) {
            if (auto self = weakSelf.lock()) self->OnResolved(addrs, error);
        });
}

void UpstreamCall::OnResolved(const std::vector<InetAddress>& addrs, const std::string& error) {
    if (phase_ != kResolving) return;
    if (addrs.empty()) {
        Fail(error.empty() ? "getaddrinfo ENOTFOUND " + client_->options().url.host : error);
        return;
    }

    phase_ = kConnecting;
    char name[32];
    snprintf(name, sizeof name, "upstream#%llu", static_cast<unsigned long long>(id_));
    tcpClient_ = std::make_shared<TcpClient>(loop_, addrs, name);

    const relay::protocol::Url& url = client_->options().url;
    if (url.tls()) {
        relay::network::TlsContext* tls = client_->tlsContext();
        if (!tls) {
            Fail("TLS is not initialised for " + url.host);
            return;
        }
        tcpClient_->EnableTls(tls, url.host);
    }

    std::weak_ptr<UpstreamCall> weakSelf(shared_from_this());
    tcpClient_->SetConnectionCallback([weakSelf](const TcpConnectionPtr& conn) {
        if (auto self = weakSelf.lock()) self->OnConnection(conn);
    });
    tcpClient_->SetMessageCallback(
        [weakSelf](const TcpConnectionPtr& conn, Buffer* buf, std::chrono::system_clock::time_point) {
            if (auto self = weakSelf.lock()) {
                self->OnMessage(conn, buf);
            } else {
                buf->RetrieveAll();
            }
        });
    tcpClient_->SetConnectErrorCallback([weakSelf](const std::string& reason) {
        if (auto self = weakSelf.lock()) self->OnConnectError(reason);
    });
    tcpClient_->Connect();
}

void UpstreamCall::OnConnectError(const std::string& reason) {
    if (phase_ != kConnecting) return;
    Fail(reason);
}

void UpstreamCall::OnConnection(const TcpConnectionPtr& conn) {
    if (phase_ == kDone) return;
    auto guard = shared_from_this();

    if (conn->connected()) {
        conn_ = conn;
        conn->SetTcpNoDelay(true);
        phase_ = kAwaitingHead;
        // Queued until the TLS handshake finishes for https.
        conn->Send(BuildRequest());
        return;
    }

    // Connection closed.
    if (parser_.finishOnClose()) {
        Complete();
        return;
    }
    std::string reason = conn->lastError();
    if (reason.empty()) reason = "socket hang up";
    Fail(reason);
}

void UpstreamCall::OnMessage(const TcpConnectionPtr& conn, Buffer* buf) {
    (void)conn;
    if (phase_ == kDone) {
        buf->RetrieveAll();
        return;
    }
    auto guard = shared_from_this();

    std::string data = buf->RetrieveAllAsString();
    if (!parser_.feed(data.data(), data.size())) {
        Fail(parser_.error());
        return;
    }
    if (phase_ == kDone) return;
    if (parser_.headersComplete() && !headProcessed_) {
        if (!ProcessHead()) return;
    }
    if (phase_ != kDone && parser_.gotAll()) {
        Complete();
    }
}

bool UpstreamCall::ProcessHead() {
    headProcessed_ = true;
    phase_ = kReceivingBody;
    head_.status = parser_.statusCode();
    head_.reason = parser_.reason();
    head_.headers = parser_.headers();

    const std::string ce = parser_.getHeader("Content-Encoding");
    const Compression::Encoding enc = Compression::ParseContentEncoding(ce);
    if (enc == Compression::Encoding::kGzip || enc == Compression::Encoding::kDeflate) {
        inflater_.reset(new relay::protocol::Inflater(enc));
        relay::protocol::RemoveHeader(&head_.headers, "Content-Encoding");
        relay::protocol::RemoveHeader(&head_.headers, "Content-Length");
    } else if (enc == Compression::Encoding::kIdentity && !ce.empty()) {
        relay::protocol::RemoveHeader(&head_.headers, "Content-Encoding");
    }

    LOG_DEBUG << "UpstreamCall#" << id_ << " head " << head_.status << " " << head_.reason
              << (inflater_ ? std::string(" (") + Compression::Name(enc) + ")" : std::string());

    const bool bodiless = parser_.gotAll() && body_.empty();
    if (request_.mode == ResponseMode::kStream && !bodiless) {
        if (!OpenStream()) return false;
    }

    // Bytes that arrived together with the head.
    if (!body_.empty()) {
        std::string early;
        early.swap(body_);
        OnBodyBytes(early.data(), early.size());
    }
    return phase_ != kDone;
}

bool UpstreamCall::OpenStream() {
    stream_ = std::make_shared<ByteStream>();
    std::weak_ptr<UpstreamCall> weakSelf(shared_from_this());
    ByteStream::ProducerControl control;
    control.pause = [weakSelf]() {
        auto self = weakSelf.lock();
        if (self && self->conn_) self->conn_->StopRead();
    };
    control.resume = [weakSelf]() {
        auto self = weakSelf.lock();
        if (self && self->conn_) self->conn_->StartRead();
    };
    control.cancel = [weakSelf]() {
        if (auto self = weakSelf.lock()) self->Cancel();
    };
    stream_->SetProducerControl(std::move(control));

    // From here on the timeout bounds silence between chunks.
    ArmTimer();

    UpstreamResponse response;
    response.head = head_;
    response.body = stream_;
    auto onResponse = std::move(callbacks_.onResponse);
    callbacks_.onResponse = nullptr;
    if (onResponse) onResponse(std::move(response));

    return phase_ != kDone;
}

void UpstreamCall::OnBodyBytes(const char* data, size_t len) {
    if (phase_ == kDone) return;
    if (!headProcessed_) {
        // The parser reports body bytes before feed() returns; keep them
        // until the head has been handled.
        body_.append(data, len);
        return;
    }
    if (inflater_) {
        std::string out;
        if (!inflater_->Feed(data, len, &out)) {
            Fail(inflater_->error());
            return;
        }
        DeliverBody(out.data(), out.size());
    } else {
        DeliverBody(data, len);
    }
}

void UpstreamCall::DeliverBody(const char* data, size_t len) {
    if (len == 0) return;
    if (stream_) {
        ArmTimer();
        stream_->Push(data, len);
    } else {
        decoded_.append(data, len);
    }
}

void UpstreamCall::Complete() {
    if (phase_ == kDone) return;
    if (!headProcessed_) {
        if (!ProcessHead() || phase_ == kDone) return;
    }
    if (inflater_) {
        std::string tail;
        const bool ok = inflater_->Finish(&tail);
        DeliverBody(tail.data(), tail.size());
        if (!ok) {
            Fail(inflater_->error());
            return;
        }
    }

    phase_ = kDone;
    CancelTimer();
    LOG_DEBUG << "UpstreamCall#" << id_ << " complete, status " << head_.status;

    if (stream_) {
        std::shared_ptr<ByteStream> stream = stream_;
        Teardown();
        stream->Close();
        return;
    }

    UpstreamResponse response;
    response.head = head_;
    if (request_.mode == ResponseMode::kBuffered && IsStructured(decoded_)) {
        response.body = relay::upstream::JsonBody{std::move(decoded_)};
    } else {
        response.body = std::move(decoded_);
    }
    auto onResponse = std::move(callbacks_.onResponse);
    callbacks_ = UpstreamCallbacks();
    Teardown();
    if (onResponse) onResponse(std::move(response));
}

void UpstreamCall::Fail(const std::string& message, bool timedOut) {
    if (phase_ == kDone) return;
    const bool hadHead = headProcessed_;
    phase_ = kDone;
    CancelTimer();
    LOG_WARN << "UpstreamCall#" << id_ << " failed: " << message;

    if (stream_) {
        std::shared_ptr<ByteStream> stream = stream_;
        Teardown();
        stream->Fail(message);
        return;
    }

    UpstreamError err;
    err.message = message;
    err.timedOut = timedOut;
    if (hadHead && head_.status >= 400) {
        err.status = head_.status;
        err.payload = decoded_;
    }
    auto onError = std::move(callbacks_.onError);
    callbacks_ = UpstreamCallbacks();
    Teardown();
    if (onError) onError(err);
}

void UpstreamCall::Cancel() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() {
        if (self->phase_ == kDone) return;
        LOG_DEBUG << "UpstreamCall#" << self->id_ << " cancelled";
        self->phase_ = kDone;
        self->CancelTimer();
        self->callbacks_ = UpstreamCallbacks();
        self->Teardown();
    });
}

void UpstreamCall::Teardown() {
    CancelTimer();
    stream_.reset();
    conn_.reset();
    if (tcpClient_) {
        tcpClient_->Disconnect();
        // We may be inside one of its callbacks; destroy it afterwards.
        std::shared_ptr<TcpClient> client = std::move(tcpClient_);
        tcpClient_.reset();
        loop_->QueueInLoop([client]() {});
    }
}

void UpstreamCall::ArmTimer() {
    CancelTimer();
    std::weak_ptr<UpstreamCall> weakSelf(shared_from_this());
    timer_ = loop_->RunAfter(client_->options().timeoutSec, [weakSelf]() {
        if (auto self = weakSelf.lock()) {
            self->timerArmed_ = false;
            self->OnTimeout();
        }
    });
    timerArmed_ = true;
}

void UpstreamCall::CancelTimer() {
    if (timerArmed_) {
        loop_->CancelTimer(timer_);
        timerArmed_ = false;
    }
}

void UpstreamCall::OnTimeout() {
    if (phase_ == kDone) return;
    const long ms = static_cast<long>(client_->options().timeoutSec * 1000.0);
    Fail("timeout of " + std::to_string(ms) + "ms exceeded", true);
}

} // namespace upstream
} // namespace relay
