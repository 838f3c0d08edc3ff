#include "relay/RelayServer.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/upstream/UpstreamClient.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <vector>

namespace relay {

using relay::protocol::HttpRequest;
using relay::protocol::HttpResponse;
using relay::protocol::ResponseWriterPtr;
using relay::upstream::UpstreamClient;

namespace {

const double kDrainPollSec = 0.1;
// After the deadline, cancelled exchanges get this long to unwind.
const double kCancelGraceSec = 1.0;

UpstreamClient::Options ClientOptions(const ProxyConfig& config) {
    UpstreamClient::Options options;
    options.url = config.upstream();
    options.timeoutSec = config.upstreamTimeoutSec();
    options.verifyTls = config.tlsVerify();
    options.caFile = config.caFile();
    return options;
}

} // namespace

RelayServer::RelayServer(relay::network::EventLoop* loop, const ProxyConfig& config)
    : loop_(loop),
      config_(config),
      server_(loop, relay::network::InetAddress(config.listenHost(), config.port()), "relayd"),
      client_(std::make_shared<UpstreamClient>(ClientOptions(config))),
      handler_(config, client_),
      inflight_(std::make_shared<InflightRegistry>()),
      nextRequestId_(1),
      shuttingDown_(false) {
    server_.setThreadNum(config.threads());
    server_.setMaxBodyBytes(config.maxBodyBytes());
    server_.setHttpCallback(
        std::bind(&RelayServer::OnRequest, this, std::placeholders::_1, std::placeholders::_2));
}

RelayServer::~RelayServer() {
    LOG_DEBUG << "RelayServer destroyed with " << inflight() << " request(s) in flight";
}

bool RelayServer::Start(std::string* error) {
    if (!client_->Init(error)) {
        return false;
    }
    if (!server_.start(error)) {
        return false;
    }
    LOG_INFO << "relayd listening on " << server_.listenAddress().toIpPort()
             << " | POST /proxy -> " << config_.upstream().toString();
    return true;
}

size_t RelayServer::inflight() const {
    std::lock_guard<std::mutex> lock(inflight_->mutex);
    return inflight_->contexts.size();
}

std::string RelayServer::NormalizePath(const std::string& path) {
    std::string p = relay::protocol::ToLowerCopy(path);
    if (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

void RelayServer::OnRequest(const HttpRequest& req, const ResponseWriterPtr& writer) {
    LOG_INFO << "Received request: " << req.methodString() << " " << req.path() << req.query();

    const std::string path = NormalizePath(req.path());
    if (path == "/healthz" && (req.getMethod() == HttpRequest::kGet || req.getMethod() == HttpRequest::kHead)) {
        HandleHealth(writer);
    } else if (path == "/proxy" && req.getMethod() == HttpRequest::kPost) {
        HandleProxy(req, writer);
    } else {
        HandleNotFound(req, writer);
    }
}

void RelayServer::HandleHealth(const ResponseWriterPtr& writer) {
    HttpResponse response;
    response.setStatusCode(HttpResponse::k200Ok);
    response.setContentType("application/json; charset=utf-8");
    response.setBody("{\"status\":\"ok\"}");
    writer->Send(response);
}

void RelayServer::HandleNotFound(const HttpRequest& req, const ResponseWriterPtr& writer) {
    HttpResponse response;
    response.setStatusCode(HttpResponse::k404NotFound);
    response.setContentType("text/plain; charset=utf-8");
    response.setBody(std::string("Cannot ") + req.methodString() + " " + req.path());
    writer->Send(response);
}

void RelayServer::HandleProxy(const HttpRequest& req, const ResponseWriterPtr& writer) {
    if (shuttingDown_) {
        HttpResponse response(true);
        response.setStatusCode(HttpResponse::k503ServiceUnavailable);
        response.setContentType("application/json; charset=utf-8");
        response.setBody(ForwardingHandler::JsonError("Server shutting down", ""));
        writer->Send(response);
        return;
    }

    const uint64_t id = nextRequestId_.fetch_add(1);
    auto ctx = std::make_shared<RequestContext>(relay::network::EventLoop::GetEventLoopOfCurrentThread(), id);
    {
        std::lock_guard<std::mutex> lock(inflight_->mutex);
        inflight_->contexts[id] = ctx;
    }
    std::weak_ptr<InflightRegistry> weakRegistry(inflight_);
    ctx->SetFinishHandler([weakRegistry, id]() {
        std::shared_ptr<InflightRegistry> registry = weakRegistry.lock();
        if (!registry) return;
        std::lock_guard<std::mutex> lock(registry->mutex);
        registry->contexts.erase(id);
    });
    handler_.Handle(req, writer, ctx);
}

void RelayServer::Shutdown(double drainSec, std::function<void()> onDrained) {
    if (shuttingDown_.exchange(true)) return;
    onDrained_ = std::move(onDrained);
    server_.stopAccepting();

    const size_t n = inflight();
    LOG_INFO << "relayd shutting down: " << n << " request(s) in flight, draining for up to " << drainSec << "s";
    drainDeadline_ = std::chrono::steady_clock::now() +
                     std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                         std::chrono::duration<double>(drainSec));
    CheckDrained();
}

void RelayServer::CheckDrained() {
    const size_t n = inflight();
    if (n == 0) {
        LOG_INFO << "relayd drained";
        std::function<void()> done = std::move(onDrained_);
        onDrained_ = nullptr;
        if (done) done();
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= drainDeadline_) {
        if (!deadlinePassed_) {
            deadlinePassed_ = true;
            LOG_WARN << "drain deadline passed, cancelling " << n << " request(s)";
            CancelInflight("server shutting down");
            drainDeadline_ = now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                       std::chrono::duration<double>(kCancelGraceSec));
        } else {
            LOG_ERROR << n << " request(s) still in flight after cancellation, giving up";
            std::lock_guard<std::mutex> lock(inflight_->mutex);
            inflight_->contexts.clear();
        }
    }
    loop_->RunAfter(kDrainPollSec, [this]() { CheckDrained(); });
}

void RelayServer::CancelInflight(const std::string& reason) {
    std::vector<RequestContextPtr> contexts;
    {
        std::lock_guard<std::mutex> lock(inflight_->mutex);
        for (const auto& entry : inflight_->contexts) contexts.push_back(entry.second);
    }
    for (const auto& ctx : contexts) {
        ctx->Cancel(reason);
    }
}

} // namespace relay
