#include "relay/upstream/UpstreamClient.h"
#include "relay/upstream/UpstreamCall.h"
#include "relay/upstream/Resolver.h"
#include "relay/network/TlsContext.h"
#include "relay/common/Logger.h"

namespace relay {
namespace upstream {

const char* const UpstreamClient::kUserAgent = "relay/1.0";

UpstreamClient::UpstreamClient(const Options& options)
    : options_(options),
      resolver_(new Resolver(options.resolverThreads)),
      nextCallId_(1) {
}

UpstreamClient::~UpstreamClient() = default;

bool UpstreamClient::Init(std::string* error) {
    if (!options_.url.tls()) {
        return true;
    }
    auto ctx = std::make_unique<relay::network::TlsContext>();
    if (!ctx->InitClient(options_.verifyTls, options_.caFile, error)) {
        return false;
    }
    tls_ = std::move(ctx);
    LOG_DEBUG << "UpstreamClient: TLS client context ready (verify=" << options_.verifyTls << ")";
    return true;
}

UpstreamCallPtr UpstreamClient::Post(relay::network::EventLoop* loop,
                                     UpstreamRequest request,
                                     UpstreamCallbacks callbacks) {
    auto call = std::make_shared<UpstreamCall>(shared_from_this(), loop, nextCallId_.fetch_add(1),
                                               std::move(request), std::move(callbacks));
    loop->RunInLoop([call]() { call->Start(); });
    return call;
}

} // namespace upstream
} // namespace relay
