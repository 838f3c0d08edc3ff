#pragma once

#include "relay/common/noncopyable.h"
#include "relay/ProxyConfig.h"
#include "relay/RequestContext.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/protocol/ResponseWriter.h"
#include "relay/upstream/UpstreamTypes.h"

#include <memory>
#include <string>

namespace relay {
namespace protocol {
class HttpRequest;
}
namespace upstream {
class UpstreamClient;
}

// Serves POST /proxy: sanitize headers, issue one upstream call, relay the
// answer buffered or streamed depending on what the caller accepts.
class ForwardingHandler : relay::common::noncopyable {
public:
    ForwardingHandler(const ProxyConfig& config, std::shared_ptr<relay::upstream::UpstreamClient> client);

    // Runs on the loop of the connection that owns writer. ctx is finished
    // when the exchange is over and cancels the upstream call when triggered.
    void Handle(const relay::protocol::HttpRequest& req,
                const relay::protocol::ResponseWriterPtr& writer,
                const RequestContextPtr& ctx);

    static bool WantsStream(const relay::protocol::HeaderMap& headers);

    // Body to forward upstream, inflated when it arrived gzip or deflate
    // coded. Returns false and fills *reject when the request has to be
    // refused instead.
    static bool PrepareBody(const relay::protocol::HttpRequest& req,
                            size_t maxBodyBytes,
                            std::string* body,
                            relay::protocol::HttpResponse* reject);

    // Transport failure -> caller response.
    static relay::protocol::HttpResponse MakeErrorResponse(const relay::upstream::UpstreamError& err);

    // Upstream answer with a fully read body (JSON value or raw text).
    static relay::protocol::HttpResponse MakeBufferedResponse(const relay::upstream::UpstreamHead& head,
                                                              const relay::upstream::UpstreamBody& body);

    static std::string JsonError(const std::string& error, const std::string& detail);

private:
    static void Relay(relay::upstream::UpstreamResponse&& response,
                      const relay::protocol::ResponseWriterPtr& writer);

    const ProxyConfig config_;
    std::shared_ptr<relay::upstream::UpstreamClient> client_;
};

} // namespace relay
