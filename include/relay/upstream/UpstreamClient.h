#pragma once

#include "relay/common/noncopyable.h"
#include "relay/protocol/Url.h"
#include "relay/upstream/UpstreamTypes.h"

#include <atomic>
#include <memory>
#include <string>

namespace relay {
namespace network {
class EventLoop;
class TlsContext;
}

namespace upstream {

class Resolver;
class UpstreamCall;
using UpstreamCallPtr = std::shared_ptr<UpstreamCall>;

// Process wide client for the one configured upstream. Immutable after
// Init(), so every I/O thread may issue calls through it concurrently.
class UpstreamClient : relay::common::noncopyable,
                       public std::enable_shared_from_this<UpstreamClient> {
public:
    struct Options {
        relay::protocol::Url url;
        double timeoutSec{120.0};
        bool verifyTls{true};
        std::string caFile;
        int resolverThreads{2};
    };

    static const char* const kUserAgent;

    explicit UpstreamClient(const Options& options);
    ~UpstreamClient();

    // Sets up TLS for https upstreams. Returns false and fills *error on failure.
    bool Init(std::string* error);

    const Options& options() const { return options_; }
    relay::network::TlsContext* tlsContext() const { return tls_.get(); }
    Resolver* resolver() const { return resolver_.get(); }

    // Starts one POST on loop; callbacks run on loop. Exactly one of them
    // fires unless the call is cancelled first.
    UpstreamCallPtr Post(relay::network::EventLoop* loop,
                         UpstreamRequest request,
                         UpstreamCallbacks callbacks);

private:
    const Options options_;
    std::unique_ptr<relay::network::TlsContext> tls_;
    std::unique_ptr<Resolver> resolver_;
    std::atomic<uint64_t> nextCallId_;
};

} // namespace upstream
} // namespace relay
