#pragma once

#include "relay/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace relay {
namespace network {

// Owns an OpenSSL SSL_CTX. One context is shared by every connection that
// uses it; OpenSSL allows SSL_new on a shared context from any thread.
class TlsContext : relay::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // Client side context. With verifyPeer the chain is checked against
    // caFile (or the system store when empty) and the host name is checked
    // per connection.
    bool InitClient(bool verifyPeer, const std::string& caFile, std::string* error);

    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

    // Drains the OpenSSL error queue into one line.
    static std::string LastErrorString();

private:
    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{true};
};

} // namespace network
} // namespace relay
