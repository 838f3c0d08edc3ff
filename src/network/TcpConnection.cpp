#include "relay/network/TcpConnection.h"
#include "relay/network/Socket.h"
#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/network/TlsContext.h"
#include "relay/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <sys/socket.h>

namespace relay {
namespace network {

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(64 * 1024 * 1024) {

    channel_->SetReadCallback(
        std::bind(&TcpConnection::HandleRead, this, std::placeholders::_1));
    channel_->SetWriteCallback(
        std::bind(&TcpConnection::HandleWrite, this));
    channel_->SetCloseCallback(
        std::bind(&TcpConnection::HandleClose, this));
    channel_->SetErrorCallback(
        std::bind(&TcpConnection::HandleError, this));

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this << " fd=" << channel_->fd()
              << " state=" << StateToString(state_);
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

const char* TcpConnection::StateToString(StateE s) {
    switch (s) {
        case kDisconnected: return "kDisconnected";
        case kConnecting: return "kConnecting";
        case kConnected: return "kConnected";
        case kDisconnecting: return "kDisconnecting";
        default: return "unknown";
    }
}

bool TcpConnection::EnableTlsClient(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost, std::string* error) {
    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(ctx));
    if (!s) {
        if (error) *error = "SSL_new failed: " + TlsContext::LastErrorString();
        return false;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_connect_state(s);

    if (!serverName.empty()) {
        const bool isIpLiteral = InetAddress(serverName, 0).valid();
        // SNI is only defined for DNS names.
        if (!isIpLiteral) {
            SSL_set_tlsext_host_name(s, serverName.c_str());
        }
        if (verifyHost) {
            int rc = isIpLiteral
                ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(s), serverName.c_str())
                : SSL_set1_host(s, serverName.c_str());
            if (rc != 1) {
                if (error) *error = "TLS: cannot set expected peer name " + serverName;
                SSL_free(s);
                return false;
            }
        }
    }

    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = kTlsHandshaking;
    return true;
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }

    if (ssl_ && tlsState_ == kTlsHandshaking && state_ == kConnected) {
        TlsDoHandshake();
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::TlsDoHandshake() {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_do_handshake(s);
    if (r == 1) {
        tlsState_ = kTlsEstablished;
        tlsWantWrite_ = false;
        LOG_DEBUG << "TLS established [" << name_ << "] " << SSL_get_version(s);
        if (outputBuffer_.ReadableBytes() > 0) {
            if (!channel_->IsWriting()) channel_->EnableWriting();
        } else if (channel_->IsWriting()) {
            channel_->DisableWriting();
        }
        return true;
    }

    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        tlsWantWrite_ = false;
        if (channel_->IsWriting()) channel_->DisableWriting();
        return false;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return false;
    }

    const long verify = SSL_get_verify_result(s);
    std::string detail;
    if (verify != X509_V_OK) {
        detail = X509_verify_cert_error_string(verify);
    } else {
        detail = TlsContext::LastErrorString();
        if (detail.empty()) detail = (e == SSL_ERROR_SYSCALL) ? std::strerror(errno) : "error " + std::to_string(e);
    }
    lastError_ = "TLS handshake with " + peerAddr_.toIpPort() + " failed: " + detail;
    LOG_WARN << lastError_;
    tlsState_ = kTlsFailed;
    HandleClose();
    return false;
}

ssize_t TcpConnection::TlsReadOnce(char* buf, size_t cap, int* savedErrno) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_read(s, buf, static_cast<int>(cap));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) return -2;
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return -2;
    }
    if (e == SSL_ERROR_ZERO_RETURN) return 0;
    if (e == SSL_ERROR_SYSCALL && errno == 0) return 0; // peer closed without close_notify
    *savedErrno = (e == SSL_ERROR_SYSCALL && errno != 0) ? errno : EIO;
    if (e == SSL_ERROR_SSL) lastError_ = "TLS read failed: " + TlsContext::LastErrorString();
    return -1;
}

ssize_t TcpConnection::TlsWriteOnce(const void* data, size_t len, int* savedErrno) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    ERR_clear_error();
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) return -2;
    *savedErrno = (e == SSL_ERROR_SYSCALL && errno != 0) ? errno : EIO;
    return -1;
}

void TcpConnection::TlsReadAll(std::chrono::system_clock::time_point receiveTime) {
    // SSL buffers whole records, so keep reading until OpenSSL asks for more
    // socket data; epoll will not report bytes already pulled into OpenSSL.
    char tmp[16 * 1024];
    size_t total = 0;
    bool eof = false;
    int savedErrno = 0;
    ssize_t n = 0;
    ERR_clear_error();
    while (true) {
        n = TlsReadOnce(tmp, sizeof(tmp), &savedErrno);
        if (n > 0) {
            inputBuffer_.Append(tmp, static_cast<size_t>(n));
            total += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) eof = true;
        break;
    }

    if (total > 0 && messageCallback_) {
        messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
    }
    if (eof) {
        HandleClose();
    } else if (n == -1) {
        if (lastError_.empty()) lastError_ = std::string("read: ") + std::strerror(savedErrno);
        LOG_DEBUG << "TcpConnection::HandleRead [" << name_ << "] " << lastError_;
        HandleClose();
    }
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (ssl_) {
        if (tlsState_ == kTlsHandshaking) {
            if (!TlsDoHandshake()) return;
        }
        if (tlsState_ == kTlsEstablished) {
            TlsReadAll(receiveTime);
        }
        return;
    }

    int savedErrno = 0;
    ssize_t n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else if (savedErrno != EAGAIN && savedErrno != EINTR) {
        lastError_ = std::string("read: ") + std::strerror(savedErrno);
        LOG_DEBUG << "TcpConnection::HandleRead [" << name_ << "] " << lastError_;
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (ssl_ && tlsState_ == kTlsHandshaking) {
        if (!TlsDoHandshake()) return;
    }

    if (channel_->IsWriting()) {
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            return;
        }
        ssize_t n = 0;
        int savedErrno = 0;
        if (ssl_) {
            n = TlsWriteOnce(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
            if (n == -2) return;
        } else {
            n = ::write(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
            if (n < 0) savedErrno = errno;
        }
        if (n > 0) {
            outputBuffer_.Retrieve(n);
            if (outputBuffer_.ReadableBytes() == 0) {
                channel_->DisableWriting();
                if (writeCompleteCallback_) {
                    loop_->QueueInLoop(
                        std::bind(writeCompleteCallback_, shared_from_this()));
                }
                if (state_ == kDisconnecting) {
                    ShutdownInLoop();
                }
            }
        } else if (savedErrno != EAGAIN && savedErrno != EINTR) {
            lastError_ = std::string("write: ") + std::strerror(savedErrno);
            LOG_DEBUG << "TcpConnection::HandleWrite [" << name_ << "] " << lastError_;
            HandleClose();
        }
    } else {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "fd = " << channel_->fd() << " state = " << StateToString(state_);
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }

    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    const int err = Socket::GetSocketError(channel_->fd());
    if (err != 0) {
        lastError_ = std::strerror(err);
        LOG_DEBUG << "TcpConnection::HandleError name:" << name_ << " - SO_ERROR:" << err << " " << lastError_;
    }
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ == kConnected) {
        if (loop_->IsInLoopThread()) {
            SendInLoop(data, len);
        } else {
            std::string msg(static_cast<const char*>(data), len);
            loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
                ptr->SendInLoop(msg.data(), msg.size());
            });
        }
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    if (state_ == kDisconnected) {
        LOG_DEBUG << "disconnected, give up writing";
        return;
    }

    const bool transportReady = !ssl_ || tlsState_ == kTlsEstablished;

    // if nothing in output queue, try write directly
    if (transportReady && !channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        if (ssl_) {
            const ssize_t r = TlsWriteOnce(data, len, &savedErrno);
            nwrote = (r == -2) ? 0 : r;
        } else {
            nwrote = ::write(channel_->fd(), data, len);
            if (nwrote < 0) savedErrno = errno;
        }
        if (nwrote >= 0) {
            remaining = len - nwrote;
            if (remaining == 0 && writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
        } else {
            nwrote = 0;
            if (savedErrno != EWOULDBLOCK) {
                LOG_DEBUG << "TcpConnection::SendInLoop [" << name_ << "] " << std::strerror(savedErrno);
                if (savedErrno == EPIPE || savedErrno == ECONNRESET) {
                    lastError_ = std::string("write: ") + std::strerror(savedErrno);
                    faultError = true;
                }
            }
        }
    }

    // append remaining to buffer
    if (!faultError && remaining > 0) {
        size_t oldLen = outputBuffer_.ReadableBytes();
        if (oldLen + remaining >= highWaterMark_
            && oldLen < highWaterMark_
            && highWaterMarkCallback_) {
            loop_->QueueInLoop(std::bind(highWaterMarkCallback_, shared_from_this(), oldLen + remaining));
        }
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (transportReady && !channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([conn = shared_from_this()]() { conn->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        if (ssl_ && tlsState_ == kTlsEstablished) {
            SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
        }
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        // Queued so callers may force-close from inside their own callbacks.
        loop_->QueueInLoop([conn = shared_from_this()]() {
            conn->ForceCloseInLoop();
        });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (!reading_ && state_ != kDisconnected) {
        reading_ = true;
        channel_->EnableReading();
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_ && state_ != kDisconnected) {
        reading_ = false;
        channel_->DisableReading();
    }
}

void TcpConnection::SetTcpNoDelay(bool on) {
    socket_->SetTcpNoDelay(on);
}

} // namespace network
} // namespace relay
