#include "relay/upstream/ByteStream.h"
#include "relay/common/Logger.h"

namespace relay {
namespace upstream {

void ByteStream::SetConsumer(const std::shared_ptr<ByteStreamConsumer>& consumer) {
    if (state_ == kCancelled) return;
    consumer_ = consumer;
    Deliver();
}

void ByteStream::Deliver() {
    if (!consumer_) return;
    // Keep the consumer alive while it runs; it may drop its last owner.
    std::shared_ptr<ByteStreamConsumer> consumer = consumer_;
    if (!pending_.empty()) {
        std::string data;
        data.swap(pending_);
        consumer->OnData(data.data(), data.size());
    }
    if (delivered_ || state_ == kOpen || state_ == kCancelled) return;
    delivered_ = true;
    consumer_.reset();
    control_ = ProducerControl();
    if (state_ == kEnded) {
        consumer->OnEnd();
    } else {
        consumer->OnError(error_);
    }
}

void ByteStream::Pause() {
    if (paused_ || state_ != kOpen) return;
    paused_ = true;
    if (control_.pause) control_.pause();
}

void ByteStream::Resume() {
    if (!paused_) return;
    paused_ = false;
    if (state_ == kOpen && control_.resume) control_.resume();
}

void ByteStream::Cancel() {
    if (state_ == kCancelled || delivered_) return;
    const bool wasOpen = (state_ == kOpen);
    state_ = kCancelled;
    consumer_.reset();
    pending_.clear();
    ProducerControl control = std::move(control_);
    control_ = ProducerControl();
    if (wasOpen && control.cancel) {
        control.cancel();
    }
}

void ByteStream::Push(const char* data, size_t len) {
    if (state_ != kOpen || len == 0) return;
    bytesPushed_ += len;
    if (consumer_ && pending_.empty()) {
        std::shared_ptr<ByteStreamConsumer> consumer = consumer_;
        consumer->OnData(data, len);
        return;
    }
    pending_.append(data, len);
    Deliver();
}

void ByteStream::Close() {
    if (state_ != kOpen) return;
    state_ = kEnded;
    Deliver();
}

void ByteStream::Fail(const std::string& message) {
    if (state_ != kOpen) return;
    state_ = kFailed;
    error_ = message;
    LOG_DEBUG << "ByteStream failed after " << bytesPushed_ << " bytes: " << message;
    Deliver();
}

} // namespace upstream
} // namespace relay
