#pragma once

#include "relay/common/noncopyable.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace upstream {

// Receives the bytes of a ByteStream. Exactly one of OnEnd / OnError ends it.
class ByteStreamConsumer {
public:
    virtual ~ByteStreamConsumer() = default;

    virtual void OnData(const char* data, size_t len) = 0;
    virtual void OnEnd() = 0;
    virtual void OnError(const std::string& message) = 0;
};

// Single producer, single consumer byte pipe living on one event loop.
// The producer pushes what it reads; events that happen before a consumer is
// attached are kept and replayed in order by SetConsumer().
class ByteStream : relay::common::noncopyable {
public:
    // Hooks into the producer, used for flow control and cancellation.
    struct ProducerControl {
        std::function<void()> pause;
        std::function<void()> resume;
        std::function<void()> cancel;
    };

    ByteStream() = default;

    void SetProducerControl(ProducerControl control) { control_ = std::move(control); }

    // Consumer side
    void SetConsumer(const std::shared_ptr<ByteStreamConsumer>& consumer);
    void Pause();
    void Resume();
    // Stops the producer; the consumer receives no further events.
    void Cancel();

    // Producer side
    void Push(const char* data, size_t len);
    void Close();
    void Fail(const std::string& message);

    bool finished() const { return state_ != kOpen; }
    bool paused() const { return paused_; }
    size_t bytesPushed() const { return bytesPushed_; }

private:
    enum State { kOpen, kEnded, kFailed, kCancelled };

    void Deliver();

    State state_{kOpen};
    bool paused_{false};
    bool delivered_{false};
    size_t bytesPushed_{0};
    std::string pending_;
    std::string error_;
    std::shared_ptr<ByteStreamConsumer> consumer_;
    ProducerControl control_;
};

} // namespace upstream
} // namespace relay
