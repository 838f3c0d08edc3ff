#pragma once

#include "relay/common/noncopyable.h"
#include "relay/protocol/ResponseWriter.h"
#include "relay/upstream/ByteStream.h"

#include <functional>
#include <memory>
#include <string>

namespace relay {

// Consumer end of an upstream byte stream: relays every chunk to the caller
// unchanged, as it arrives. The response head goes out with the first byte,
// so a stream that fails before producing anything can still turn into a 502.
class StreamRelay : public relay::upstream::ByteStreamConsumer,
                    public std::enable_shared_from_this<StreamRelay>,
                    relay::common::noncopyable {
public:
    enum class Outcome {
        kPending,
        kCompleted,
        kFailedBeforeData,
        kFailedAfterData,
    };
    using OutcomeCallback = std::function<void(Outcome outcome, const std::string& detail)>;

    // headers are the filtered upstream headers.
    StreamRelay(relay::protocol::ResponseWriterPtr writer, int status, relay::protocol::HeaderList headers);

    // Subscribes to stream and wires caller backpressure to it.
    void Attach(const std::shared_ptr<relay::upstream::ByteStream>& stream);
    void SetOutcomeCallback(OutcomeCallback cb) { outcomeCallback_ = std::move(cb); }

    void OnData(const char* data, size_t len) override;
    void OnEnd() override;
    void OnError(const std::string& message) override;

    Outcome outcome() const { return outcome_; }
    size_t bytesRelayed() const { return bytesRelayed_; }

    static const char* OutcomeName(Outcome outcome);

private:
    void BeginIfNeeded();
    void Settle(Outcome outcome, const std::string& detail);

    relay::protocol::ResponseWriterPtr writer_;
    const int status_;
    const relay::protocol::HeaderList headers_;
    Outcome outcome_{Outcome::kPending};
    size_t bytesRelayed_{0};
    OutcomeCallback outcomeCallback_;
};

} // namespace relay
