#include "relay/StreamRelay.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/common/Logger.h"

namespace relay {

using relay::protocol::HttpResponse;
using relay::upstream::ByteStream;

StreamRelay::StreamRelay(relay::protocol::ResponseWriterPtr writer, int status, relay::protocol::HeaderList headers)
    : writer_(std::move(writer)),
      status_(status),
      headers_(std::move(headers)) {
}

const char* StreamRelay::OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::kPending: return "pending";
        case Outcome::kCompleted: return "completed";
        case Outcome::kFailedBeforeData: return "failed-before-data";
        case Outcome::kFailedAfterData: return "failed-after-data";
    }
    return "unknown";
}

void StreamRelay::Attach(const std::shared_ptr<ByteStream>& stream) {
    std::weak_ptr<ByteStream> weakStream(stream);
    writer_->SetFlowControl(
        [weakStream]() {
            if (auto s = weakStream.lock()) s->Pause();
        },
        [weakStream]() {
            if (auto s = weakStream.lock()) s->Resume();
        });
    stream->SetConsumer(shared_from_this());
}

void StreamRelay::BeginIfNeeded() {
    if (!writer_->HeadersSent()) {
        writer_->BeginStream(status_, headers_);
    }
}

void StreamRelay::OnData(const char* data, size_t len) {
    if (outcome_ != Outcome::kPending || len == 0) return;
    BeginIfNeeded();
    writer_->Write(data, len);
    bytesRelayed_ += len;
}

void StreamRelay::OnEnd() {
    if (outcome_ != Outcome::kPending) return;
    BeginIfNeeded();
    writer_->End();
    Settle(Outcome::kCompleted, std::string());
}

void StreamRelay::OnError(const std::string& message) {
    if (outcome_ != Outcome::kPending) return;
    if (bytesRelayed_ == 0 && !writer_->HeadersSent()) {
        HttpResponse response;
        response.setStatusCode(HttpResponse::k502BadGateway);
        for (const auto& h : headers_) {
            response.addHeader(h.first, h.second);
        }
        response.setContentType("text/plain; charset=utf-8");
        response.setBody("stream error: " + message);
        writer_->Send(response);
        Settle(Outcome::kFailedBeforeData, message);
    } else {
        // Head is gone already; cut the connection so the caller sees a truncated body.
        writer_->Abort();
        Settle(Outcome::kFailedAfterData, message);
    }
}

void StreamRelay::Settle(Outcome outcome, const std::string& detail) {
    outcome_ = outcome;
    if (outcome == Outcome::kCompleted) {
        LOG_DEBUG << "StreamRelay: completed after " << bytesRelayed_ << " bytes";
    } else {
        LOG_WARN << "StreamRelay: upstream stream error (" << OutcomeName(outcome)
                 << ", " << bytesRelayed_ << " bytes relayed): " << detail;
    }
    OutcomeCallback cb = std::move(outcomeCallback_);
    outcomeCallback_ = nullptr;
    if (cb) cb(outcome, detail);
}

} // namespace relay
