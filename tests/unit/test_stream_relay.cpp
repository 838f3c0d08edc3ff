#include "relay/StreamRelay.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/common/Logger.h"
#include <cassert>
#include <memory>
#include <string>

using namespace relay;
using namespace relay::protocol;
using namespace relay::upstream;
using namespace relay::common;

// Records what a handler does with the downstream side.
class RecordingWriter : public ResponseWriter {
public:
    void Send(const HttpResponse& response) override {
        headersSent = true;
        open = false;
        sentStatus = response.statusCode();
        sentBody = response.body();
        sentContentType = response.getHeader("Content-Type");
        sentHeaders = response.headers();
    }
    void BeginStream(int status, const HeaderList& headers) override {
        headersSent = true;
        streamStatus = status;
        streamHeaders = headers;
    }
    void Write(const char* data, size_t len) override { written.append(data, len); }
    void End() override {
        ended = true;
        open = false;
    }
    void Abort() override {
        aborted = true;
        open = false;
    }
    bool HeadersSent() const override { return headersSent; }
    bool IsOpen() const override { return open; }
    void SetCompletionCallback(CompletionCallback) override {}
    void SetFlowControl(std::function<void()> onBackpressure, std::function<void()> onDrain) override {
        backpressure = std::move(onBackpressure);
        drain = std::move(onDrain);
    }

    bool headersSent{false};
    bool open{true};
    bool ended{false};
    bool aborted{false};
    int sentStatus{0};
    std::string sentBody;
    std::string sentContentType;
    HeaderList sentHeaders;
    int streamStatus{0};
    HeaderList streamHeaders;
    std::string written;
    std::function<void()> backpressure;
    std::function<void()> drain;
};

static HeaderList sseHeaders() {
    return {{"Content-Type", "text/event-stream"}, {"Cache-Control", "no-cache"}};
}

void testCompleted() {
    auto writer = std::make_shared<RecordingWriter>();
    auto stream = std::make_shared<ByteStream>();
    auto relay = std::make_shared<StreamRelay>(writer, 200, sseHeaders());
    StreamRelay::Outcome seen = StreamRelay::Outcome::kPending;
    relay->SetOutcomeCallback([&](StreamRelay::Outcome o, const std::string&) { seen = o; });

    // Bytes pushed before the consumer attaches are replayed.
    stream->Push("data: a\n\n", 9);
    relay->Attach(stream);
    assert(writer->streamStatus == 200);
    assert(writer->streamHeaders.size() == 2);
    assert(writer->written == "data: a\n\n");

    stream->Push("data: b\n\n", 9);
    stream->Close();
    assert(writer->written == "data: a\n\ndata: b\n\n");
    assert(writer->ended);
    assert(!writer->aborted);
    assert(seen == StreamRelay::Outcome::kCompleted);
    assert(relay->bytesRelayed() == 18);
    LOG_INFO << "Stream Completed PASS";
}

void testEmptyStreamStillSendsHead() {
    auto writer = std::make_shared<RecordingWriter>();
    auto stream = std::make_shared<ByteStream>();
    auto relay = std::make_shared<StreamRelay>(writer, 201, sseHeaders());
    relay->Attach(stream);
    stream->Close();
    assert(writer->streamStatus == 201);
    assert(writer->written.empty());
    assert(writer->ended);
    assert(relay->outcome() == StreamRelay::Outcome::kCompleted);
    LOG_INFO << "Empty Stream PASS";
}

void testFailedBeforeData() {
    auto writer = std::make_shared<RecordingWriter>();
    auto stream = std::make_shared<ByteStream>();
    auto relay = std::make_shared<StreamRelay>(writer, 200, sseHeaders());
    std::string detail;
    relay->SetOutcomeCallback([&](StreamRelay::Outcome, const std::string& d) { detail = d; });
    relay->Attach(stream);
    stream->Fail("socket hang up");

    assert(writer->sentStatus == 502);
    assert(writer->sentBody == "stream error: socket hang up");
    assert(writer->sentContentType == "text/plain; charset=utf-8");
    // Upstream headers ride along, content type replaced.
    assert(FindHeader(writer->sentHeaders, "Cache-Control"));
    assert(!writer->aborted);
    assert(relay->outcome() == StreamRelay::Outcome::kFailedBeforeData);
    assert(detail == "socket hang up");
    LOG_INFO << "Failed Before Data PASS";
}

void testFailedAfterData() {
    auto writer = std::make_shared<RecordingWriter>();
    auto stream = std::make_shared<ByteStream>();
    auto relay = std::make_shared<StreamRelay>(writer, 200, sseHeaders());
    relay->Attach(stream);
    stream->Push("data: a\n\n", 9);
    stream->Fail("aborted");

    assert(writer->written == "data: a\n\n");
    assert(writer->aborted);
    assert(!writer->ended);
    assert(writer->sentStatus == 0);
    assert(relay->outcome() == StreamRelay::Outcome::kFailedAfterData);
    assert(std::string(StreamRelay::OutcomeName(relay->outcome())) == "failed-after-data");
    LOG_INFO << "Failed After Data PASS";
}

void testBackpressureReachesProducer() {
    auto writer = std::make_shared<RecordingWriter>();
    auto stream = std::make_shared<ByteStream>();
    int pauses = 0, resumes = 0;
    ByteStream::ProducerControl control;
    control.pause = [&]() { ++pauses; };
    control.resume = [&]() { ++resumes; };
    stream->SetProducerControl(control);

    auto relay = std::make_shared<StreamRelay>(writer, 200, sseHeaders());
    relay->Attach(stream);
    assert(writer->backpressure && writer->drain);

    writer->backpressure();
    writer->backpressure();
    assert(stream->paused());
    assert(pauses == 1);
    writer->drain();
    assert(!stream->paused());
    assert(resumes == 1);

    // Stream gone: the hooks must be harmless.
    std::function<void()> bp = writer->backpressure;
    stream->Close();
    relay.reset();
    stream.reset();
    bp();
    LOG_INFO << "Backpressure PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testCompleted();
    testEmptyStreamStillSendsHead();
    testFailedBeforeData();
    testFailedAfterData();
    testBackpressureReachesProducer();
    return 0;
}
