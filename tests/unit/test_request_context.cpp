#include "relay/RequestContext.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"
#include <cassert>
#include <memory>
#include <string>
#include <thread>

using namespace relay;
using namespace relay::network;
using namespace relay::common;

void testCancelRunsHandlerOnce() {
    EventLoop loop;
    auto ctx = std::make_shared<RequestContext>(&loop, 7);
    int calls = 0;
    std::string reason;
    ctx->SetCancelHandler([&](const std::string& r) {
        ++calls;
        reason = r;
    });
    ctx->Cancel("client disconnected");
    ctx->Cancel("server shutting down");
    assert(ctx->cancelled());
    assert(calls == 1);
    assert(reason == "client disconnected");

    bool finished = false;
    ctx->SetFinishHandler([&]() { finished = true; });
    ctx->Finish();
    ctx->Finish();
    assert(finished);
    assert(ctx->finished());
    LOG_INFO << "Cancel Once PASS";
}

void testLateHandlerSeesCancellation() {
    EventLoop loop;
    auto ctx = std::make_shared<RequestContext>(&loop, 1);
    ctx->Cancel("server shutting down");
    std::string reason;
    ctx->SetCancelHandler([&](const std::string& r) { reason = r; });
    assert(reason == "server shutting down");
    LOG_INFO << "Late Handler PASS";
}

void testFinishedIgnoresCancel() {
    EventLoop loop;
    auto ctx = std::make_shared<RequestContext>(&loop, 2);
    int calls = 0;
    ctx->SetCancelHandler([&](const std::string&) { ++calls; });
    ctx->Finish();
    ctx->Cancel("too late");
    assert(calls == 0);
    assert(!ctx->cancelled());
    ctx->SetCancelHandler([&](const std::string&) { ++calls; });
    assert(calls == 0);
    LOG_INFO << "Finished Ignores Cancel PASS";
}

void testCancelFromOtherThread() {
    EventLoop loop;
    auto ctx = std::make_shared<RequestContext>(&loop, 3);
    std::thread::id handlerThread;
    ctx->SetCancelHandler([&](const std::string&) {
        handlerThread = std::this_thread::get_id();
        loop.Quit();
    });
    std::thread t([ctx]() { ctx->Cancel("server shutting down"); });
    loop.Loop();
    t.join();
    assert(ctx->cancelled());
    assert(handlerThread == std::this_thread::get_id());
    LOG_INFO << "Cancel From Other Thread PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testCancelRunsHandlerOnce();
    testLateHandlerSeesCancellation();
    testFinishedIgnoresCancel();
    testCancelFromOtherThread();
    return 0;
}
