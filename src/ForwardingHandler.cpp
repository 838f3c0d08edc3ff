#include "relay/ForwardingHandler.h"
#include "relay/HeaderSanitizer.h"
#include "relay/StreamRelay.h"
#include "relay/protocol/Compression.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/upstream/ByteStream.h"
#include "relay/upstream/UpstreamCall.h"
#include "relay/upstream/UpstreamClient.h"
#include "relay/common/Config.h"
#include "relay/common/Logger.h"

#include <json/json.h>

#include <memory>

namespace relay {

using relay::protocol::Compression;
using relay::protocol::HttpRequest;
using relay::protocol::Inflater;
using relay::protocol::HttpResponse;
using relay::protocol::ResponseWriter;
using relay::protocol::ResponseWriterPtr;
using relay::upstream::ByteStream;
using relay::upstream::ResponseMode;
using relay::upstream::UpstreamBody;
using relay::upstream::UpstreamCall;
using relay::upstream::UpstreamCallbacks;
using relay::upstream::UpstreamError;
using relay::upstream::UpstreamHead;
using relay::upstream::UpstreamRequest;
using relay::upstream::UpstreamResponse;

namespace {

const char* const kJsonType = "application/json; charset=utf-8";

std::string ToCompactJson(const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, v);
}

bool ParseJson(const std::string& text, bool strict, Json::Value* out, std::string* errs) {
    Json::CharReaderBuilder builder;
    if (strict) Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), out, errs);
}

// "Application/JSON; charset=utf-8" -> "application/json"
std::string MediaType(const std::string& contentType) {
    const size_t semi = contentType.find(';');
    return relay::protocol::ToLowerCopy(relay::common::Config::Trim(contentType.substr(0, semi)));
}

} // namespace

ForwardingHandler::ForwardingHandler(const ProxyConfig& config,
                                     std::shared_ptr<relay::upstream::UpstreamClient> client)
    : config_(config),
      client_(std::move(client)) {
}

bool ForwardingHandler::WantsStream(const relay::protocol::HeaderMap& headers) {
    auto it = headers.find("accept");
    return it != headers.end() && it->second.find("text/event-stream") != std::string::npos;
}

std::string ForwardingHandler::JsonError(const std::string& error, const std::string& detail) {
    Json::Value v(Json::objectValue);
    v["error"] = error;
    if (!detail.empty()) v["detail"] = detail;
    return ToCompactJson(v);
}

bool ForwardingHandler::PrepareBody(const HttpRequest& req, size_t maxBodyBytes,
                                    std::string* body, HttpResponse* reject) {
    if (MediaType(req.getHeader("Content-Type")) != "application/json" || req.body().empty()) {
        *body = "{}";
        return true;
    }

    std::string inflated;
    const std::string encoding = relay::protocol::ToLowerCopy(relay::common::Config::Trim(req.getHeader("Content-Encoding")));
    const Compression::Encoding enc = Compression::ParseContentEncoding(encoding);
    if (enc == Compression::Encoding::kUnknown) {
        reject->setStatusCode(HttpResponse::k415UnsupportedMediaType);
        reject->setContentType(kJsonType);
        reject->setBody(JsonError("Unsupported Content-Encoding", encoding));
        return false;
    }
    if (enc != Compression::Encoding::kIdentity) {
        Inflater inflater(enc);
        const std::string& packed = req.body();
        if (!inflater.Feed(packed.data(), packed.size(), &inflated) || !inflater.Finish(&inflated)) {
            reject->setStatusCode(HttpResponse::k400BadRequest);
            reject->setContentType(kJsonType);
            reject->setBody(JsonError("Invalid JSON body", inflater.error()));
            return false;
        }
        if (inflated.size() > maxBodyBytes) {
            reject->setStatusCode(HttpResponse::k413PayloadTooLarge);
            reject->setContentType(kJsonType);
            reject->setBody(JsonError("Payload Too Large", ""));
            return false;
        }
    }
    const std::string& raw = enc == Compression::Encoding::kIdentity ? req.body() : inflated;

    Json::Value parsed;
    std::string errs;
    if (!ParseJson(raw, true, &parsed, &errs) || !(parsed.isObject() || parsed.isArray())) {
        if (errs.empty()) errs = "top-level value must be an object or an array";
        reject->setStatusCode(HttpResponse::k400BadRequest);
        reject->setContentType(kJsonType);
        reject->setBody(JsonError("Invalid JSON body", relay::common::Config::Trim(errs)));
        return false;
    }
    *body = raw;
    return true;
}

HttpResponse ForwardingHandler::MakeErrorResponse(const UpstreamError& err) {
    HttpResponse out;
    out.setStatusCode(err.status ? *err.status : HttpResponse::k502BadGateway);
    out.setContentType(kJsonType);
    if (err.payload) {
        Json::Value parsed;
        std::string errs;
        if (ParseJson(*err.payload, false, &parsed, &errs)) {
            out.setBody(*err.payload);
        } else {
            out.setBody(ToCompactJson(Json::Value(*err.payload)));
        }
    } else {
        out.setBody(JsonError("Upstream request failed", err.message));
    }
    return out;
}

HttpResponse ForwardingHandler::MakeBufferedResponse(const UpstreamHead& head, const UpstreamBody& body) {
    HttpResponse out;
    out.setStatusCode(head.status);
    for (const auto& h : HeaderSanitizer::FilterResponseHeaders(head.headers)) {
        out.addHeader(h.first, h.second);
    }
    const bool typed = out.hasHeader("Content-Type");

    if (const auto* json = std::get_if<relay::upstream::JsonBody>(&body)) {
        out.setBody(json->text);
        if (!typed) out.setContentType(kJsonType);
    } else if (const std::string* text = std::get_if<std::string>(&body)) {
        out.setBody(*text);
        if (!typed && !text->empty()) out.setContentType("text/html; charset=utf-8");
    } else {
        LOG_ERROR << "ForwardingHandler: open stream handed to the buffered writer";
        HttpResponse failed;
        failed.setStatusCode(HttpResponse::k502BadGateway);
        failed.setContentType(kJsonType);
        failed.setBody(JsonError("Upstream request failed", "unexpected stream body"));
        return failed;
    }
    return out;
}

void ForwardingHandler::Relay(UpstreamResponse&& response, const ResponseWriterPtr& writer) {
    if (auto* stream = std::get_if<std::shared_ptr<ByteStream>>(&response.body)) {
        auto consumer = std::make_shared<StreamRelay>(
            writer, response.head.status, HeaderSanitizer::FilterResponseHeaders(response.head.headers));
        consumer->Attach(*stream);
        return;
    }
    // Also taken in stream mode when the upstream answered without a body stream.
    writer->Send(MakeBufferedResponse(response.head, response.body));
}

void ForwardingHandler::Handle(const HttpRequest& req, const ResponseWriterPtr& writer, const RequestContextPtr& ctx) {
    UpstreamRequest upstreamReq;
    HttpResponse reject;
    if (!PrepareBody(req, config_.maxBodyBytes(), &upstreamReq.body, &reject)) {
        LOG_WARN << "request#" << ctx->id() << " rejected with " << reject.statusCode();
        writer->Send(reject);
        ctx->Finish();
        return;
    }
    upstreamReq.headers = HeaderSanitizer::Sanitize(req.headers());
    // The forwarded body is always identity coded.
    upstreamReq.headers.erase("content-encoding");
    upstreamReq.mode = WantsStream(req.headers()) ? ResponseMode::kStream : ResponseMode::kBuffered;

    LOG_INFO << "request#" << ctx->id() << " forwarding to " << config_.upstream().toString()
             << (upstreamReq.mode == ResponseMode::kStream ? " (stream)" : "");
    LOG_DEBUG << "request#" << ctx->id() << " upstream headers: "
              << HeaderSanitizer::FormatForLog(upstreamReq.headers);

    writer->SetCompletionCallback([ctx](bool completed) {
        if (!completed) ctx->Cancel("client disconnected");
        ctx->Finish();
    });

    const uint64_t id = ctx->id();
    UpstreamCallbacks callbacks;
    callbacks.onResponse = [writer, id](UpstreamResponse&& response) {
        LOG_DEBUG << "request#" << id << " upstream answered " << response.head.status;
        Relay(std::move(response), writer);
    };
    callbacks.onError = [writer, id](const UpstreamError& err) {
        LOG_WARN << "request#" << id << " upstream request failed: " << err.message;
        writer->Send(MakeErrorResponse(err));
    };

    std::shared_ptr<UpstreamCall> call = client_->Post(ctx->loop(), std::move(upstreamReq), std::move(callbacks));

    // The handler keeps the call alive until the exchange finishes.
    std::weak_ptr<ResponseWriter> weakWriter(writer);
    ctx->SetCancelHandler([call, weakWriter](const std::string& reason) {
        call->Cancel();
        ResponseWriterPtr w = weakWriter.lock();
        if (!w || !w->IsOpen()) return;
        if (w->HeadersSent()) {
            w->Abort();
            return;
        }
        HttpResponse response;
        response.setStatusCode(HttpResponse::k503ServiceUnavailable);
        response.setContentType(kJsonType);
        response.setBody(JsonError("request cancelled: " + reason, ""));
        w->Send(response);
    });
}

} // namespace relay
