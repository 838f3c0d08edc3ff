#include "relay/HeaderSanitizer.h"

namespace relay {

using relay::protocol::HeaderList;
using relay::protocol::HeaderMap;
using relay::protocol::IEquals;

namespace {

const char* const kStripped[] = {
    "authorization",
    "content-type",
    "host",
    "connection",
    "keep-alive",
    "proxy-connection",
    "transfer-encoding",
    "upgrade",
    "te",
    "trailers",
    "proxy-authorization",
    "proxy-authenticate",
    "content-length",
};

const char* const kSensitive[] = {
    "authorization",
    "proxy-authorization",
    "cookie",
    "x-api-key",
};

const char* const kResponseStripped[] = {
    "transfer-encoding",
    "content-length",
    "connection",
};

} // namespace

bool HeaderSanitizer::IsStripped(const std::string& name) {
    for (const char* h : kStripped) {
        if (IEquals(name, h)) return true;
    }
    return false;
}

bool HeaderSanitizer::IsSensitive(const std::string& name) {
    for (const char* h : kSensitive) {
        if (IEquals(name, h)) return true;
    }
    return false;
}

HeaderMap HeaderSanitizer::Sanitize(const HeaderMap& incoming) {
    HeaderMap out;
    for (const auto& h : incoming) {
        if (!IsStripped(h.first)) out.emplace(h.first, h.second);
    }
    out["content-type"] = "application/json";

    auto auth = incoming.find("authorization");
    out["authorization"] = auth != incoming.end() ? auth->second : std::string();
    return out;
}

HeaderList HeaderSanitizer::FilterResponseHeaders(const HeaderList& upstream) {
    HeaderList out;
    out.reserve(upstream.size());
    for (const auto& h : upstream) {
        bool drop = false;
        for (const char* name : kResponseStripped) {
            if (IEquals(h.first, name)) {
                drop = true;
                break;
            }
        }
        if (!drop) out.push_back(h);
    }
    return out;
}

std::string HeaderSanitizer::Redact(const std::string& name, const std::string& value) {
    if (!IsSensitive(name) || value.empty()) return value;
    if (IEquals(name, "authorization") || IEquals(name, "proxy-authorization")) {
        size_t sp = value.find(' ');
        if (sp != std::string::npos && sp > 0) {
            return value.substr(0, sp) + " ***";
        }
    }
    return "***";
}

std::string HeaderSanitizer::FormatForLog(const HeaderMap& headers) {
    std::string out;
    for (const auto& h : headers) {
        if (!out.empty()) out += "; ";
        out += h.first;
        out += ": ";
        out += Redact(h.first, h.second);
    }
    return out;
}

} // namespace relay
