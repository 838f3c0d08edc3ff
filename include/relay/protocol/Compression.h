#pragma once

#include "relay/common/noncopyable.h"

#include <cstddef>
#include <memory>
#include <string>

namespace relay {
namespace protocol {

class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
        kUnknown,
    };

    // Single content coding only; a list of codings is reported as kUnknown.
    static Encoding ParseContentEncoding(const std::string& v);
    static const char* Name(Encoding enc);
};

// Streaming decoder for gzip and deflate bodies. "deflate" accepts both the
// zlib wrapped form and raw deflate data, which some servers send instead.
class Inflater : relay::common::noncopyable {
public:
    explicit Inflater(Compression::Encoding enc);
    ~Inflater();

    // Appends the decoded bytes to *out. Returns false on corrupt input;
    // error() then says why.
    bool Feed(const char* data, size_t len, std::string* out);
    // End of input. Fails when the compressed stream was cut short.
    bool Finish(std::string* out);

    bool finished() const { return streamEnd_; }
    const std::string& error() const { return error_; }

private:
    bool Init(int windowBits);
    bool Run(const char* data, size_t len, std::string* out);

    struct State;
    std::unique_ptr<State> state_;
    Compression::Encoding enc_;
    bool initialized_{false};
    bool streamEnd_{false};
    std::string error_;
};

} // namespace protocol
} // namespace relay
