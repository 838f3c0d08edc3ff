#include "relay/protocol/Compression.h"
#include "relay/protocol/HttpHeaders.h"
#include "relay/common/Config.h"

#include <cstring>
#include <zlib.h>

namespace relay {
namespace protocol {

Compression::Encoding Compression::ParseContentEncoding(const std::string& v) {
    const std::string lv = ToLowerCopy(relay::common::Config::Trim(v));
    if (lv.empty() || lv == "identity") return Encoding::kIdentity;
    if (lv == "gzip" || lv == "x-gzip") return Encoding::kGzip;
    if (lv == "deflate") return Encoding::kDeflate;
    return Encoding::kUnknown;
}

const char* Compression::Name(Encoding enc) {
    switch (enc) {
        case Encoding::kIdentity: return "identity";
        case Encoding::kGzip: return "gzip";
        case Encoding::kDeflate: return "deflate";
        default: return "unknown";
    }
}

struct Inflater::State {
    z_stream zs;
};

Inflater::Inflater(Compression::Encoding enc)
    : state_(new State), enc_(enc) {
    std::memset(&state_->zs, 0, sizeof(state_->zs));
}

Inflater::~Inflater() {
    if (initialized_) {
        inflateEnd(&state_->zs);
    }
}

bool Inflater::Init(int windowBits) {
    if (inflateInit2(&state_->zs, windowBits) != Z_OK) {
        error_ = "inflateInit2 failed";
        return false;
    }
    initialized_ = true;
    return true;
}

bool Inflater::Run(const char* data, size_t len, std::string* out) {
    z_stream& zs = state_->zs;
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);

    char buf[16384];
    while (zs.avail_in > 0 && !streamEnd_) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        const int ret = inflate(&zs, Z_NO_FLUSH);
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, produced);
        if (ret == Z_STREAM_END) {
            streamEnd_ = true;
            break;
        }
        if (ret == Z_BUF_ERROR && produced == 0) {
            break;
        }
        if (ret != Z_OK) {
            error_ = std::string("incorrect ") + Compression::Name(enc_) + " data" +
                     (zs.msg ? std::string(": ") + zs.msg : std::string());
            return false;
        }
    }
    // Output may still be pending with all input consumed.
    while (!streamEnd_) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        const int ret = inflate(&zs, Z_NO_FLUSH);
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, produced);
        if (ret == Z_STREAM_END) {
            streamEnd_ = true;
        } else if (ret != Z_OK || produced == 0) {
            break;
        }
    }
    return true;
}

bool Inflater::Feed(const char* data, size_t len, std::string* out) {
    if (!error_.empty()) return false;
    if (len == 0 || streamEnd_) return true;

    if (!initialized_) {
        int windowBits = MAX_WBITS;
        if (enc_ == Compression::Encoding::kGzip) {
            windowBits = 16 + MAX_WBITS;
        } else if (enc_ == Compression::Encoding::kDeflate) {
            // zlib header: CM 8 in the low nibble of the first byte
            const unsigned char first = static_cast<unsigned char>(data[0]);
            windowBits = ((first & 0x0f) == 0x08) ? MAX_WBITS : -MAX_WBITS;
        } else {
            error_ = "unsupported content encoding";
            return false;
        }
        if (!Init(windowBits)) return false;
    }
    return Run(data, len, out);
}

bool Inflater::Finish(std::string* out) {
    (void)out;
    if (!error_.empty()) return false;
    if (!initialized_ || streamEnd_) return true;
    error_ = "unexpected end of file";
    return false;
}

} // namespace protocol
} // namespace relay
