#include "webgate/protocol/Compression.h"
#include "webgate/protocol/HeaderMap.h"

#include <cstring>
#include <zlib.h>

namespace webgate {
namespace protocol {

Compression::Encoding Compression::ParseContentEncoding(const std::string& v) {
    const std::string lv = HeaderMap::ToLower(v);
    if (lv.find("gzip") != std::string::npos) return Encoding::kGzip;
    if (lv.find("deflate") != std::string::npos) return Encoding::kDeflate;
    if (lv.find_first_not_of(" \t") == std::string::npos || lv.find("identity") != std::string::npos) {
        return Encoding::kIdentity;
    }
    return Encoding::kUnknown;
}

static bool InflateAll(const std::string& in, int windowBits, size_t maxOutput, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    if (inflateInit2(&zs, windowBits) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
        if (maxOutput > 0 && out->size() > maxOutput) {
            inflateEnd(&zs);
            return false;
        }
        // Truncated input: no progress possible.
        if (ret == Z_OK && zs.avail_in == 0 && produced == 0) {
            inflateEnd(&zs);
            return false;
        }
    }
    inflateEnd(&zs);
    return true;
}

static bool DeflateAll(const std::string& in, int windowBits, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
    }
    deflateEnd(&zs);
    return true;
}

bool Compression::Decompress(Encoding enc, const std::string& in, std::string* out, size_t maxOutput) {
    if (!out) return false;
    switch (enc) {
        case Encoding::kIdentity:
            *out = in;
            return true;
        case Encoding::kGzip:
            return InflateAll(in, 16 + MAX_WBITS, maxOutput, out);
        case Encoding::kDeflate:
            // zlib-wrapped is what servers send; some send raw deflate.
            return InflateAll(in, MAX_WBITS, maxOutput, out) || InflateAll(in, -MAX_WBITS, maxOutput, out);
        default:
            return false;
    }
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    if (!out) return false;
    switch (enc) {
        case Encoding::kIdentity:
            *out = in;
            return true;
        case Encoding::kGzip:
            return DeflateAll(in, 16 + MAX_WBITS, out);
        case Encoding::kDeflate:
            return DeflateAll(in, MAX_WBITS, out);
        default:
            return false;
    }
}

} // namespace protocol
} // namespace webgate
