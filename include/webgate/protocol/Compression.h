#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace webgate {
namespace protocol {

// zlib codecs for Content-Encoding gzip and deflate.
class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
        kUnknown,
    };

    static Encoding ParseContentEncoding(const std::string& v);

    // Whole-buffer decode. maxOutput bounds the inflated size (0 = unbounded).
    static bool Decompress(Encoding enc, const std::string& in, std::string* out, size_t maxOutput = 0);
    static bool Compress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace protocol
} // namespace webgate
