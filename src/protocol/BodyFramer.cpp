#include "webgate/protocol/BodyFramer.h"
#include "webgate/protocol/HeaderMap.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace webgate {
namespace protocol {

namespace {

const size_t kMaxChunkLine = 8192;

bool ParseChunkSize(std::string line, uint64_t* size) {
    const size_t semi = line.find(';');
    if (semi != std::string::npos) line.resize(semi);
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) line.pop_back();
    size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    line.erase(0, i);
    if (line.empty() || line.size() > 16) return false;
    char* endp = nullptr;
    const unsigned long long v = std::strtoull(line.c_str(), &endp, 16);
    if (endp != line.c_str() + line.size()) return false;
    *size = static_cast<uint64_t>(v);
    return true;
}

} // namespace

void BodyFramer::Reset(Mode mode, uint64_t length) {
    mode_ = mode;
    remaining_ = length;
    payloadBytes_ = 0;
    chunkState_ = kSizeLine;
    line_.clear();
    done_ = (mode == kNone) || (mode == kLength && length == 0);
}

bool BodyFramer::ModeFromHeaders(const std::string* transferEncoding,
                                 const std::string* contentLength,
                                 Mode noLengthMode,
                                 Mode* mode,
                                 uint64_t* length) {
    *length = 0;
    if (transferEncoding && HeaderMap::ContainsIgnoreCase(*transferEncoding, "chunked")) {
        *mode = kChunked;
        return true;
    }
    if (contentLength) {
        std::string v = *contentLength;
        // Repeated values folded into one line must agree.
        const size_t comma = v.find(',');
        if (comma != std::string::npos) v.resize(comma);
        while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
        if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos || v.size() > 18) {
            return false;
        }
        *length = std::strtoull(v.c_str(), nullptr, 10);
        *mode = kLength;
        return true;
    }
    *mode = noLengthMode;
    return true;
}

bool BodyFramer::Feed(const char* data, size_t len, size_t* consumed, std::string* decoded) {
    *consumed = 0;
    if (done_ || len == 0) return true;

    switch (mode_) {
        case kNone:
            return true;
        case kUntilClose:
            *consumed = len;
            payloadBytes_ += len;
            if (decoded) decoded->append(data, len);
            return true;
        case kLength: {
            const size_t take = static_cast<size_t>(std::min<uint64_t>(remaining_, len));
            remaining_ -= take;
            payloadBytes_ += take;
            if (decoded) decoded->append(data, take);
            *consumed = take;
            if (remaining_ == 0) done_ = true;
            return true;
        }
        case kChunked:
            return FeedChunked(data, len, consumed, decoded);
    }
    return true;
}

bool BodyFramer::FeedChunked(const char* data, size_t len, size_t* consumed, std::string* decoded) {
    size_t off = 0;
    while (off < len && !done_) {
        if (chunkState_ == kSizeLine || chunkState_ == kTrailer) {
            const char* nl = static_cast<const char*>(std::memchr(data + off, '\n', len - off));
            if (!nl) {
                line_.append(data + off, len - off);
                off = len;
                if (line_.size() > kMaxChunkLine) return false;
                break;
            }
            line_.append(data + off, nl - (data + off));
            off = static_cast<size_t>(nl - data) + 1;
            if (!line_.empty() && line_.back() == '\r') line_.pop_back();

            if (chunkState_ == kTrailer) {
                if (line_.empty()) done_ = true;
                line_.clear();
                continue;
            }

            uint64_t size = 0;
            if (!ParseChunkSize(line_, &size)) return false;
            line_.clear();
            if (size == 0) {
                chunkState_ = kTrailer;
            } else {
                remaining_ = size;
                chunkState_ = kData;
            }
            continue;
        }

        if (chunkState_ == kData) {
            const size_t take = static_cast<size_t>(std::min<uint64_t>(remaining_, len - off));
            if (decoded) decoded->append(data + off, take);
            payloadBytes_ += take;
            remaining_ -= take;
            off += take;
            if (remaining_ == 0) {
                chunkState_ = kDataCrlf;
                line_.clear();
            }
            continue;
        }

        // kDataCrlf: CRLF (or a bare LF) closing the chunk data
        const char c = data[off++];
        if (c == '\n') {
            chunkState_ = kSizeLine;
            line_.clear();
        } else if (c != '\r' || !line_.empty()) {
            return false;
        } else {
            line_.push_back(c);
        }
    }
    *consumed = off;
    return true;
}

} // namespace protocol
} // namespace webgate
