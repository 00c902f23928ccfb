#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace webgate {
namespace protocol {

// Tracks where an HTTP/1.1 message body ends without buffering it.
// Feed() reports how many of the offered bytes belong to the body (framing included),
// so callers can relay them verbatim and leave the rest for the next message.
class BodyFramer {
public:
    enum Mode {
        kNone,        // no body
        kLength,      // Content-Length
        kChunked,     // Transfer-Encoding: chunked
        kUntilClose,  // ends when the peer closes
    };

    BodyFramer() { Reset(kNone); }

    void Reset(Mode mode, uint64_t length = 0);

    // consumed: bytes of data that belong to this body. decoded, if given, receives the
    // payload with chunk framing removed. Returns false on malformed chunk framing.
    bool Feed(const char* data, size_t len, size_t* consumed, std::string* decoded = nullptr);

    bool done() const { return done_; }
    Mode mode() const { return mode_; }
    uint64_t payloadBytes() const { return payloadBytes_; }

    // Chooses the framing of a message from its Transfer-Encoding / Content-Length values.
    // False if Content-Length is not a valid number.
    static bool ModeFromHeaders(const std::string* transferEncoding,
                                const std::string* contentLength,
                                Mode noLengthMode,
                                Mode* mode,
                                uint64_t* length);

private:
    enum ChunkState { kSizeLine, kData, kDataCrlf, kTrailer };

    bool FeedChunked(const char* data, size_t len, size_t* consumed, std::string* decoded);

    Mode mode_;
    bool done_;
    uint64_t remaining_;
    uint64_t payloadBytes_;

    ChunkState chunkState_;
    std::string line_;
};

} // namespace protocol
} // namespace webgate
