#pragma once

#include "webgate/protocol/BodyFramer.h"
#include "webgate/protocol/HeaderMap.h"
#include "webgate/network/Buffer.h"

#include <string>

namespace webgate {
namespace protocol {

// Incremental parser for an upstream response head. Body bytes stay in the buffer;
// bodyMode()/bodyLength() describe their framing once the head is complete.
class HttpResponseContext {
public:
    enum ParseState { kExpectHead, kGotHead, kError };

    static const size_t kMaxHeadBytes = 64 * 1024;

    // requestWasHead: the response to a HEAD request has no body whatever its headers say.
    bool parseResponse(webgate::network::Buffer* buf, bool requestWasHead);

    bool gotHead() const { return state_ == kGotHead; }
    bool hasError() const { return state_ == kError; }
    void reset();

    int statusCode() const { return statusCode_; }
    const std::string& reason() const { return reason_; }
    int httpMinor() const { return httpMinor_; }
    const HeaderMap& headers() const { return headers_; }
    HeaderMap& headers() { return headers_; }

    // Persistent connection after this response, judged from version and Connection.
    bool keepAlive() const { return keepAlive_; }
    BodyFramer::Mode bodyMode() const { return bodyMode_; }
    uint64_t bodyLength() const { return bodyLength_; }

    // Raw head bytes, kept for relaying upgrade answers verbatim.
    const std::string& rawHead() const { return rawHead_; }

    static bool StatusHasNoBody(int status) {
        return (status >= 100 && status < 200) || status == 204 || status == 304;
    }

private:
    bool parseHead(const std::string& head, bool requestWasHead);

    ParseState state_{kExpectHead};
    int httpMinor_{1};
    int statusCode_{0};
    std::string reason_;
    HeaderMap headers_;
    bool keepAlive_{false};
    BodyFramer::Mode bodyMode_{BodyFramer::kNone};
    uint64_t bodyLength_{0};
    std::string rawHead_;
};

} // namespace protocol
} // namespace webgate
