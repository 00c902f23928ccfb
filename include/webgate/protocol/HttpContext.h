#pragma once

#include "webgate/protocol/BodyFramer.h"
#include "webgate/protocol/HttpRequest.h"
#include "webgate/network/Buffer.h"

namespace webgate {
namespace protocol {

// Incremental parser for one request head. The body is left in the buffer; its
// framing is reported through bodyMode()/bodyLength() once the head is complete.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kGotHead,
    };

    static const size_t kMaxHeadBytes = 64 * 1024;

    HttpContext()
        : state_(kExpectRequestLine), headBytes_(0), bodyMode_(BodyFramer::kNone), bodyLength_(0) {}

    // return false if the head is malformed or too large
    bool parseRequest(webgate::network::Buffer* buf);

    bool gotHead() const { return state_ == kGotHead; }
    void reset() {
        state_ = kExpectRequestLine;
        headBytes_ = 0;
        bodyMode_ = BodyFramer::kNone;
        bodyLength_ = 0;
        HttpRequest dummy;
        request_.swap(dummy);
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

    BodyFramer::Mode bodyMode() const { return bodyMode_; }
    uint64_t bodyLength() const { return bodyLength_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool finishHead();

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t headBytes_;
    BodyFramer::Mode bodyMode_;
    uint64_t bodyLength_;
};

} // namespace protocol
} // namespace webgate
