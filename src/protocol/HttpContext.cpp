#include "webgate/protocol/HttpContext.h"
#include "webgate/common/Logger.h"

#include <algorithm>

namespace webgate {
namespace protocol {

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end && space != start) {
            request_.setTarget(start, space);
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::finishHead() {
    const HeaderMap& h = request_.headers();
    if (!BodyFramer::ModeFromHeaders(h.Find("Transfer-Encoding"), h.Find("Content-Length"),
                                     BodyFramer::kNone, &bodyMode_, &bodyLength_)) {
        LOG_DEBUG << "HttpContext: bad Content-Length " << h.Get("Content-Length");
        return false;
    }
    state_ = kGotHead;
    return true;
}

// return false if any error
bool HttpContext::parseRequest(webgate::network::Buffer* buf) {
    while (state_ != kGotHead) {
        const char* crlf = buf->FindCRLF();
        if (!crlf) {
            return headBytes_ + buf->ReadableBytes() <= kMaxHeadBytes;
        }
        const size_t lineLen = static_cast<size_t>(crlf - buf->Peek()) + 2;
        headBytes_ += lineLen;
        if (headBytes_ > kMaxHeadBytes) return false;

        if (state_ == kExpectRequestLine) {
            // Tolerate empty lines ahead of a request (RFC 9112 section 2.2).
            if (crlf == buf->Peek() && headBytes_ <= 8) {
                buf->Retrieve(2);
                continue;
            }
            if (!processRequestLine(buf->Peek(), crlf)) return false;
            buf->Retrieve(lineLen);
            state_ = kExpectHeaders;
        } else {
            if (crlf == buf->Peek()) {
                buf->Retrieve(2);
                return finishHead();
            }
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon == crlf || colon == buf->Peek()) return false;
            request_.addHeader(buf->Peek(), colon, crlf);
            buf->Retrieve(lineLen);
        }
    }
    return true;
}

} // namespace protocol
} // namespace webgate
