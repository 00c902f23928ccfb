#include "webgate/protocol/HttpResponseContext.h"

#include <algorithm>
#include <cstdlib>

namespace webgate {
namespace protocol {

void HttpResponseContext::reset() {
    state_ = kExpectHead;
    httpMinor_ = 1;
    statusCode_ = 0;
    reason_.clear();
    headers_.Clear();
    keepAlive_ = false;
    bodyMode_ = BodyFramer::kNone;
    bodyLength_ = 0;
    rawHead_.clear();
}

bool HttpResponseContext::parseHead(const std::string& head, bool requestWasHead) {
    size_t lineEnd = head.find("\r\n");
    const std::string statusLine = head.substr(0, lineEnd);

    // HTTP/1.1 200 OK
    if (statusLine.size() < 12 || statusLine.compare(0, 7, "HTTP/1.") != 0 || statusLine[8] != ' ') {
        return false;
    }
    if (statusLine[7] != '0' && statusLine[7] != '1') return false;
    httpMinor_ = statusLine[7] - '0';
    const std::string code = statusLine.substr(9, 3);
    if (code.find_first_not_of("0123456789") != std::string::npos) return false;
    statusCode_ = std::atoi(code.c_str());
    if (statusCode_ < 100) return false;
    if (statusLine.size() > 12) {
        if (statusLine[12] != ' ') return false;
        reason_ = statusLine.substr(13);
    }

    size_t pos = lineEnd + 2;
    while (pos < head.size()) {
        const size_t next = head.find("\r\n", pos);
        if (next == std::string::npos || next == pos) break;
        const std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return false;
        std::string val = line.substr(colon + 1);
        while (!val.empty() && (val.front() == ' ' || val.front() == '\t')) val.erase(val.begin());
        while (!val.empty() && (val.back() == ' ' || val.back() == '\t')) val.pop_back();
        headers_.Add(line.substr(0, colon), val);
    }

    if (httpMinor_ == 0) {
        keepAlive_ = headers_.HasToken("Connection", "keep-alive");
    } else {
        keepAlive_ = !headers_.HasToken("Connection", "close");
    }

    if (requestWasHead || StatusHasNoBody(statusCode_)) {
        bodyMode_ = BodyFramer::kNone;
        bodyLength_ = 0;
        return true;
    }
    if (!BodyFramer::ModeFromHeaders(headers_.Find("Transfer-Encoding"), headers_.Find("Content-Length"),
                                     BodyFramer::kUntilClose, &bodyMode_, &bodyLength_)) {
        return false;
    }
    if (bodyMode_ == BodyFramer::kUntilClose) keepAlive_ = false;
    return true;
}

bool HttpResponseContext::parseResponse(webgate::network::Buffer* buf, bool requestWasHead) {
    if (state_ == kGotHead) return true;
    if (state_ == kError) return false;

    static const char kEnd[] = "\r\n\r\n";
    const char* limit = buf->Peek() + buf->ReadableBytes();
    const char* end = std::search(buf->Peek(), limit, kEnd, kEnd + 4);
    if (end == limit) {
        if (buf->ReadableBytes() > kMaxHeadBytes) {
            state_ = kError;
            return false;
        }
        return true;
    }

    const size_t headLen = static_cast<size_t>(end - buf->Peek()) + 4;
    rawHead_.assign(buf->Peek(), headLen);
    buf->Retrieve(headLen);
    if (!parseHead(rawHead_, requestWasHead)) {
        state_ = kError;
        return false;
    }
    state_ = kGotHead;
    return true;
}

} // namespace protocol
} // namespace webgate
