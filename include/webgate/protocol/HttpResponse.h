#pragma once

#include "webgate/protocol/HeaderMap.h"
#include "webgate/network/Buffer.h"

#include <string>

namespace webgate {
namespace protocol {

// Response generated by the proxy itself (UI page, error answers), plus the
// serializer used for relayed upstream heads.
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k404NotFound = 404,
        k500InternalServerError = 500,
        k502BadGateway = 502,
        k504GatewayTimeout = 504,
    };

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close) {}

    void setStatusCode(HttpStatusCode code) { statusCode_ = code; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { headers_.Set("Content-Type", contentType); }
    void addHeader(const std::string& key, const std::string& value) { headers_.Set(key, value); }
    HeaderMap& headers() { return headers_; }
    void setBody(const std::string& body) { body_ = body; }
    void setHeadOnly(bool on) { headOnly_ = on; }

    void appendToBuffer(webgate::network::Buffer* output) const;

    // Status line, headers and the blank line.
    static void AppendHead(webgate::network::Buffer* output, int status, const std::string& reason,
                           const HeaderMap& headers);
    static const char* ReasonPhrase(int status);

    // Short text/plain answer: one line of diagnostic text, always closes the connection
    // when close is set.
    static HttpResponse MakeError(HttpStatusCode code, const std::string& message, bool close);

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    bool headOnly_{false};
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace webgate
