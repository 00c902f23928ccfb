#pragma once

#include "webgate/protocol/HeaderMap.h"

#include <string>

namespace webgate {
namespace protocol {

// Request head as received from the client. The body is never stored here; it is
// streamed through a BodyFramer by whoever consumes the request.
class HttpRequest {
public:
    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }
    const char* versionString() const { return version_ == kHttp10 ? "HTTP/1.0" : "HTTP/1.1"; }

    // Any token is accepted; the proxy forwards methods it does not know.
    bool setMethod(const char* start, const char* end) {
        method_.assign(start, end);
        if (method_.empty()) return false;
        for (char c : method_) {
            if (c < 'A' || c > 'Z') {
                if (c != '-' && c != '_') return false;
            }
        }
        return true;
    }
    const std::string& method() const { return method_; }
    bool isHead() const { return method_ == "HEAD"; }

    // Raw request-target as it appeared on the request line.
    void setTarget(const char* start, const char* end) {
        target_.assign(start, end);
        const size_t q = target_.find('?');
        path_ = target_.substr(0, q);
        query_ = (q == std::string::npos) ? std::string() : target_.substr(q);
    }
    const std::string& target() const { return target_; }
    const std::string& path() const { return path_; }
    // With the leading '?', empty when there is none.
    const std::string& query() const { return query_; }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && (*colon == ' ' || *colon == '\t')) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
            value.pop_back();
        }
        headers_.Add(field, value);
    }

    const HeaderMap& headers() const { return headers_; }
    HeaderMap& headers() { return headers_; }

    bool keepAlive() const {
        if (version_ == kHttp10) return headers_.HasToken("Connection", "keep-alive");
        return !headers_.HasToken("Connection", "close");
    }

    bool isUpgrade() const {
        return headers_.Has("Upgrade") && headers_.HasToken("Connection", "upgrade");
    }

    void swap(HttpRequest& that) {
        std::swap(version_, that.version_);
        method_.swap(that.method_);
        target_.swap(that.target_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        std::swap(headers_, that.headers_);
    }

private:
    Version version_;
    std::string method_;
    std::string target_;
    std::string path_;
    std::string query_;
    HeaderMap headers_;
};

} // namespace protocol
} // namespace webgate
