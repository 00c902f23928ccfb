#include "webgate/protocol/HttpResponse.h"

namespace webgate {
namespace protocol {

const char* HttpResponse::ReasonPhrase(int status) {
    switch (status) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

void HttpResponse::AppendHead(webgate::network::Buffer* output, int status, const std::string& reason,
                              const HeaderMap& headers) {
    output->Append("HTTP/1.1 " + std::to_string(status) + " ");
    output->Append(reason.empty() ? std::string(ReasonPhrase(status)) : reason);
    output->Append("\r\n");
    for (const auto& header : headers) {
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }
    output->Append("\r\n");
}

void HttpResponse::appendToBuffer(webgate::network::Buffer* output) const {
    HeaderMap headers = headers_;
    headers.Set("Content-Length", std::to_string(body_.size()));
    headers.Set("Connection", closeConnection_ ? "close" : "keep-alive");
    const std::string message = statusMessage_.empty() ? ReasonPhrase(statusCode_) : statusMessage_;
    AppendHead(output, statusCode_, message, headers);
    if (!headOnly_) output->Append(body_);
}

HttpResponse HttpResponse::MakeError(HttpStatusCode code, const std::string& message, bool close) {
    HttpResponse resp(close);
    resp.setStatusCode(code);
    resp.setContentType("text/plain; charset=utf-8");
    resp.setBody(message + "\n");
    return resp;
}

} // namespace protocol
} // namespace webgate
