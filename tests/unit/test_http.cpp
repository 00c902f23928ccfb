#include "webgate/protocol/BodyFramer.h"
#include "webgate/protocol/HttpContext.h"
#include "webgate/protocol/HttpResponse.h"
#include "webgate/protocol/HttpResponseContext.h"
#include "webgate/network/Buffer.h"
#include "webgate/common/Logger.h"
#include "webgate/protocol/Url.h"
#include "webgate/upstream/RequestForwarder.h"
#include <cassert>
#include <string>

using namespace webgate::protocol;
using namespace webgate::network;
using namespace webgate::common;

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Simulate partial arrival
    buf.Append("GET /proxy/https://example.com/a?id=123 HTTP/1.1\r\nHost: ");
    assert(context.parseRequest(&buf));
    assert(!context.gotHead());

    buf.Append("localhost:8080\r\nUser-Agent: curl/7.68.0\r\nAccept:   */* \r\n\r\n");
    assert(context.parseRequest(&buf));
    assert(context.gotHead());
    const HttpRequest& req = context.request();
    assert(req.method() == "GET");
    assert(req.target() == "/proxy/https://example.com/a?id=123");
    assert(req.path() == "/proxy/https://example.com/a");
    assert(req.query() == "?id=123");
    assert(req.getVersion() == HttpRequest::kHttp11);
    assert(req.headers().Get("host") == "localhost:8080");
    assert(req.headers().Get("Accept") == "*/*");
    assert(req.keepAlive());
    assert(!req.isUpgrade());
    assert(context.bodyMode() == BodyFramer::kNone);
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Request PASS";
}

void testBodyLeftInBuffer() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST /submit HTTP/1.1\r\nHost: localhost\r\nContent-Length: 5\r\n\r\nhelloGET");
    assert(context.parseRequest(&buf));
    assert(context.gotHead());
    assert(context.bodyMode() == BodyFramer::kLength);
    assert(context.bodyLength() == 5);
    assert(buf.RetrieveAllAsString() == "helloGET");

    context.reset();
    assert(!context.gotHead());
    assert(context.request().method().empty());
    buf.Append("PROPFIND /x HTTP/1.0\r\nTransfer-Encoding: chunked\r\n\r\n");
    assert(context.parseRequest(&buf));
    assert(context.request().method() == "PROPFIND");
    assert(context.request().getVersion() == HttpRequest::kHttp10);
    assert(!context.request().keepAlive());
    assert(context.bodyMode() == BodyFramer::kChunked);
    LOG_INFO << "Body left in buffer PASS";
}

void testMalformedRequests() {
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET /\r\n\r\n");
        assert(!context.parseRequest(&buf));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET / HTTP/2.0\r\n\r\n");
        assert(!context.parseRequest(&buf));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n");
        assert(!context.parseRequest(&buf));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nContent-Length: ten\r\n\r\n");
        assert(!context.parseRequest(&buf));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nX-Big: " + std::string(HttpContext::kMaxHeadBytes, 'a'));
        assert(!context.parseRequest(&buf));
    }
    LOG_INFO << "Malformed requests PASS";
}

void testUpgradeRequest() {
    HttpContext context;
    Buffer buf;
    buf.Append("GET /proxy/https://echo.example.com/ws HTTP/1.1\r\n"
               "Host: localhost\r\nConnection: keep-alive, Upgrade\r\nUpgrade: websocket\r\n\r\n");
    assert(context.parseRequest(&buf));
    assert(context.request().isUpgrade());
    LOG_INFO << "Upgrade request PASS";
}

void testFramerLength() {
    BodyFramer framer;
    framer.Reset(BodyFramer::kLength, 5);
    size_t consumed = 0;
    std::string decoded;
    assert(framer.Feed("hel", 3, &consumed, &decoded));
    assert(consumed == 3 && !framer.done());
    assert(framer.Feed("loEXTRA", 7, &consumed, &decoded));
    assert(consumed == 2 && framer.done());
    assert(decoded == "hello");
    assert(framer.payloadBytes() == 5);

    framer.Reset(BodyFramer::kLength, 0);
    assert(framer.done());
    framer.Reset(BodyFramer::kNone);
    assert(framer.done());
    LOG_INFO << "Framer length PASS";
}

void testFramerChunked() {
    BodyFramer framer;
    framer.Reset(BodyFramer::kChunked);
    const std::string wire = "5;ext=1\r\nhello\r\n6\r\n world\r\n0\r\nX-Trailer: 1\r\n\r\nNEXT";
    std::string decoded;
    size_t total = 0;
    // One byte at a time exercises every state boundary.
    for (size_t i = 0; i < wire.size() && !framer.done(); ++i) {
        size_t consumed = 0;
        assert(framer.Feed(wire.data() + i, 1, &consumed, &decoded));
        total += consumed;
    }
    assert(framer.done());
    assert(decoded == "hello world");
    assert(total == wire.size() - 4);

    BodyFramer bad;
    bad.Reset(BodyFramer::kChunked);
    size_t consumed = 0;
    assert(!bad.Feed("zz\r\n", 4, &consumed));
    bad.Reset(BodyFramer::kChunked);
    assert(!bad.Feed("2\r\nabXY", 7, &consumed));
    LOG_INFO << "Framer chunked PASS";
}

void testModeFromHeaders() {
    BodyFramer::Mode mode;
    uint64_t length = 0;
    const std::string chunked = "gzip, Chunked";
    const std::string len = "42";
    assert(BodyFramer::ModeFromHeaders(&chunked, &len, BodyFramer::kNone, &mode, &length));
    assert(mode == BodyFramer::kChunked);
    assert(BodyFramer::ModeFromHeaders(nullptr, &len, BodyFramer::kNone, &mode, &length));
    assert(mode == BodyFramer::kLength && length == 42);
    const std::string folded = "7, 7";
    assert(BodyFramer::ModeFromHeaders(nullptr, &folded, BodyFramer::kNone, &mode, &length));
    assert(length == 7);
    assert(BodyFramer::ModeFromHeaders(nullptr, nullptr, BodyFramer::kUntilClose, &mode, &length));
    assert(mode == BodyFramer::kUntilClose);
    const std::string negative = "-1";
    assert(!BodyFramer::ModeFromHeaders(nullptr, &negative, BodyFramer::kNone, &mode, &length));
    LOG_INFO << "Mode from headers PASS";
}

void testParseResponse() {
    HttpResponseContext ctx;
    Buffer buf;
    buf.Append("HTTP/1.1 302 Found\r\nLocation: /login\r\nContent-");
    assert(ctx.parseResponse(&buf, false));
    assert(!ctx.gotHead());
    buf.Append("Length: 3\r\n\r\nabc");
    assert(ctx.parseResponse(&buf, false));
    assert(ctx.gotHead());
    assert(ctx.statusCode() == 302);
    assert(ctx.reason() == "Found");
    assert(ctx.headers().Get("location") == "/login");
    assert(ctx.keepAlive());
    assert(ctx.bodyMode() == BodyFramer::kLength && ctx.bodyLength() == 3);
    assert(ctx.rawHead().find("HTTP/1.1 302 Found\r\n") == 0);
    assert(buf.RetrieveAllAsString() == "abc");

    // HEAD answers and bodiless statuses carry no body whatever the headers say.
    ctx.reset();
    buf.Append("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n");
    assert(ctx.parseResponse(&buf, true));
    assert(ctx.bodyMode() == BodyFramer::kNone);
    for (int status : {100, 101, 204, 304}) {
        assert(HttpResponseContext::StatusHasNoBody(status));
    }
    assert(!HttpResponseContext::StatusHasNoBody(200));

    // Unframed HTTP/1.0 body runs until close.
    ctx.reset();
    buf.Append("HTTP/1.0 200 OK\r\nConnection: keep-alive\r\n\r\n");
    assert(ctx.parseResponse(&buf, false));
    assert(ctx.httpMinor() == 0);
    assert(ctx.bodyMode() == BodyFramer::kUntilClose);
    assert(!ctx.keepAlive());

    ctx.reset();
    buf.Append("SMTP 220 hi\r\n\r\n");
    assert(!ctx.parseResponse(&buf, false));
    assert(ctx.hasError());
    LOG_INFO << "Parse Response PASS";
}

void testResponseSerialize() {
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("text/html; charset=utf-8");
    resp.setBody("<h1>hi</h1>");
    Buffer out;
    resp.appendToBuffer(&out);
    const std::string wire = out.RetrieveAllAsString();
    assert(wire.find("HTTP/1.1 200 OK\r\n") == 0);
    assert(wire.find("Content-Length: 11\r\n") != std::string::npos);
    assert(wire.find("Connection: keep-alive\r\n") != std::string::npos);
    assert(wire.size() >= 11 && wire.compare(wire.size() - 11, 11, "<h1>hi</h1>") == 0);

    HttpResponse err = HttpResponse::MakeError(HttpResponse::k502BadGateway, "upstream refused", true);
    assert(err.closeConnection());
    err.setHeadOnly(true);
    err.appendToBuffer(&out);
    const std::string head = out.RetrieveAllAsString();
    assert(head.find("HTTP/1.1 502 Bad Gateway\r\n") == 0);
    assert(head.find("Connection: close\r\n") != std::string::npos);
    assert(head.find("Content-Length: 17\r\n") != std::string::npos);
    assert(head.compare(head.size() - 4, 4, "\r\n\r\n") == 0);
    LOG_INFO << "Response serialize PASS";
}

void testUpstreamHeadFraming() {
    Url target;
    assert(Url::Parse("https://origin.test/upload?x=1", &target));

    HttpContext context;
    Buffer buf;
    buf.Append("POST /proxy/https://origin.test/upload?x=1 HTTP/1.1\r\nHost: localhost\r\n"
               "Transfer-Encoding: chunked\r\nContent-Length: 4\r\nProxy-Connection: keep-alive\r\n\r\n");
    assert(context.parseRequest(&buf));
    assert(context.gotHead());
    assert(context.bodyMode() == BodyFramer::kChunked);

    std::string head = webgate::upstream::RequestForwarder::BuildUpstreamHead(context.request(), target, false);
    assert(head.find("POST /upload?x=1 HTTP/1.1\r\n") == 0);
    assert(head.find("Host: origin.test\r\n") != std::string::npos);
    assert(head.find("Transfer-Encoding: chunked\r\n") != std::string::npos);
    assert(head.find("Content-Length") == std::string::npos);
    assert(head.find("Proxy-Connection") == std::string::npos);
    assert(head.find("Connection: keep-alive\r\n") != std::string::npos);

    // Length-framed bodies keep their length.
    context.reset();
    buf.Append("PUT /proxy/https://origin.test/upload?x=1 HTTP/1.1\r\nHost: localhost\r\nContent-Length: 4\r\n\r\n");
    assert(context.parseRequest(&buf));
    assert(context.bodyMode() == BodyFramer::kLength);
    head = webgate::upstream::RequestForwarder::BuildUpstreamHead(context.request(), target, false);
    assert(head.find("Content-Length: 4\r\n") != std::string::npos);
    assert(head.find("Transfer-Encoding") == std::string::npos);
    LOG_INFO << "Upstream head framing PASS";
}

int main() {
    testParseRequest();
    testBodyLeftInBuffer();
    testMalformedRequests();
    testUpgradeRequest();
    testFramerLength();
    testFramerChunked();
    testModeFromHeaders();
    testParseResponse();
    testResponseSerialize();
    testUpstreamHeadFraming();
    return 0;
}
