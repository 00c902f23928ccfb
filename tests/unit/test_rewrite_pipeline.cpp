#include "webgate/rewrite/RewritePipeline.h"
#include "webgate/rewrite/RewriteStage.h"
#include "webgate/common/Logger.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using webgate::common::LogLevel;
using webgate::common::Logger;
using webgate::rewrite::CorsStage;
using webgate::rewrite::HlsManifestStage;
using webgate::rewrite::LocationRewriteStage;
using webgate::rewrite::RewriteContext;
using webgate::rewrite::RewritePipeline;
using webgate::rewrite::RewriteStage;
using webgate::rewrite::SecurityHeaderStripStage;

namespace {

const char kPrefix[] = "/proxy/";

RewriteContext makeContext(const std::string& url) {
    RewriteContext ctx;
    ctx.status = 200;
    ctx.reason = "OK";
    ctx.requestUrl = url;
    return ctx;
}

class ThrowingStage : public RewriteStage {
public:
    const char* Name() const override { return "throws"; }
    RewriteContext Apply(RewriteContext ctx) const override {
        ctx.headers.Set("X-Half-Done", "1");
        throw std::runtime_error("boom");
    }
};

class TagStage : public RewriteStage {
public:
    const char* Name() const override { return "tag"; }
    RewriteContext Apply(RewriteContext ctx) const override {
        ctx.headers.Add("X-Tag", "seen");
        return ctx;
    }
};

} // namespace

void testStageOrder() {
    auto pipeline = RewritePipeline::MakeDefault(kPrefix);
    const std::vector<std::string> names = pipeline->StageNames();
    assert(names.size() == 4);
    assert(names[0] == "cors");
    assert(names[1] == "location");
    assert(names[2] == "hls");
    assert(names[3] == "strip-security");
    LOG_INFO << "Stage order PASS";
}

void testCorsOverwrites() {
    RewriteContext ctx = makeContext("https://example.com/");
    ctx.headers.Add("Access-Control-Allow-Origin", "https://only.example.com");
    ctx.headers.Add("ACCEPT-RANGES", "none");
    ctx = CorsStage().Apply(ctx);
    assert(ctx.headers.GetAll("access-control-allow-origin").size() == 1);
    assert(ctx.headers.Get("access-control-allow-origin") == "*");
    assert(ctx.headers.Get("access-control-allow-methods") == "GET, POST, PUT, DELETE, OPTIONS");
    assert(ctx.headers.Get("access-control-allow-headers") == "*");
    assert(ctx.headers.Get("access-control-expose-headers") ==
           "Content-Length, Content-Range, Accept-Ranges, Content-Type, Location");
    assert(ctx.headers.GetAll("accept-ranges").size() == 1);
    assert(ctx.headers.Get("accept-ranges") == "bytes");

    // Present on every response, even one without headers.
    RewriteContext empty = CorsStage().Apply(RewriteContext());
    assert(empty.headers.Get("access-control-allow-origin") == "*");
    LOG_INFO << "CORS overwrites PASS";
}

void testLocationRelative() {
    LocationRewriteStage stage(kPrefix);
    RewriteContext ctx = makeContext("https://example.com/app");
    ctx.status = 302;
    ctx.headers.Add("location", "/login");
    ctx = stage.Apply(ctx);
    assert(ctx.headers.GetAll("Location").size() == 1);
    assert(ctx.headers.FindKey("location") == "Location");
    assert(ctx.headers.Get("Location") == "/proxy/https://example.com/login");

    // Already inside the proxy namespace: untouched, so a second pass is a no-op.
    RewriteContext again = stage.Apply(ctx);
    assert(again.headers.Get("Location") == "/proxy/https://example.com/login");

    RewriteContext rel = makeContext("https://example.com/a/b/page");
    rel.headers.Add("Location", "../c?x=1");
    rel = stage.Apply(rel);
    assert(rel.headers.Get("Location") == "/proxy/https://example.com/a/c?x=1");
    LOG_INFO << "Location relative PASS";
}

void testLocationAbsolute() {
    LocationRewriteStage stage(kPrefix);
    RewriteContext ctx = makeContext("https://example.com/app");
    ctx.headers.Add("Location", "https://accounts.example.org/auth?next=/app");
    ctx.headers.Add("LOCATION", "https://dup.example.org/");
    ctx = stage.Apply(ctx);
    assert(ctx.headers.GetAll("location").size() == 1);
    assert(ctx.headers.Get("location") == "/proxy/https://accounts.example.org/auth?next=/app");

    RewriteContext scheme = makeContext("http://example.com/");
    scheme.headers.Add("Location", "//cdn.example.com/x");
    scheme = stage.Apply(scheme);
    assert(scheme.headers.Get("Location") == "/proxy/http://cdn.example.com/x");

    RewriteContext none = makeContext("https://example.com/");
    none = stage.Apply(none);
    assert(!none.headers.Has("Location"));
    LOG_INFO << "Location absolute PASS";
}

void testLocationMalformedLeftAlone() {
    LocationRewriteStage stage(kPrefix);
    RewriteContext ctx = makeContext("not-a-url");
    ctx.headers.Add("Location", "/login");
    ctx = stage.Apply(ctx);
    assert(ctx.headers.Get("Location") == "/login");
    LOG_INFO << "Location malformed PASS";
}

void testHlsScenario() {
    auto pipeline = RewritePipeline::MakeDefault(kPrefix);
    RewriteContext ctx = makeContext("https://example.com/video/stream.m3u8");
    ctx.headers.Add("Content-Type", "application/vnd.apple.mpegurl");
    ctx.body = "#EXTM3U\nsegment1.ts\nhttps://cdn.example.com/seg2.ts\n";
    ctx.headers.Add("content-length", std::to_string(ctx.body.size()));
    ctx.bodyBuffered = true;

    ctx = pipeline->Run(ctx);
    const std::string expected =
        "#EXTM3U\n/proxy/https://example.com/video/segment1.ts\n/proxy/https://cdn.example.com/seg2.ts\n";
    assert(ctx.body == expected);
    // Recomputed under the key the origin used.
    assert(ctx.headers.FindKey("Content-Length") == "content-length");
    assert(ctx.headers.Get("content-length") == std::to_string(expected.size()));
    LOG_INFO << "HLS scenario PASS";
}

void testHlsLines() {
    HlsManifestStage stage(kPrefix);
    RewriteContext ctx = makeContext("https://example.com/live/master.m3u8?tok=1");
    ctx.headers.Add("content-type", "audio/x-mpegURL");
    ctx.body = "#EXTM3U\r\n#EXT-X-STREAM-INF:BANDWIDTH=800000\r\nlow/index.m3u8\r\n\r\n/abs/path.ts\r\n";
    ctx.bodyBuffered = true;
    ctx = stage.Apply(ctx);
    assert(ctx.body ==
           "#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=800000\n"
           "/proxy/https://example.com/live/low/index.m3u8\n\n"
           "/proxy/https://example.com/abs/path.ts\n");
    // No content-length header before, none after.
    assert(!ctx.headers.Has("Content-Length"));
    LOG_INFO << "HLS lines PASS";
}

void testHlsSkipsOtherBodies() {
    HlsManifestStage stage(kPrefix);
    RewriteContext ctx = makeContext("https://example.com/a");
    ctx.headers.Add("Content-Type", "text/plain");
    ctx.body = "segment1.ts\n";
    ctx.bodyBuffered = true;
    assert(stage.Apply(ctx).body == "segment1.ts\n");

    RewriteContext streamed = makeContext("https://example.com/a.m3u8");
    streamed.headers.Add("Content-Type", "application/x-mpegurl");
    streamed.body = "segment1.ts\n";
    streamed.bodyBuffered = false;
    assert(stage.Apply(streamed).body == "segment1.ts\n");

    assert(HlsManifestStage::IsManifestContentType("application/vnd.apple.mpegurl; charset=utf-8"));
    assert(!HlsManifestStage::IsManifestContentType("video/mp2t"));
    LOG_INFO << "HLS skips other bodies PASS";
}

void testSecurityStrip() {
    auto pipeline = RewritePipeline::MakeDefault(kPrefix);
    RewriteContext ctx = makeContext("https://example.com/");
    ctx.headers.Add("X-Frame-Options", "DENY");
    ctx.headers.Add("content-security-policy", "default-src 'self'");
    ctx.headers.Add("Strict-Transport-Security", "max-age=1");
    ctx.headers.Add("PUBLIC-KEY-PINS", "pin");
    ctx.headers.Add("Content-Type", "text/html");
    ctx = pipeline->Run(ctx);
    assert(!ctx.headers.Has("x-frame-options"));
    assert(!ctx.headers.Has("Content-Security-Policy"));
    assert(!ctx.headers.Has("strict-transport-security"));
    assert(!ctx.headers.Has("public-key-pins"));
    assert(ctx.headers.Get("content-type") == "text/html");
    assert(ctx.headers.Get("access-control-allow-origin") == "*");
    LOG_INFO << "Security strip PASS";
}

void testThrowingStageIsSkipped() {
    int errors = 0;
    Logger::Instance().SetSink([&errors](LogLevel level, const std::string& msg) {
        if (level == LogLevel::ERROR && msg.find("throws") != std::string::npos) ++errors;
    });

    RewritePipeline pipeline;
    pipeline.AddStage(std::make_unique<ThrowingStage>());
    pipeline.AddStage(std::make_unique<TagStage>());
    RewriteContext ctx = makeContext("https://example.com/");
    ctx.headers.Add("Server", "origin");
    ctx = pipeline.Run(ctx);

    Logger::Instance().ClearSink();
    assert(errors == 1);
    assert(!ctx.headers.Has("X-Half-Done"));
    assert(ctx.headers.Get("X-Tag") == "seen");
    assert(ctx.headers.Get("Server") == "origin");
    LOG_INFO << "Throwing stage skipped PASS";
}

int main() {
    testStageOrder();
    testCorsOverwrites();
    testLocationRelative();
    testLocationAbsolute();
    testLocationMalformedLeftAlone();
    testHlsScenario();
    testHlsLines();
    testHlsSkipsOtherBodies();
    testSecurityStrip();
    testThrowingStageIsSkipped();
    return 0;
}
