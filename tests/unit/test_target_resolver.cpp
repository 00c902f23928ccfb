#include "webgate/upstream/TargetResolver.h"
#include "webgate/common/Logger.h"

#include <cassert>
#include <string>
#include <vector>

using webgate::common::LogLevel;
using webgate::common::Logger;
using webgate::upstream::ResolvedTarget;
using webgate::upstream::TargetResolver;

namespace {

std::vector<std::string> g_warnings;

void captureWarnings() {
    g_warnings.clear();
    Logger::Instance().SetSink([](LogLevel level, const std::string& msg) {
        if (level == LogLevel::WARN) g_warnings.push_back(msg);
    });
}

} // namespace

void testPlainTarget() {
    TargetResolver resolver("/proxy/");
    ResolvedTarget t;
    std::string error;
    assert(resolver.Resolve("/proxy/https://example.com/app?x=1", &t, &error));
    assert(t.href == "https://example.com/app?x=1");
    assert(t.url.host == "example.com");
    assert(t.url.PathAndQuery() == "/app?x=1");
    assert(!t.portStripped);
    LOG_INFO << "Plain target PASS";
}

void testPortStripped() {
    captureWarnings();
    TargetResolver resolver("/proxy/");
    ResolvedTarget t;
    std::string error;
    assert(resolver.Resolve("/proxy/https://example.com:8443/live/index.m3u8", &t, &error));
    assert(t.portStripped);
    assert(t.strippedPort == 8443);
    assert(t.url.port == 0);
    assert(t.url.EffectivePort() == 443);
    assert(t.href == "https://example.com/live/index.m3u8");
    assert(t.href.find("8443") == std::string::npos);

    bool found = false;
    for (const auto& w : g_warnings) {
        if (w.find("[PORT-STRIP] Port 8443 removed, using standard port for https:") != std::string::npos) {
            found = true;
        }
    }
    assert(found);
    Logger::Instance().ClearSink();

    // The default port is not an explicit port.
    assert(resolver.Resolve("/proxy/http://example.com:80/", &t, &error));
    assert(!t.portStripped);
    LOG_INFO << "Port stripped PASS";
}

void testCollapsedScheme() {
    assert(TargetResolver::RepairCollapsedScheme("https:/example.com/a") == "https://example.com/a");
    assert(TargetResolver::RepairCollapsedScheme("http:/example.com") == "http://example.com");
    assert(TargetResolver::RepairCollapsedScheme("https://example.com") == "https://example.com");
    assert(TargetResolver::RepairCollapsedScheme("example.com") == "example.com");

    TargetResolver resolver("/proxy/");
    ResolvedTarget t;
    std::string error;
    assert(resolver.Resolve("/proxy/https:/example.com/video/x.ts", &t, &error));
    assert(t.href == "https://example.com/video/x.ts");
    LOG_INFO << "Collapsed scheme PASS";
}

void testInvalidTargets() {
    TargetResolver resolver("/proxy/");
    ResolvedTarget t;
    std::string error;
    assert(!resolver.Resolve("/proxy/not a url", &t, &error));
    assert(!error.empty());
    error.clear();
    assert(!resolver.Resolve("/proxy/", &t, &error));
    assert(!error.empty());
    error.clear();
    assert(!resolver.Resolve("/proxy/example.com/page", &t, &error));
    error.clear();
    assert(!resolver.Resolve("/proxy/ftp://example.com/file", &t, &error));
    error.clear();
    // Upgrades travel as http/https targets; ws schemes are not accepted in the path.
    assert(!resolver.Resolve("/proxy/wss://example.com/socket", &t, &error));
    assert(error.find("wss") != std::string::npos);
    error.clear();
    assert(!resolver.Resolve("/other/https://example.com/", &t, &error));
    LOG_INFO << "Invalid targets PASS";
}

void testMatches() {
    TargetResolver resolver("/proxy/");
    assert(resolver.Matches("/proxy/https://a"));
    assert(resolver.Matches("/proxy/"));
    assert(!resolver.Matches("/proxy"));
    assert(!resolver.Matches("/"));
    assert(!resolver.Matches("/proxyx/"));
    LOG_INFO << "Matches PASS";
}

int main() {
    testPlainTarget();
    testPortStripped();
    testCollapsedScheme();
    testInvalidTargets();
    testMatches();
    return 0;
}
