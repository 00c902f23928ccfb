#include "webgate/protocol/HeaderMap.h"
#include "webgate/common/Logger.h"

#include <cassert>
#include <string>

using webgate::protocol::HeaderMap;

void testLookupIgnoresCase() {
    HeaderMap h;
    h.Add("Content-Type", "text/html");
    h.Add("X-Trace", "a");
    h.Add("x-trace", "b");
    assert(h.Has("content-type"));
    assert(h.Get("CONTENT-TYPE") == "text/html");
    assert(h.Get("missing", "dflt") == "dflt");
    assert(h.Find("missing") == nullptr);
    assert(h.FindKey("X-TRACE") == "X-Trace");
    assert(h.GetAll("x-trace").size() == 2);
    assert(h.Size() == 3);
    LOG_INFO << "Lookup ignores case PASS";
}

void testSetCanonicalizes() {
    HeaderMap h;
    h.Add("location", "/a");
    h.Add("Server", "origin");
    h.Add("LOCATION", "/b");
    h.Set("Location", "/proxy/x");
    assert(h.Size() == 2);
    assert(h.GetAll("location").size() == 1);
    assert(h.FindKey("location") == "Location");
    assert(h.Get("location") == "/proxy/x");
    // Position of the first entry is kept.
    assert(h.begin()->first == "Location");

    // Exact-case slot wins over an earlier other-case one.
    HeaderMap h2;
    h2.Add("content-length", "10");
    h2.Add("Content-Length", "11");
    h2.Set("Content-Length", "12");
    assert(h2.Size() == 1);
    assert(h2.FindKey("content-length") == "Content-Length");
    assert(h2.Get("content-length") == "12");

    HeaderMap h3;
    h3.Set("accept-ranges", "bytes");
    assert(h3.Size() == 1);
    LOG_INFO << "Set canonicalizes PASS";
}

void testRemove() {
    HeaderMap h;
    h.Add("X-Frame-Options", "DENY");
    h.Add("x-frame-options", "SAMEORIGIN");
    h.Add("Keep", "1");
    assert(h.Remove("X-FRAME-OPTIONS") == 2);
    assert(h.Remove("X-FRAME-OPTIONS") == 0);
    assert(h.Size() == 1);
    h.Clear();
    assert(h.Empty());
    LOG_INFO << "Remove PASS";
}

void testTokens() {
    HeaderMap h;
    h.Add("Connection", "keep-alive, Upgrade");
    assert(h.HasToken("connection", "upgrade"));
    assert(h.HasToken("Connection", "Keep-Alive"));
    assert(!h.HasToken("Connection", "close"));
    assert(!h.HasToken("Upgrade", "websocket"));
    LOG_INFO << "Tokens PASS";
}

void testStringHelpers() {
    assert(HeaderMap::EqualsIgnoreCase("Abc", "aBC"));
    assert(!HeaderMap::EqualsIgnoreCase("Abc", "Ab"));
    assert(HeaderMap::ContainsIgnoreCase("application/VND.apple.MPEGURL", "mpegurl"));
    assert(!HeaderMap::ContainsIgnoreCase("video/mp2t", "mpegurl"));
    assert(HeaderMap::ToLower("Content-Length") == "content-length");
    LOG_INFO << "String helpers PASS";
}

int main() {
    testLookupIgnoresCase();
    testSetCanonicalizes();
    testRemove();
    testTokens();
    testStringHelpers();
    return 0;
}
