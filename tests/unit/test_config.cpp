#include "webgate/ProxyServer.h"
#include "webgate/common/Config.h"
#include "webgate/common/Logger.h"
#include "webgate/network/InetAddress.h"
#include "webgate/network/Resolver.h"
#include <cassert>
#include <cstdlib>
#include <string>

using namespace webgate;
using namespace webgate::common;
using webgate::network::InetAddress;
using webgate::network::Resolver;

void testParseIni() {
    Config& conf = Config::Instance();
    const std::string ini =
        "# comment\n"
        "listen_port = 9090\n"
        "threads = 2\n"
        "\n"
        "[proxy]\n"
        "prefix = gate\n"
        "log_requests = off\n"
        "; another comment\n"
        "max_manifest_bytes = 1024\n"
        "[upstream]\n"
        "max_sockets = 4\n"
        "max_idle_per_origin = 0\n"
        "tls_verify = yes\n"
        "timeout_sec = 7\n"
        "resolve = origin.test:80=127.0.0.1:9000 , , secure.test:443=[::1]:9443\n"
        "line without delimiter\n";
    assert(conf.LoadFromString(ini));
    assert(conf.GetInt("global", "listen_port", 0) == 9090);
    assert(conf.GetString("proxy", "prefix") == "gate");
    assert(!conf.GetBool("proxy", "log_requests", true));
    assert(conf.GetBool("upstream", "tls_verify", false));
    assert(conf.GetString("missing", "key", "dflt") == "dflt");
    assert(conf.GetList("upstream", "resolve").size() == 2);

    conf.SetString("proxy", "max_manifest_bytes", "12abc");
    assert(conf.GetInt("proxy", "max_manifest_bytes", 5) == 5);

    const std::string dumped = conf.DumpIni();
    assert(dumped.find("[global]") == 0);
    assert(dumped.find("listen_port = 9090") != std::string::npos);

    assert(!conf.LoadFromString("[broken\nkey = v\n"));
    // A failed load keeps what was there.
    assert(conf.GetInt("global", "threads", 0) == 2);
    LOG_INFO << "Parse INI PASS";
}

void testProxyOptionsFromConfig() {
    ::unsetenv("PORT");
    ::unsetenv("SILENT_PROXY_LOGS");
    Config& conf = Config::Instance();
    assert(conf.LoadFromString(
        "listen_port = 9090\n"
        "[proxy]\nprefix = gate\nmax_manifest_bytes = 1024\n"
        "[upstream]\nmax_sockets = 4\nmax_idle_per_origin = 0\ntls_verify = on\ntimeout_sec = 7\n"
        "resolver_threads = 16\n"
        "resolve = origin.test:80=127.0.0.1:9000\n"));
    ProxyOptions o = ProxyOptions::FromConfig(conf);
    assert(o.port == 9090);
    assert(o.prefix == "/gate/");
    assert(o.logRequests);
    assert(o.maxManifestBytes == 1024);
    assert(o.maxSockets == 4);
    assert(o.maxIdlePerOrigin == 0);
    assert(o.tlsVerify);
    assert(o.timeoutSec == 7.0);
    assert(o.resolverThreads == 16);
    assert(o.resolve.size() == 1);
    assert(!o.tlsEnable);

    ::setenv("PORT", "18080", 1);
    ::setenv("SILENT_PROXY_LOGS", "1", 1);
    o = ProxyOptions::FromConfig(conf);
    assert(o.port == 18080);
    assert(!o.logRequests);

    ::setenv("PORT", "http", 1);
    o = ProxyOptions::FromConfig(conf);
    assert(o.port == 9090);
    ::unsetenv("PORT");
    ::unsetenv("SILENT_PROXY_LOGS");
    LOG_INFO << "ProxyOptions from config PASS";
}

void testDefaults() {
    Config& conf = Config::Instance();
    conf.Clear();
    conf.SetString("upstream", "max_sockets", "-3");
    conf.SetString("global", "listen_port", "70000");
    conf.SetString("upstream", "resolver_threads", "0");
    ProxyOptions o = ProxyOptions::FromConfig(conf);
    assert(o.port == 8080);
    assert(o.prefix == "/proxy/");
    assert(o.maxSockets == 50);
    assert(o.maxIdlePerOrigin == 8);
    assert(!o.tlsVerify);
    assert(o.timeoutSec == 120.0);
    assert(o.resolverThreads == 8);
    assert(o.maxManifestBytes == 8u * 1024 * 1024);
    assert(o.tunnelHighWaterBytes == 8u * 1024 * 1024);
    conf.Clear();
    LOG_INFO << "Defaults PASS";
}

void testResolverWorkers() {
    Resolver byDefault;
    assert(byDefault.numThreads() == 8);
    Resolver sized(16);
    assert(sized.numThreads() == 16);
    Resolver clamped(0);
    assert(clamped.numThreads() == 1);
    LOG_INFO << "Resolver workers PASS";
}

void testResolveOverride() {
    std::string host;
    uint16_t port = 0;
    InetAddress addr;
    assert(Resolver::ParseOverride("Origin.Test:80=127.0.0.1:9000", &host, &port, &addr));
    assert(host == "Origin.Test");
    assert(port == 80);
    assert(addr.toIpPort() == "127.0.0.1:9000");

    assert(Resolver::ParseOverride("secure.test:443=[::1]:9443", &host, &port, &addr));
    assert(port == 443);
    assert(addr.toPort() == 9443);

    assert(!Resolver::ParseOverride("origin.test:80", &host, &port, &addr));
    assert(!Resolver::ParseOverride("origin.test=127.0.0.1:9000", &host, &port, &addr));
    assert(!Resolver::ParseOverride("origin.test:80=not-an-ip:9000", &host, &port, &addr));
    assert(!Resolver::ParseOverride("origin.test:0=127.0.0.1:9000", &host, &port, &addr));

    Resolver resolver;
    resolver.AddOverride("Origin.Test", 80, addr);
    InetAddress found;
    assert(resolver.LookupOverride("origin.test", 80, &found));
    assert(found.toPort() == 9443);
    assert(!resolver.LookupOverride("origin.test", 443, &found));
    LOG_INFO << "Resolve override PASS";
}

int main() {
    testParseIni();
    testProxyOptionsFromConfig();
    testDefaults();
    testResolverWorkers();
    testResolveOverride();
    return 0;
}
