#include "webgate/ProxyServer.h"
#include "webgate/common/Logger.h"
#include "webgate/network/EventLoop.h"
#include "webgate/upstream/UpstreamConnectionPool.h"
#include "TestUtil.h"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using webgate::network::EventLoop;
using webgate::upstream::UpstreamConnectionPool;
using namespace testutil;

namespace {

// Self-signed certificate for origin.test, usable as its own trust anchor.
bool makeCertificate(EVP_PKEY** keyOut, X509** certOut) {
    EVP_PKEY* pkey = EVP_RSA_gen(2048);
    if (!pkey) return false;
    X509* x = X509_new();
    X509_set_version(x, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x), 1);
    X509_gmtime_adj(X509_getm_notBefore(x), -60);
    X509_gmtime_adj(X509_getm_notAfter(x), 3600);
    X509_set_pubkey(x, pkey);
    X509_NAME* name = X509_get_subject_name(x);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("origin.test"), -1, -1, 0);
    X509_set_issuer_name(x, name);

    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, x, x, nullptr, nullptr, 0);
    const std::pair<int, const char*> exts[] = {
        {NID_subject_alt_name, "DNS:origin.test"},
        {NID_basic_constraints, "critical,CA:TRUE"},
    };
    for (const auto& e : exts) {
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, e.first, e.second);
        if (!ext) return false;
        X509_add_ext(x, ext, -1);
        X509_EXTENSION_free(ext);
    }
    if (X509_sign(x, pkey, EVP_sha256()) <= 0) return false;
    *keyOut = pkey;
    *certOut = x;
    return true;
}

std::string writeCertFile(X509* cert) {
    char path[] = "/tmp/webgate_ca_XXXXXX";
    int fd = ::mkstemp(path);
    assert(fd >= 0);
    FILE* f = ::fdopen(fd, "w");
    assert(f);
    PEM_write_X509(f, cert);
    ::fclose(f);
    return path;
}

// Blocking HTTPS origin answering every request with a fixed body.
class TlsOrigin {
public:
    TlsOrigin(EVP_PKEY* key, X509* cert) {
        ctx_ = SSL_CTX_new(TLS_server_method());
        SSL_CTX_use_certificate(ctx_, cert);
        SSL_CTX_use_PrivateKey(ctx_, key);
    }
    ~TlsOrigin() {
        Stop();
        SSL_CTX_free(ctx_);
    }

    bool Start() {
        auto port = bindEphemeralPort(&listenFd_);
        if (!port) return false;
        port_ = *port;
        acceptThread_ = std::thread([this]() { AcceptLoop(); });
        return true;
    }

    void Stop() {
        if (stop_.exchange(true)) return;
        if (acceptThread_.joinable()) acceptThread_.join();
        for (auto& t : connThreads_) t.join();
        connThreads_.clear();
        if (listenFd_ >= 0) ::close(listenFd_);
    }

    uint16_t port() const { return port_; }
    int handshakes() const { return handshakes_.load(); }
    std::string lastSni() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastSni_;
    }
    std::string lastHead() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastHead_;
    }

private:
    void AcceptLoop() {
        while (!stop_.load()) {
            if (!pollReadable(listenFd_, 50)) continue;
            int cfd = ::accept(listenFd_, nullptr, nullptr);
            if (cfd < 0) continue;
            connThreads_.emplace_back([this, cfd]() { Serve(cfd); });
        }
    }

    void Serve(int cfd) {
        SSL* ssl = SSL_new(ctx_);
        SSL_set_fd(ssl, cfd);
        if (SSL_accept(ssl) == 1) {
            const char* sni = SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                lastSni_ = sni ? sni : "";
            }
            ++handshakes_;
            std::string in;
            bool open = true;
            while (open && !stop_.load()) {
                size_t end;
                while (open && !stop_.load() && (end = in.find("\r\n\r\n")) == std::string::npos) {
                    if (SSL_pending(ssl) == 0 && !pollReadable(cfd, 50)) continue;
                    char buf[4096];
                    const int n = SSL_read(ssl, buf, sizeof(buf));
                    if (n <= 0) {
                        open = false;
                        break;
                    }
                    in.append(buf, static_cast<size_t>(n));
                }
                if (!open || stop_.load()) break;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    lastHead_ = in.substr(0, end + 2);
                }
                in.erase(0, end + 4);
                const std::string resp = makeResponse(200, "OK", "Content-Type: text/plain\r\n", "secure hello");
                SSL_write(ssl, resp.data(), static_cast<int>(resp.size()));
            }
        }
        SSL_free(ssl);
        ::close(cfd);
    }

    SSL_CTX* ctx_{nullptr};
    int listenFd_{-1};
    uint16_t port_{0};
    std::atomic<bool> stop_{false};
    std::atomic<int> handshakes_{0};
    std::thread acceptThread_;
    std::vector<std::thread> connThreads_;
    mutable std::mutex mutex_;
    std::string lastSni_;
    std::string lastHead_;
};

void runScenario(const webgate::ProxyOptions& options,
                 const std::function<void(webgate::ProxyServer&, uint16_t)>& body) {
    EventLoop loop;
    webgate::ProxyServer server(&loop, options);
    assert(server.Start());
    const uint16_t port = server.listenAddress().toPort();
    std::thread client([&]() {
        body(server, port);
        loop.QueueInLoop([&]() { server.Stop(); });
    });
    loop.Loop();
    client.join();
}

bool fetchSecure(uint16_t port, std::string* head, std::string* body) {
    int fd = connectTo(port);
    assert(fd >= 0);
    sendAll(fd, "GET /proxy/https://origin.test:8443/secure HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
    const bool ok = readResponse(fd, head, body, 5000);
    ::close(fd);
    return ok;
}

webgate::ProxyOptions baseOptions(uint16_t originPort) {
    webgate::ProxyOptions options;
    options.port = 0;
    options.loopbackOnly = true;
    options.threads = 1;
    options.resolve = {"origin.test:443=127.0.0.1:" + std::to_string(originPort)};
    return options;
}

} // namespace

void testUnverifiedByDefault(TlsOrigin& origin) {
    webgate::ProxyOptions options = baseOptions(origin.port());
    assert(!options.tlsVerify);
    runScenario(options, [&origin](webgate::ProxyServer& server, uint16_t port) {
        std::string head, body;
        assert(fetchSecure(port, &head, &body));
        assert(head.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(body == "secure hello");
        assert(headerValue(head, "access-control-allow-origin") == "*");
        // SNI always carries the origin host; the explicit port was dropped for 443.
        assert(origin.lastSni() == "origin.test");
        assert(headerValue(origin.lastHead(), "Host") == "origin.test");
        assert(origin.lastHead().find("GET /secure HTTP/1.1\r\n") == 0);

        assert(server.tlsPool()->secure());
        assert(!server.plainPool()->secure());
        const std::string key = UpstreamConnectionPool::OriginKey("origin.test", 443);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        while (server.tlsPool()->IdleCount(key) == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert(server.tlsPool()->IdleCount(key) == 1);
        assert(server.plainPool()->IdleCount(key) == 0);

        // Second request rides the pooled TLS session.
        const int before = origin.handshakes();
        assert(fetchSecure(port, &head, &body));
        assert(body == "secure hello");
        assert(origin.handshakes() == before);
    });
    LOG_INFO << "Unverified by default PASS";
}

void testVerifiedWithCaFile(TlsOrigin& origin, const std::string& caFile) {
    webgate::ProxyOptions options = baseOptions(origin.port());
    options.tlsVerify = true;
    options.caFile = caFile;
    runScenario(options, [](webgate::ProxyServer&, uint16_t port) {
        std::string head, body;
        assert(fetchSecure(port, &head, &body));
        assert(head.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(body == "secure hello");
    });
    LOG_INFO << "Verified with CA file PASS";
}

void testVerificationFailureIs502(TlsOrigin& origin) {
    webgate::ProxyOptions options = baseOptions(origin.port());
    options.tlsVerify = true;
    runScenario(options, [](webgate::ProxyServer&, uint16_t port) {
        std::string head, body;
        assert(fetchSecure(port, &head, &body));
        assert(head.find("HTTP/1.1 502 ") == 0);
    });
    LOG_INFO << "Verification failure is 502 PASS";
}

void testMissingCaFileRefusesStart() {
    webgate::ProxyOptions options = baseOptions(1);
    options.tlsVerify = true;
    options.caFile = "/nonexistent/webgate-ca.pem";
    EventLoop loop;
    webgate::ProxyServer server(&loop, options);
    assert(!server.Start());
    LOG_INFO << "Missing CA file refuses start PASS";
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    webgate::common::Logger::Instance().SetLevel(webgate::common::LogLevel::FATAL);

    EVP_PKEY* key = nullptr;
    X509* cert = nullptr;
    assert(makeCertificate(&key, &cert));
    const std::string caFile = writeCertFile(cert);

    {
        TlsOrigin origin(key, cert);
        assert(origin.Start());
        testUnverifiedByDefault(origin);
        testVerifiedWithCaFile(origin, caFile);
        testVerificationFailureIs502(origin);
        testMissingCaFileRefusesStart();
    }

    ::unlink(caFile.c_str());
    X509_free(cert);
    EVP_PKEY_free(key);
    return 0;
}
