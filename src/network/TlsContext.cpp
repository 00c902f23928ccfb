#include "webgate/network/TlsContext.h"
#include "webgate/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace webgate {
namespace network {

TlsContext::TlsContext() {
    // OpenSSL >= 1.1 initialises itself; this only pins the error strings early.
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}

TlsContext::~TlsContext() {
    Reset();
}

void TlsContext::Reset() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

std::string TlsContext::LastError() {
    std::string out;
    unsigned long e = 0;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? std::string("unknown TLS error") : out;
}

bool TlsContext::InitServer(const std::string& certPemPath, const std::string& keyPemPath) {
    if (certPemPath.empty() || keyPemPath.empty()) {
        LOG_ERROR << "TLS: cert_path and key_path are required";
        return false;
    }
    Reset();

    SSL_CTX* c = SSL_CTX_new(TLS_server_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastError();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);

    if (SSL_CTX_use_certificate_chain_file(c, certPemPath.c_str()) != 1) {
        LOG_ERROR << "TLS: load cert failed: " << certPemPath << ": " << LastError();
        SSL_CTX_free(c);
        return false;
    }
    if (SSL_CTX_use_PrivateKey_file(c, keyPemPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        LOG_ERROR << "TLS: load key failed: " << keyPemPath << ": " << LastError();
        SSL_CTX_free(c);
        return false;
    }
    if (SSL_CTX_check_private_key(c) != 1) {
        LOG_ERROR << "TLS: key does not match cert";
        SSL_CTX_free(c);
        return false;
    }

    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    return true;
}

bool TlsContext::InitClient(bool verifyPeer, const std::string& caFile) {
    Reset();

    SSL_CTX* c = SSL_CTX_new(TLS_client_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastError();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
    SSL_CTX_set_mode(c, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER | SSL_MODE_ENABLE_PARTIAL_WRITE);

    if (verifyPeer) {
        const int loaded = caFile.empty()
            ? SSL_CTX_set_default_verify_paths(c)
            : SSL_CTX_load_verify_locations(c, caFile.c_str(), nullptr);
        if (loaded != 1) {
            LOG_ERROR << "TLS: loading trust roots failed: " << LastError();
            SSL_CTX_free(c);
            return false;
        }
        SSL_CTX_set_verify(c, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(c, SSL_VERIFY_NONE, nullptr);
    }

    verifyPeer_ = verifyPeer;
    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    return true;
}

} // namespace network
} // namespace webgate
