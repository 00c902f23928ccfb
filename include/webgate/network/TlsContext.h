#pragma once

#include "webgate/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace webgate {
namespace network {

class TlsContext : webgate::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // Inbound termination with a PEM certificate chain and key.
    bool InitServer(const std::string& certPemPath, const std::string& keyPemPath);

    // Outbound client. With verifyPeer=false the peer chain and host name are not checked,
    // which accepts any certificate the origin presents. caFile empty means system roots.
    bool InitClient(bool verifyPeer, const std::string& caFile = std::string());

    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

    // Drains the OpenSSL error queue into one line.
    static std::string LastError();

private:
    void Reset();

    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{false};
};

} // namespace network
} // namespace webgate
