#pragma once

#include "webgate/protocol/HttpContext.h"
#include "webgate/upstream/ForwardSession.h"
#include "webgate/upstream/UpgradeTunnel.h"

#include <memory>

namespace webgate {

// Per client connection state, kept in the connection context:
// 1. HTTP parsing of the next request head
// 2. at most one exchange in flight (forward session or upgrade tunnel)
struct ProxySessionContext {
    protocol::HttpContext httpContext;

    std::shared_ptr<upstream::ForwardSession> forward;
    std::shared_ptr<upstream::UpgradeTunnel> tunnel;

    // Set once the connection is going down; later bytes are discarded.
    bool closing{false};
    uint64_t requests{0};
};

} // namespace webgate
