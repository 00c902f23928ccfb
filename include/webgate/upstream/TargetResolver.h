#pragma once

#include "webgate/protocol/Url.h"

#include <string>
#include <utility>

namespace webgate {
namespace upstream {

struct ResolvedTarget {
    webgate::protocol::Url url;
    std::string href;
    bool portStripped{false};
    uint16_t strippedPort{0};
};

// Turns "<prefix><absolute url>" request targets into the upstream URL.
class TargetResolver {
public:
    explicit TargetResolver(std::string prefix) : prefix_(std::move(prefix)) {}

    const std::string& prefix() const { return prefix_; }
    bool Matches(const std::string& path) const { return path.compare(0, prefix_.size(), prefix_) == 0; }

    // requestTarget is the raw inbound request-target, query included. On failure error holds
    // a one-line reason and the request must not be forwarded.
    bool Resolve(const std::string& requestTarget, ResolvedTarget* out, std::string* error) const;

    // "https:/host/..." -> "https://host/...", left by intermediaries that merge slashes.
    static std::string RepairCollapsedScheme(const std::string& s);

private:
    std::string prefix_;
};

} // namespace upstream
} // namespace webgate
