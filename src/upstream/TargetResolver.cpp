#include "webgate/upstream/TargetResolver.h"
#include "webgate/protocol/HeaderMap.h"
#include "webgate/common/Logger.h"

#include <initializer_list>

namespace webgate {
namespace upstream {

using webgate::protocol::HeaderMap;
using webgate::protocol::Url;

std::string TargetResolver::RepairCollapsedScheme(const std::string& s) {
    for (const char* scheme : {"https:/", "http:/"}) {
        const std::string p(scheme);
        if (s.size() > p.size() && HeaderMap::EqualsIgnoreCase(s.substr(0, p.size()), p) &&
            s[p.size()] != '/') {
            return s.substr(0, p.size()) + "/" + s.substr(p.size());
        }
    }
    return s;
}

bool TargetResolver::Resolve(const std::string& requestTarget, ResolvedTarget* out, std::string* error) const {
    if (!Matches(requestTarget)) {
        *error = "path does not start with " + prefix_;
        return false;
    }
    const std::string embedded = RepairCollapsedScheme(requestTarget.substr(prefix_.size()));

    Url url;
    if (!Url::Parse(embedded, &url)) {
        *error = "invalid target URL: " + embedded;
        return false;
    }
    if (url.scheme != "http" && url.scheme != "https") {
        *error = "unsupported target scheme: " + url.scheme;
        return false;
    }

    out->portStripped = false;
    out->strippedPort = 0;
    if (url.port != 0) {
        LOG_WARN << "[PORT-STRIP] Port " << url.port << " removed, using standard port for "
                 << url.scheme << ":";
        out->portStripped = true;
        out->strippedPort = url.port;
        url.port = 0;
    }
    out->href = url.Href();
    out->url = std::move(url);
    return true;
}

} // namespace upstream
} // namespace webgate
