#include "webgate/rewrite/RewriteStage.h"
#include "webgate/protocol/Url.h"
#include "webgate/common/Logger.h"

namespace webgate {
namespace rewrite {

using webgate::protocol::HeaderMap;
using webgate::protocol::Url;

namespace {

bool HasHttpScheme(const std::string& s) {
    static const std::string kHttp = "http://";
    static const std::string kHttps = "https://";
    auto startsWith = [&s](const std::string& p) {
        return s.size() >= p.size() && HeaderMap::EqualsIgnoreCase(s.substr(0, p.size()), p);
    };
    return startsWith(kHttp) || startsWith(kHttps);
}

} // namespace

RewriteContext CorsStage::Apply(RewriteContext ctx) const {
    ctx.headers.Set("access-control-allow-origin", "*");
    ctx.headers.Set("access-control-allow-methods", "GET, POST, PUT, DELETE, OPTIONS");
    ctx.headers.Set("access-control-allow-headers", "*");
    ctx.headers.Set("access-control-expose-headers",
                    "Content-Length, Content-Range, Accept-Ranges, Content-Type, Location");
    ctx.headers.Set("accept-ranges", "bytes");
    return ctx;
}

RewriteContext LocationRewriteStage::Apply(RewriteContext ctx) const {
    const std::string* found = ctx.headers.Find("Location");
    if (!found || found->empty()) return ctx;
    const std::string location = *found;
    if (location.find(prefix_) != std::string::npos) return ctx;

    std::string absolute;
    if (HasHttpScheme(location)) {
        absolute = location;
    } else {
        Url base;
        Url resolved;
        if (ctx.requestUrl.empty()) {
            absolute = location;
        } else if (Url::Parse(ctx.requestUrl, &base) && base.Resolve(location, &resolved)) {
            absolute = resolved.Href();
        } else {
            LOG_WARN << "Location rewrite: cannot resolve '" << location << "' against '"
                     << ctx.requestUrl << "', left as is";
            return ctx;
        }
    }

    ctx.headers.Set("Location", prefix_ + absolute);
    return ctx;
}

bool HlsManifestStage::IsManifestContentType(const std::string& contentType) {
    return HeaderMap::ContainsIgnoreCase(contentType, "mpegurl");
}

RewriteContext HlsManifestStage::Apply(RewriteContext ctx) const {
    if (!IsManifestContentType(ctx.headers.Get("content-type"))) return ctx;
    if (!ctx.bodyBuffered || ctx.body.empty()) return ctx;

    Url base;
    const bool haveBase = !ctx.requestUrl.empty() && Url::Parse(ctx.requestUrl, &base);

    std::string out;
    out.reserve(ctx.body.size() + ctx.body.size() / 2);
    size_t pos = 0;
    bool first = true;
    while (true) {
        const size_t nl = ctx.body.find('\n', pos);
        std::string line = ctx.body.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (!first) out += '\n';
        first = false;

        if (line.empty() || line[0] == '#') {
            out += line;
        } else if (HasHttpScheme(line)) {
            out += prefix_ + line;
        } else if (haveBase) {
            Url resolved;
            if (base.Resolve(line, &resolved)) {
                out += prefix_ + resolved.Href();
            } else {
                LOG_WARN << "HLS rewrite: cannot resolve line '" << line << "' against '"
                         << ctx.requestUrl << "'";
                out += line;
            }
        } else {
            out += line;
        }

        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    ctx.body.swap(out);

    const std::string lengthKey = ctx.headers.FindKey("content-length");
    if (!lengthKey.empty()) {
        ctx.headers.Set(lengthKey, std::to_string(ctx.body.size()));
    }
    return ctx;
}

RewriteContext SecurityHeaderStripStage::Apply(RewriteContext ctx) const {
    static const char* const kStripped[] = {
        "x-frame-options",
        "content-security-policy",
        "strict-transport-security",
        "public-key-pins",
    };
    for (const char* name : kStripped) {
        ctx.headers.Remove(name);
    }
    return ctx;
}

} // namespace rewrite
} // namespace webgate
