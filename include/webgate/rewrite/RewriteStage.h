#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/rewrite/RewriteContext.h"

#include <memory>
#include <string>
#include <utility>

namespace webgate {
namespace rewrite {

// A pure transform over a response. Stages hold only configuration, so one
// instance serves every I/O thread.
class RewriteStage : common::noncopyable {
public:
    virtual ~RewriteStage() = default;

    virtual const char* Name() const = 0;
    virtual RewriteContext Apply(RewriteContext ctx) const = 0;
};

using RewriteStagePtr = std::unique_ptr<RewriteStage>;

// Sets the permissive CORS and range headers on every response, overwriting
// whatever the origin sent under any case.
class CorsStage : public RewriteStage {
public:
    const char* Name() const override { return "cors"; }
    RewriteContext Apply(RewriteContext ctx) const override;
};

// Points redirects back into the proxy namespace.
class LocationRewriteStage : public RewriteStage {
public:
    explicit LocationRewriteStage(std::string prefix) : prefix_(std::move(prefix)) {}
    const char* Name() const override { return "location"; }
    RewriteContext Apply(RewriteContext ctx) const override;

private:
    std::string prefix_;
};

// Rewrites URI lines of buffered HLS playlists so segments and variants are fetched
// through the proxy.
class HlsManifestStage : public RewriteStage {
public:
    explicit HlsManifestStage(std::string prefix) : prefix_(std::move(prefix)) {}
    const char* Name() const override { return "hls"; }
    RewriteContext Apply(RewriteContext ctx) const override;

    static bool IsManifestContentType(const std::string& contentType);

private:
    std::string prefix_;
};

// Drops headers that would stop the proxied page from rendering inside the proxy origin.
class SecurityHeaderStripStage : public RewriteStage {
public:
    const char* Name() const override { return "strip-security"; }
    RewriteContext Apply(RewriteContext ctx) const override;
};

} // namespace rewrite
} // namespace webgate
