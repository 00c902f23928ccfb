#include "webgate/rewrite/RewritePipeline.h"
#include "webgate/common/Logger.h"

#include <exception>

namespace webgate {
namespace rewrite {

RewriteContext RewritePipeline::Run(RewriteContext ctx) const {
    for (const auto& stage : stages_) {
        try {
            ctx = stage->Apply(ctx);
        } catch (const std::exception& e) {
            LOG_ERROR << "rewrite stage '" << stage->Name() << "' failed for " << ctx.requestUrl
                      << ": " << e.what();
        }
    }
    return ctx;
}

std::vector<std::string> RewritePipeline::StageNames() const {
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) names.emplace_back(stage->Name());
    return names;
}

std::unique_ptr<RewritePipeline> RewritePipeline::MakeDefault(const std::string& prefix) {
    auto pipeline = std::make_unique<RewritePipeline>();
    pipeline->AddStage(std::make_unique<CorsStage>());
    pipeline->AddStage(std::make_unique<LocationRewriteStage>(prefix));
    pipeline->AddStage(std::make_unique<HlsManifestStage>(prefix));
    pipeline->AddStage(std::make_unique<SecurityHeaderStripStage>());
    return pipeline;
}

} // namespace rewrite
} // namespace webgate
