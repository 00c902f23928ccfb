#pragma once

#include "webgate/common/noncopyable.h"
#include "webgate/rewrite/RewriteStage.h"

#include <string>
#include <vector>

namespace webgate {
namespace rewrite {

// Ordered list of stages. A stage that throws is logged and skipped; the context
// continues as it was before that stage. Immutable once built, shared across loops.
class RewritePipeline : common::noncopyable {
public:
    void AddStage(RewriteStagePtr stage) { stages_.push_back(std::move(stage)); }

    RewriteContext Run(RewriteContext ctx) const;

    std::vector<std::string> StageNames() const;
    size_t size() const { return stages_.size(); }

    // cors, location, hls, strip-security
    static std::unique_ptr<RewritePipeline> MakeDefault(const std::string& prefix);

private:
    std::vector<RewriteStagePtr> stages_;
};

} // namespace rewrite
} // namespace webgate
