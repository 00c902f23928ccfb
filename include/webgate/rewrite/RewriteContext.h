#pragma once

#include "webgate/protocol/HeaderMap.h"

#include <string>

namespace webgate {
namespace rewrite {

// One response on its way back to the client. Created per response, passed by
// value through the rewrite stages.
struct RewriteContext {
    int status{0};
    std::string reason;
    webgate::protocol::HeaderMap headers;
    // Only meaningful when bodyBuffered is set; streamed bodies never reach the pipeline.
    std::string body;
    bool bodyBuffered{false};
    // href of the upstream URL the response came from.
    std::string requestUrl;
};

} // namespace rewrite
} // namespace webgate
