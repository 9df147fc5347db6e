#include "app/ResourceGovernor.hpp"

#include <utility>

#include "common/Log.hpp"

namespace app {

ResourceGovernor::ResourceGovernor(Limits limits, NowFn now)
    : limits_(limits), now_(now ? std::move(now) : NowFn{[] { return Clock::now(); }}), start_(now_()) {}

bool ResourceGovernor::allowWork() {
    if (exhausted()) {
        return false;
    }
    if (requests_ >= limits_.maxRequests) {
        requestCapHit_ = true;
        LOG_WARN("ResourceGovernor: request cap reached requests=" << requests_ << " max=" << limits_.maxRequests);
        return false;
    }
    if (elapsed() > limits_.maxDuration) {
        durationCapHit_ = true;
        LOG_WARN("ResourceGovernor: duration cap reached elapsed=" << elapsed().count()
                                                                  << "s max=" << limits_.maxDuration.count() << 's');
        return false;
    }
    return true;
}

std::chrono::duration<double> ResourceGovernor::elapsed() const {
    return now_() - start_;
}

}  // namespace app
