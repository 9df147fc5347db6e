#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace app {

// Job-wide request and wall-clock ceilings. Cooperative: callers ask before
// starting a channel or a page, in-flight requests are never interrupted.
class ResourceGovernor {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    struct Limits {
        std::uint64_t maxRequests = 5'000;
        std::chrono::seconds maxDuration{600};
    };

    explicit ResourceGovernor(Limits limits, NowFn now = {});

    // False once either ceiling is reached; the matching flag stays set.
    bool allowWork();

    void recordRequest() { ++requests_; }

    std::uint64_t requests() const { return requests_; }
    bool requestCapHit() const { return requestCapHit_; }
    bool durationCapHit() const { return durationCapHit_; }
    bool exhausted() const { return requestCapHit_ || durationCapHit_; }

    std::chrono::duration<double> elapsed() const;

private:
    Limits limits_;
    NowFn now_;
    Clock::time_point start_;
    std::uint64_t requests_{0};
    bool requestCapHit_{false};
    bool durationCapHit_{false};
};

}  // namespace app
