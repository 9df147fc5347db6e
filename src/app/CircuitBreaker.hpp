#pragma once

namespace app {

// Counts consecutive channel failures. Once tripped it stays tripped for the
// rest of the run. A threshold <= 0 disables tripping.
class CircuitBreaker {
public:
    explicit CircuitBreaker(int threshold);

    void recordSuccess();

    // Returns true when this failure trips the breaker.
    bool recordFailure();

    bool tripped() const { return tripped_; }
    int consecutiveFailures() const { return consecutiveFailures_; }
    int threshold() const { return threshold_; }

private:
    int threshold_;
    int consecutiveFailures_{0};
    bool tripped_{false};
};

}  // namespace app
