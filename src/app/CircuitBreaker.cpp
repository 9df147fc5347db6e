#include "app/CircuitBreaker.hpp"

#include "common/Log.hpp"

namespace app {

CircuitBreaker::CircuitBreaker(int threshold) : threshold_(threshold) {}

void CircuitBreaker::recordSuccess() {
    consecutiveFailures_ = 0;
}

bool CircuitBreaker::recordFailure() {
    ++consecutiveFailures_;
    if (tripped_ || threshold_ <= 0 || consecutiveFailures_ < threshold_) {
        return false;
    }
    tripped_ = true;
    LOG_WARN("CircuitBreaker: tripped after " << consecutiveFailures_ << " consecutive channel failures");
    return true;
}

}  // namespace app
