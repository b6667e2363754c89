#include <mcp_fleet/health/circuit_breaker.hpp>

namespace mcp_fleet {

std::string BreakerStateName(BreakerState state) {
    switch (state) {
        case BreakerState::Closed: return "closed";
        case BreakerState::Open: return "open";
        case BreakerState::HalfOpen: return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(BreakerOptions options, ClockFn clock)
    : options_(options), clock_(std::move(clock)) {
    if (options_.failure_threshold < 1) {
        options_.failure_threshold = 1;
    }
}

bool CircuitBreaker::CanExecute() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case BreakerState::Closed:
        case BreakerState::HalfOpen:
            return true;
        case BreakerState::Open:
            if (last_failure_ && clock_() - *last_failure_ >= options_.recovery_timeout) {
                state_ = BreakerState::HalfOpen;
                return true;
            }
            return false;
    }
    return false;
}

void CircuitBreaker::RecordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_count_ = 0;
    state_ = BreakerState::Closed;
}

void CircuitBreaker::RecordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failure_count_;
    last_failure_ = clock_();
    if (state_ == BreakerState::HalfOpen || failure_count_ >= options_.failure_threshold) {
        state_ = BreakerState::Open;
    }
}

BreakerState CircuitBreaker::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int CircuitBreaker::FailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

} // namespace mcp_fleet
