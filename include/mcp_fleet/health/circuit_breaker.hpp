#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/clock.hpp>

#include <mutex>
#include <optional>
#include <string>

namespace mcp_fleet {

enum class BreakerState {
    Closed,
    Open,
    HalfOpen,
};

[[nodiscard]] std::string BreakerStateName(BreakerState state);

// ---------------------------------------------------------------------------
// CircuitBreaker: gates restart attempts for one backend.
//
// CLOSED opens after failure_threshold consecutive failures. OPEN turns
// HALF_OPEN inside CanExecute() once recovery_timeout has passed since the
// last failure. In HALF_OPEN a success closes the breaker and a failure
// reopens it.
// ---------------------------------------------------------------------------
class CircuitBreaker {
public:
    explicit CircuitBreaker(BreakerOptions options = {}, ClockFn clock = SystemSteadyClock());

    /// May move OPEN -> HALF_OPEN.
    [[nodiscard]] bool CanExecute();

    void RecordSuccess();
    void RecordFailure();

    [[nodiscard]] BreakerState State() const;
    [[nodiscard]] int FailureCount() const;

private:
    BreakerOptions options_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    BreakerState state_ = BreakerState::Closed;
    int failure_count_ = 0;
    std::optional<SteadyClock::time_point> last_failure_;
};

} // namespace mcp_fleet
