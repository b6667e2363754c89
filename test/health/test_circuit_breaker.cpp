#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/health/circuit_breaker.hpp>

#include <chrono>

using namespace mcp_fleet;
using namespace std::chrono_literals;

namespace {

struct ManualClock {
    SteadyClock::time_point now = SteadyClock::time_point{} + 1000s;
    ClockFn Fn() {
        return [this] { return now; };
    }
};

BreakerOptions Options(int threshold = 5, std::chrono::seconds recovery = 60s) {
    BreakerOptions options;
    options.failure_threshold = threshold;
    options.recovery_timeout = recovery;
    return options;
}

} // anonymous namespace

TEST_CASE("CircuitBreaker: starts closed", "[health][breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(Options(), clock.Fn());
    CHECK(breaker.State() == BreakerState::Closed);
    CHECK(breaker.CanExecute());
}

TEST_CASE("CircuitBreaker: opens at the failure threshold", "[health][breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(Options(5), clock.Fn());
    for (int i = 0; i < 4; ++i) {
        breaker.RecordFailure();
    }
    CHECK(breaker.State() == BreakerState::Closed);
    breaker.RecordFailure();
    CHECK(breaker.State() == BreakerState::Open);
    CHECK_FALSE(breaker.CanExecute());
}

TEST_CASE("CircuitBreaker: half-opens once the recovery timeout elapsed", "[health][breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(Options(1, 60s), clock.Fn());
    breaker.RecordFailure();
    REQUIRE(breaker.State() == BreakerState::Open);

    clock.now += 59s;
    CHECK_FALSE(breaker.CanExecute());
    clock.now += 1s;
    CHECK(breaker.CanExecute());
    CHECK(breaker.State() == BreakerState::HalfOpen);
    CHECK(breaker.CanExecute());
}

TEST_CASE("CircuitBreaker: success in half-open closes it", "[health][breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(Options(2, 10s), clock.Fn());
    breaker.RecordFailure();
    breaker.RecordFailure();
    clock.now += 10s;
    REQUIRE(breaker.CanExecute());

    breaker.RecordSuccess();
    CHECK(breaker.State() == BreakerState::Closed);
    CHECK(breaker.FailureCount() == 0);
}

TEST_CASE("CircuitBreaker: failure in half-open reopens it", "[health][breaker]") {
    ManualClock clock;
    CircuitBreaker breaker(Options(3, 10s), clock.Fn());
    for (int i = 0; i < 3; ++i) {
        breaker.RecordFailure();
    }
    clock.now += 10s;
    REQUIRE(breaker.CanExecute());
    REQUIRE(breaker.State() == BreakerState::HalfOpen);

    breaker.RecordFailure();
    CHECK(breaker.State() == BreakerState::Open);
    CHECK_FALSE(breaker.CanExecute());
}

TEST_CASE("BreakerStateName: wire names", "[health][breaker]") {
    CHECK(BreakerStateName(BreakerState::Closed) == "closed");
    CHECK(BreakerStateName(BreakerState::Open) == "open");
    CHECK(BreakerStateName(BreakerState::HalfOpen) == "half_open");
}
