#pragma once

#include <chrono>
#include <functional>

namespace mcp_fleet {

using SteadyClock = std::chrono::steady_clock;

// Injectable time source; tests pass a manual clock.
using ClockFn = std::function<SteadyClock::time_point()>;

inline ClockFn SystemSteadyClock() {
    return [] { return SteadyClock::now(); };
}

} // namespace mcp_fleet
