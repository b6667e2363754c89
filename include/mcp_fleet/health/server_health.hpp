#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

enum class HealthState {
    Starting,
    Healthy,
    Degraded,
    Failed,
    Stopped,
};

[[nodiscard]] std::string HealthStateName(HealthState state);

// Point-in-time copy of a ServerHealth.
struct HealthSnapshot {
    std::string backend;
    HealthState state = HealthState::Starting;
    int failure_count = 0;
    uint64_t success_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_success;
    std::optional<std::chrono::system_clock::time_point> last_failure;
    std::optional<int> pid;
    std::vector<std::string> errors;   // oldest first

    /// Report shape; only the most recent `max_errors` errors are included.
    [[nodiscard]] nlohmann::json ToJson(size_t max_errors = 3) const;
};

// ---------------------------------------------------------------------------
// ServerHealth: per-backend success/failure counters driving the health
// state machine.
//
//   STARTING --success--> HEALTHY
//   any success resets the failure count and returns to HEALTHY
//   failures in [2, 4] -> DEGRADED, >= 5 -> FAILED
//   STOPPED is terminal; later records are ignored
//
// Thread-safe. Health only observes; it never restarts anything.
// ---------------------------------------------------------------------------
class ServerHealth {
public:
    static constexpr int kDegradedThreshold = 2;
    static constexpr int kFailedThreshold = 5;
    static constexpr size_t kMaxErrors = 10;

    explicit ServerHealth(std::string backend);

    void RecordSuccess();
    void RecordFailure(const std::string& message);
    void MarkStopped();
    void SetPid(std::optional<int> pid);

    [[nodiscard]] HealthState State() const;
    [[nodiscard]] int FailureCount() const;
    [[nodiscard]] HealthSnapshot Snapshot() const;

private:
    const std::string backend_;
    mutable std::mutex mutex_;
    HealthState state_ = HealthState::Starting;
    int failure_count_ = 0;
    uint64_t success_count_ = 0;
    std::optional<std::chrono::system_clock::time_point> last_success_;
    std::optional<std::chrono::system_clock::time_point> last_failure_;
    std::optional<int> pid_;
    std::deque<std::string> errors_;
};

} // namespace mcp_fleet
