#include <mcp_fleet/health/server_health.hpp>

#include <mcp_fleet/core/log.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_fleet {

namespace {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

nlohmann::json OptionalTime(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) {
        return nullptr;
    }
    return FormatTimestamp(*tp);
}

} // anonymous namespace

std::string HealthStateName(HealthState state) {
    switch (state) {
        case HealthState::Starting: return "starting";
        case HealthState::Healthy: return "healthy";
        case HealthState::Degraded: return "degraded";
        case HealthState::Failed: return "failed";
        case HealthState::Stopped: return "stopped";
    }
    return "unknown";
}

nlohmann::json HealthSnapshot::ToJson(size_t max_errors) const {
    nlohmann::json recent = nlohmann::json::array();
    size_t first = errors.size() > max_errors ? errors.size() - max_errors : 0;
    for (size_t i = first; i < errors.size(); ++i) {
        recent.push_back(errors[i]);
    }
    return {
        {"state", HealthStateName(state)},
        {"failure_count", failure_count},
        {"success_count", success_count},
        {"last_success", OptionalTime(last_success)},
        {"last_failure", OptionalTime(last_failure)},
        {"pid", pid ? nlohmann::json(*pid) : nlohmann::json(nullptr)},
        {"recent_errors", recent},
    };
}

ServerHealth::ServerHealth(std::string backend) : backend_(std::move(backend)) {}

void ServerHealth::RecordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HealthState::Stopped) {
        return;
    }
    last_success_ = std::chrono::system_clock::now();
    ++success_count_;
    failure_count_ = 0;
    if (state_ == HealthState::Failed || state_ == HealthState::Degraded) {
        LogInfo("health", backend_ + " recovered");
    }
    state_ = HealthState::Healthy;
}

void ServerHealth::RecordFailure(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HealthState::Stopped) {
        return;
    }
    auto now = std::chrono::system_clock::now();
    last_failure_ = now;
    ++failure_count_;
    errors_.push_back(FormatTimestamp(now) + ": " + message);
    while (errors_.size() > kMaxErrors) {
        errors_.pop_front();
    }

    auto previous = state_;
    if (failure_count_ >= kFailedThreshold) {
        state_ = HealthState::Failed;
    } else if (failure_count_ >= kDegradedThreshold) {
        state_ = HealthState::Degraded;
    }
    if (state_ != previous) {
        LogWarn("health", backend_ + " is now " + HealthStateName(state_) + " after " +
                              std::to_string(failure_count_) + " failures");
    }
}

void ServerHealth::MarkStopped() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = HealthState::Stopped;
    pid_.reset();
}

void ServerHealth::SetPid(std::optional<int> pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
}

HealthState ServerHealth::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int ServerHealth::FailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

HealthSnapshot ServerHealth::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HealthSnapshot snap;
    snap.backend = backend_;
    snap.state = state_;
    snap.failure_count = failure_count_;
    snap.success_count = success_count_;
    snap.last_success = last_success_;
    snap.last_failure = last_failure_;
    snap.pid = pid_;
    snap.errors.assign(errors_.begin(), errors_.end());
    return snap;
}

} // namespace mcp_fleet
