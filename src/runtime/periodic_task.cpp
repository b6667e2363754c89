#include <mcp_fleet/runtime/periodic_task.hpp>

#include <mcp_fleet/core/log.hpp>

#include <exception>

namespace mcp_fleet {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> body)
    : name_(std::move(name)), interval_(interval), body_(std::move(body)) {
    if (interval_ <= std::chrono::milliseconds::zero()) {
        interval_ = std::chrono::milliseconds(1);
    }
}

PeriodicTask::~PeriodicTask() {
    Stop();
}

void PeriodicTask::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this] { RunLoop(); });
}

void PeriodicTask::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool PeriodicTask::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PeriodicTask::RunLoop() {
    LogDebug("task", name_ + " started");
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this] { return !running_; });
            if (!running_) {
                break;
            }
        }
        try {
            body_();
        } catch (const std::exception& e) {
            LogError("task", name_ + " failed: " + e.what());
        }
    }
    LogDebug("task", name_ + " stopped");
}

} // namespace mcp_fleet
