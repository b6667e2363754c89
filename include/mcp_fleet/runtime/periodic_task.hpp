#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// PeriodicTask: runs a callback on its own thread every interval until
// stopped. Stop() wakes the sleeping thread immediately and joins it.
// The first run happens one interval after Start().
// ---------------------------------------------------------------------------
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval,
                 std::function<void()> body);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void Start();
    void Stop();

    [[nodiscard]] bool IsRunning() const;
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

private:
    void RunLoop();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> body_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::thread thread_;
};

} // namespace mcp_fleet
