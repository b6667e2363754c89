#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/process/i_backend_process.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include <sys/types.h>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// BackendProcess: POSIX fork/exec implementation of IBackendProcess.
//
// The child runs in its own process group so Stop() also reaches helpers a
// launcher such as npx or uvx spawns. Stdout and stderr are read by two
// reader threads owned by this object; they hand complete lines to the
// installed handlers.
//
// The started callback runs with the process lock held, before anything is
// written to the new process; it must not call back into this object.
// ---------------------------------------------------------------------------
class BackendProcess : public IBackendProcess {
public:
    BackendProcess(std::string name, BackendConfig config, BackendOptions options = {});
    ~BackendProcess() override;

    [[nodiscard]] Result<void, Error> Start() override;
    void Stop() override;
    [[nodiscard]] Result<void, Error> Send(std::string_view line) override;
    [[nodiscard]] bool IsAlive() override;
    [[nodiscard]] std::optional<int> Pid() const override;
    [[nodiscard]] int StartCount() const override;

    void SetOutputHandler(LineHandler handler) override;
    void SetErrorHandler(LineHandler handler) override;
    void SetStartedCallback(std::function<void()> callback) override;

    /// Raw wait status of the last reaped child, if any.
    [[nodiscard]] std::optional<int> LastExitStatus() const;

private:
    Result<void, Error> StartLocked();
    void StopLocked();
    bool IsAliveLocked();
    void ReleaseLocked();
    Result<void, Error> WriteLocked(std::string_view line);

    std::string name_;
    BackendConfig config_;
    BackendOptions options_;

    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<int> exit_status_;
    std::atomic<int> start_count_{0};

    std::atomic<bool> readers_running_{false};
    std::thread stdout_reader_;
    std::thread stderr_reader_;

    LineHandler output_handler_;
    LineHandler error_handler_;
    std::function<void()> started_callback_;
};

} // namespace mcp_fleet
