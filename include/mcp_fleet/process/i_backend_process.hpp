#pragma once

#include <mcp_fleet/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_fleet {

// Receives one newline-stripped line from a backend stream.
using LineHandler = std::function<void(const std::string& line)>;

// ---------------------------------------------------------------------------
// IBackendProcess: one stdio MCP subprocess and its pipes.
//
// The registry and distributor depend on this interface rather than on the
// POSIX implementation, which keeps them testable with MockBackendProcess.
//
// Output handlers are invoked from reader threads owned by the process and
// must not block for long. Methods return Result<T, Error> and never throw.
// ---------------------------------------------------------------------------
class IBackendProcess {
public:
    virtual ~IBackendProcess() = default;

    IBackendProcess(const IBackendProcess&) = delete;
    IBackendProcess& operator=(const IBackendProcess&) = delete;
    IBackendProcess(IBackendProcess&&) = delete;
    IBackendProcess& operator=(IBackendProcess&&) = delete;

    /// Spawn the process. Fails with ProcessStartFailure if it cannot be
    /// spawned or exits within the startup grace window.
    [[nodiscard]] virtual Result<void, Error> Start() = 0;

    /// Terminate gracefully, escalating to a forced kill. Idempotent.
    virtual void Stop() = 0;

    /// Write one frame (a newline is appended). Starts the process once first
    /// if it is not alive.
    [[nodiscard]] virtual Result<void, Error> Send(std::string_view line) = 0;

    /// Live OS status, not "was started".
    [[nodiscard]] virtual bool IsAlive() = 0;

    [[nodiscard]] virtual std::optional<int> Pid() const = 0;

    /// Number of successful Start() calls so far.
    [[nodiscard]] virtual int StartCount() const = 0;

    // Handlers must be installed before Start().
    virtual void SetOutputHandler(LineHandler handler) = 0;
    virtual void SetErrorHandler(LineHandler handler) = 0;
    virtual void SetStartedCallback(std::function<void()> callback) = 0;

protected:
    IBackendProcess() = default;
};

} // namespace mcp_fleet
