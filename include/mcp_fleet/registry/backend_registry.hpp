#pragma once

#include <mcp_fleet/catalog/tool_catalog.hpp>
#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/health/circuit_breaker.hpp>
#include <mcp_fleet/health/process_monitor.hpp>
#include <mcp_fleet/health/server_health.hpp>
#include <mcp_fleet/process/i_backend_process.hpp>
#include <mcp_fleet/protocol/jsonrpc.hpp>
#include <mcp_fleet/runtime/session_manager.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// Creates the process object for a backend. Called once per registry entry;
// the object is restarted in place afterwards.
using ProcessFactory = std::function<std::unique_ptr<IBackendProcess>(
    const std::string& name, const BackendConfig& config)>;

/// Factory producing POSIX BackendProcess instances.
ProcessFactory PosixProcessFactory(BackendOptions options);

struct RegistryOptions {
    size_t max_dynamic_backends = 20;
    std::chrono::milliseconds message_timeout{10000};
    ResponseRouting routing = ResponseRouting::Broadcast;
    BreakerOptions breaker;

    static RegistryOptions FromConfig(const AppConfig& config);
};

// Snapshot of one registry entry for listings and the health report.
struct BackendStatus {
    std::string name;
    bool popular = false;
    bool alive = false;
    bool initialized = false;
    std::optional<int> pid;
    int start_count = 0;
    std::chrono::system_clock::time_point last_used;
    std::chrono::seconds idle{0};
    HealthSnapshot health;
    BreakerState breaker = BreakerState::Closed;
    size_t sessions = 0;
    size_t pending_requests = 0;
    size_t tools = 0;
    BackendConfig config;

    /// {alive, lastUsed, popular, state, ...}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// BackendRegistry: single owner of every named backend.
//
// Two groups share one map: popular backends (registered at boot, never
// reclaimed) and dynamic ones (added at runtime, removed by CleanupIdle).
// Each entry keeps one process object, one MessageDistributor that outlives
// process restarts, and its own health and circuit breaker.
//
// Sends go through one recovery path: a dead backend is restarted (MCP
// handshake and catalog refresh included) before the write, and a failed
// write gets exactly one restart-and-retry. Both are gated by the breaker;
// when it is open the caller gets CircuitOpen without a restart attempt.
//
// Waiting for replies happens outside every lock, so concurrent calls to
// one backend proceed in parallel.
// ---------------------------------------------------------------------------
class BackendRegistry : public ISubscriptionHub, public IMonitoredFleet {
public:
    BackendRegistry(RegistryOptions options, ToolCatalog& catalog, ProcessFactory factory,
                    ClockFn clock = SystemSteadyClock());
    ~BackendRegistry() override;

    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    /// Register a popular backend without starting it.
    [[nodiscard]] Result<void, Error> RegisterPopular(const std::string& name,
                                                      const BackendConfig& config);

    /// Ensure every popular backend; failures are logged. Returns how many
    /// are running afterwards.
    size_t StartPopular();

    /// Alive: touch and return. Otherwise start it (breaker-gated), run the
    /// handshake and refresh its catalog entries. With a config, an unknown
    /// name is added as a dynamic backend first.
    [[nodiscard]] Result<void, Error> Ensure(const std::string& name,
                                             const std::optional<BackendConfig>& config =
                                                 std::nullopt);

    /// Add a dynamic backend and start it. Adding an existing name with the
    /// same configuration is a no-op.
    [[nodiscard]] Result<void, Error> Add(const std::string& name, const BackendConfig& config);

    /// Stop and forget a dynamic backend. Popular backends are refused.
    [[nodiscard]] Result<void, Error> Remove(const std::string& name);

    /// Stop, start, handshake and refresh the catalog.
    [[nodiscard]] Result<void, Error> Restart(const std::string& name);

    /// Fire-and-forget write (notifications, session traffic).
    [[nodiscard]] Result<void, Error> Send(const std::string& name,
                                           const protocol::Message& message);

    /// Send a request carrying the caller's id and wait for the reply with
    /// the same id. ResponseTimeout leaves the backend running and healthy.
    [[nodiscard]] Result<protocol::Message, Error> Exchange(const std::string& name,
                                                            const protocol::Request& request,
                                                            std::chrono::milliseconds timeout);

    /// Exchange with a gateway-generated id.
    [[nodiscard]] Result<protocol::Message, Error> Request(const std::string& name,
                                                           const std::string& method,
                                                           const nlohmann::json& params,
                                                           std::chrono::milliseconds timeout);

    /// Request and unwrap: the "result" member, or BackendError for an error
    /// reply.
    [[nodiscard]] Result<nlohmann::json, Error> Call(const std::string& name,
                                                     const std::string& method,
                                                     const nlohmann::json& params,
                                                     std::chrono::milliseconds timeout);

    /// Remove dynamic backends idle longer than ttl. Returns their names.
    std::vector<std::string> CleanupIdle(std::chrono::seconds ttl);

    /// Stop every process. Entries and configuration stay.
    void Shutdown();

    [[nodiscard]] bool Contains(const std::string& name) const;
    [[nodiscard]] bool IsPopular(const std::string& name) const;
    [[nodiscard]] std::vector<BackendStatus> List() const;
    [[nodiscard]] Result<BackendStatus, Error> Describe(const std::string& name) const;
    [[nodiscard]] size_t DynamicCount() const;

    // ISubscriptionHub
    [[nodiscard]] Result<void, Error> Subscribe(const std::string& backend,
                                                const std::string& session_id,
                                                std::shared_ptr<SessionQueue> queue) override;
    void Unsubscribe(const std::string& backend, const std::string& session_id) override;
    void ClaimReply(const std::string& backend, const std::string& id_key,
                    const std::string& session_id) override;

    // IMonitoredFleet
    [[nodiscard]] std::vector<MonitoredProcess> LiveProcesses() override;
    bool ReportProcessLost(const std::string& backend, int pid,
                           const std::string& reason) override;

private:
    struct Entry;

    [[nodiscard]] std::shared_ptr<Entry> Find(const std::string& name) const;
    [[nodiscard]] Result<std::shared_ptr<Entry>, Error> FindOrError(const std::string& name,
                                                                    const char* operation) const;
    [[nodiscard]] Result<std::shared_ptr<Entry>, Error> Insert(const std::string& name,
                                                               const BackendConfig& config,
                                                               bool popular);

    // All *Locked helpers require entry.lifecycle_mutex.
    [[nodiscard]] Result<void, Error> EnsureLocked(Entry& entry);
    [[nodiscard]] Result<void, Error> RestartLocked(Entry& entry);
    [[nodiscard]] Result<void, Error> HandshakeLocked(Entry& entry);
    [[nodiscard]] Result<nlohmann::json, Error> RoundTripLocked(Entry& entry,
                                                                const std::string& method,
                                                                const nlohmann::json& params);
    void RefreshCatalogLocked(Entry& entry);
    void StopLocked(Entry& entry);

    [[nodiscard]] Result<void, Error> SendWithRecovery(Entry& entry, const std::string& line);
    [[nodiscard]] BackendStatus StatusOf(const Entry& entry) const;
    void Touch(Entry& entry);
    [[nodiscard]] std::string NextRequestId();

    RegistryOptions options_;
    ToolCatalog& catalog_;
    ProcessFactory factory_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;

    std::atomic<uint64_t> next_id_{1};
};

} // namespace mcp_fleet
