#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/process/process_table.hpp>
#include <mcp_fleet/runtime/periodic_task.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace mcp_fleet {

struct MonitoredProcess {
    std::string backend;
    int pid = 0;
};

// ---------------------------------------------------------------------------
// IMonitoredFleet: the monitor's view of the registry.
// ---------------------------------------------------------------------------
class IMonitoredFleet {
public:
    virtual ~IMonitoredFleet() = default;

    /// Backends the registry believes are running, with their pids.
    [[nodiscard]] virtual std::vector<MonitoredProcess> LiveProcesses() = 0;

    /// Record a health failure and mark the backend not-live, but only if
    /// `pid` is still the process the registry tracks for it. The
    /// configuration is kept so a later ensure respawns it. Returns whether
    /// the report applied.
    virtual bool ReportProcessLost(const std::string& backend, int pid,
                                   const std::string& reason) = 0;
};

struct OrphanScanResult {
    int cleaned = 0;
    int permission_errors = 0;
};

// ---------------------------------------------------------------------------
// ProcessMonitor: periodic reconciliation of registry state against the OS
// process table, plus a system-wide scan for orphaned backend processes.
// ---------------------------------------------------------------------------
class ProcessMonitor {
public:
    ProcessMonitor(IMonitoredFleet& fleet, IProcessTable& table, MonitorOptions options = {});
    ~ProcessMonitor();

    ProcessMonitor(const ProcessMonitor&) = delete;
    ProcessMonitor& operator=(const ProcessMonitor&) = delete;

    /// Query every live backend; zombie, stopped or missing processes are
    /// reported lost. Returns how many were.
    int CheckBackends();

    /// Terminate processes matching an orphan pattern whose parent is gone.
    /// SIGTERM, wait up to orphan_kill_timeout, then SIGKILL.
    OrphanScanResult ScanOrphans();

    /// One CheckBackends plus, when enabled, one ScanOrphans.
    void RunOnce();

    void Start();
    void Stop();

    [[nodiscard]] int LastOrphanCount() const noexcept { return last_orphans_.load(); }
    [[nodiscard]] int PermissionErrors() const noexcept { return permission_errors_.load(); }

private:
    [[nodiscard]] bool MatchesPattern(const std::string& cmdline) const;
    [[nodiscard]] bool WaitForExit(int pid);

    IMonitoredFleet& fleet_;
    IProcessTable& table_;
    MonitorOptions options_;
    std::unique_ptr<PeriodicTask> task_;

    std::atomic<int> last_orphans_{0};
    std::atomic<int> permission_errors_{0};
};

} // namespace mcp_fleet
