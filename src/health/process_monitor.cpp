#include <mcp_fleet/health/process_monitor.hpp>

#include <mcp_fleet/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <set>
#include <thread>

#include <unistd.h>

namespace mcp_fleet {

namespace {

constexpr auto kExitPollInterval = std::chrono::milliseconds(50);

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

ProcessMonitor::ProcessMonitor(IMonitoredFleet& fleet, IProcessTable& table,
                               MonitorOptions options)
    : fleet_(fleet), table_(table), options_(std::move(options)) {
    for (auto& pattern : options_.orphan_patterns) {
        pattern = ToLower(pattern);
    }
}

ProcessMonitor::~ProcessMonitor() {
    Stop();
}

int ProcessMonitor::CheckBackends() {
    int lost = 0;
    for (const auto& live : fleet_.LiveProcesses()) {
        auto info = table_.Query(live.pid);
        std::string reason;
        if (!info) {
            reason = "process " + std::to_string(live.pid) + " no longer exists";
        } else if (info->state == ProcessState::Zombie) {
            reason = "process " + std::to_string(live.pid) + " is a zombie";
        } else if (info->state == ProcessState::Stopped) {
            reason = "process " + std::to_string(live.pid) + " is stopped";
        } else if (info->state == ProcessState::Dead) {
            reason = "process " + std::to_string(live.pid) + " has exited";
        } else {
            continue;
        }
        if (!fleet_.ReportProcessLost(live.backend, live.pid, reason)) {
            LogDebug("monitor", live.backend + ": pid " + std::to_string(live.pid) +
                                    " replaced since the snapshot, ignoring");
            continue;
        }
        LogWarn("monitor", live.backend + ": " + reason);
        ++lost;
    }
    return lost;
}

bool ProcessMonitor::MatchesPattern(const std::string& cmdline) const {
    if (cmdline.empty()) {
        return false;
    }
    std::string lowered = ToLower(cmdline);
    return std::any_of(options_.orphan_patterns.begin(), options_.orphan_patterns.end(),
                       [&](const std::string& p) {
                           return !p.empty() && lowered.find(p) != std::string::npos;
                       });
}

bool ProcessMonitor::WaitForExit(int pid) {
    auto deadline = std::chrono::steady_clock::now() + options_.orphan_kill_timeout;
    while (true) {
        auto info = table_.Query(pid);
        if (!info || info->state == ProcessState::Zombie || info->state == ProcessState::Dead) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kExitPollInterval);
    }
}

OrphanScanResult ProcessMonitor::ScanOrphans() {
    OrphanScanResult result;

    auto listed = table_.List();
    if (listed.IsErr()) {
        LogError("monitor", "orphan scan failed: " + listed.Error().message);
        last_orphans_ = 0;
        return result;
    }

    std::set<int> owned;
    owned.insert(static_cast<int>(getpid()));
    for (const auto& live : fleet_.LiveProcesses()) {
        owned.insert(live.pid);
    }

    for (const auto& proc : listed.Value()) {
        if (owned.count(proc.pid) != 0 || owned.count(proc.ppid) != 0) {
            continue;
        }
        if (!MatchesPattern(proc.cmdline)) {
            continue;
        }
        bool orphaned = false;
        if (proc.ppid > 1) {
            orphaned = !table_.Exists(proc.ppid);
        } else if (proc.ppid == 1) {
            orphaned = options_.orphan_include_init_children;
        }
        if (!orphaned) {
            continue;
        }

        LogWarn("monitor", "orphaned backend process " + std::to_string(proc.pid) + ": " +
                               proc.cmdline);
        auto term = table_.Signal(proc.pid, SIGTERM);
        if (term.IsErr()) {
            if (term.Error().category == ErrorCategory::Unauthorized) {
                ++result.permission_errors;
            }
            LogError("monitor", "cannot terminate " + std::to_string(proc.pid) + ": " +
                                    term.Error().message);
            continue;
        }
        if (!WaitForExit(proc.pid)) {
            auto kill = table_.Signal(proc.pid, SIGKILL);
            if (kill.IsErr()) {
                if (kill.Error().category == ErrorCategory::Unauthorized) {
                    ++result.permission_errors;
                }
                LogError("monitor", "cannot kill " + std::to_string(proc.pid) + ": " +
                                        kill.Error().message);
                continue;
            }
        }
        ++result.cleaned;
    }

    if (result.cleaned > 0) {
        LogInfo("monitor", "cleaned up " + std::to_string(result.cleaned) +
                               " orphaned backend processes");
    }
    last_orphans_ = result.cleaned;
    permission_errors_ += result.permission_errors;
    return result;
}

void ProcessMonitor::RunOnce() {
    CheckBackends();
    if (options_.orphan_scan) {
        ScanOrphans();
    }
}

void ProcessMonitor::Start() {
    if (task_) {
        return;
    }
    task_ = std::make_unique<PeriodicTask>(
        "process-monitor",
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.interval),
        [this] { RunOnce(); });
    task_->Start();
}

void ProcessMonitor::Stop() {
    if (task_) {
        task_->Stop();
        task_.reset();
    }
}

} // namespace mcp_fleet
