#pragma once

#include <mcp_fleet/core/result.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcp_fleet {

enum class ProcessState {
    Running,
    Sleeping,
    Zombie,
    Stopped,
    Dead,
    Other,
};

struct ProcessInfo {
    int pid = 0;
    int ppid = 0;
    ProcessState state = ProcessState::Other;
    std::string cmdline;   // argv joined by single spaces
};

// ---------------------------------------------------------------------------
// IProcessTable: read access to the OS process table plus signalling.
// ProcfsProcessTable reads /proc; tests use MockProcessTable.
// ---------------------------------------------------------------------------
class IProcessTable {
public:
    virtual ~IProcessTable() = default;

    IProcessTable(const IProcessTable&) = delete;
    IProcessTable& operator=(const IProcessTable&) = delete;

    [[nodiscard]] virtual Result<std::vector<ProcessInfo>, Error> List() = 0;

    /// nullopt when the pid does not exist.
    [[nodiscard]] virtual std::optional<ProcessInfo> Query(int pid) = 0;

    [[nodiscard]] virtual bool Exists(int pid) = 0;

    /// Send a signal. Permission errors surface as Err.
    [[nodiscard]] virtual Result<void, Error> Signal(int pid, int signal) = 0;

protected:
    IProcessTable() = default;
};

class ProcfsProcessTable : public IProcessTable {
public:
    explicit ProcfsProcessTable(std::string proc_root = "/proc");

    [[nodiscard]] Result<std::vector<ProcessInfo>, Error> List() override;
    [[nodiscard]] std::optional<ProcessInfo> Query(int pid) override;
    [[nodiscard]] bool Exists(int pid) override;
    [[nodiscard]] Result<void, Error> Signal(int pid, int signal) override;

private:
    std::string proc_root_;
};

} // namespace mcp_fleet
