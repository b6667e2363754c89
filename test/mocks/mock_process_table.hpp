#pragma once

#include <mcp_fleet/process/process_table.hpp>

#include <csignal>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mcp_fleet {
namespace testing {

// ---------------------------------------------------------------------------
// MockProcessTable: an in-memory process table.
//
// Usage:
//   MockProcessTable table;
//   table.Add({4242, 999, ProcessState::Sleeping, "npx tavily-mcp"});
//   table.IgnoreTerm(4242);            // survives SIGTERM, dies on SIGKILL
//   table.Deny(4243);                  // every signal fails with Unauthorized
//   CHECK(table.Signals() == std::vector<std::pair<int,int>>{{4242, SIGTERM}, ...});
//
// SIGTERM and SIGKILL remove the process unless configured otherwise.
// ---------------------------------------------------------------------------
class MockProcessTable : public IProcessTable {
public:
    void Add(ProcessInfo info) { processes_[info.pid] = std::move(info); }
    void Remove(int pid) { processes_.erase(pid); }
    void SetState(int pid, ProcessState state) { processes_[pid].state = state; }
    void IgnoreTerm(int pid) { ignore_term_.insert(pid); }
    void Deny(int pid) { denied_.insert(pid); }
    void FailList(bool fail) { fail_list_ = fail; }

    Result<std::vector<ProcessInfo>, Error> List() override {
        if (fail_list_) {
            return Result<std::vector<ProcessInfo>, Error>::Err(
                Error::Make(ErrorCategory::Internal, "ListProcesses", "", "proc unavailable"));
        }
        std::vector<ProcessInfo> out;
        for (const auto& [pid, info] : processes_) {
            out.push_back(info);
        }
        return Result<std::vector<ProcessInfo>, Error>::Ok(std::move(out));
    }

    std::optional<ProcessInfo> Query(int pid) override {
        auto it = processes_.find(pid);
        if (it == processes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool Exists(int pid) override { return processes_.count(pid) != 0; }

    Result<void, Error> Signal(int pid, int signal) override {
        signals_.emplace_back(pid, signal);
        if (denied_.count(pid) != 0) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::Unauthorized, "Signal", "", "Operation not permitted"));
        }
        if (processes_.count(pid) == 0) {
            return Result<void, Error>::Err(
                Error::Make(ErrorCategory::Internal, "Signal", "", "No such process"));
        }
        if (signal == SIGKILL || (signal == SIGTERM && ignore_term_.count(pid) == 0)) {
            processes_.erase(pid);
        }
        return Result<void, Error>::Ok();
    }

    [[nodiscard]] const std::vector<std::pair<int, int>>& Signals() const { return signals_; }

private:
    std::map<int, ProcessInfo> processes_;
    std::set<int> ignore_term_;
    std::set<int> denied_;
    bool fail_list_ = false;
    std::vector<std::pair<int, int>> signals_;
};

} // namespace testing
} // namespace mcp_fleet
