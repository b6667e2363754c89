#include <mcp_fleet/process/process_table.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

#include <dirent.h>
#include <signal.h>

namespace mcp_fleet {

namespace {

ProcessState StateFromCode(char code) {
    switch (code) {
        case 'R': return ProcessState::Running;
        case 'S':
        case 'D':
        case 'I': return ProcessState::Sleeping;
        case 'Z': return ProcessState::Zombie;
        case 'T':
        case 't': return ProcessState::Stopped;
        case 'X':
        case 'x': return ProcessState::Dead;
        default:  return ProcessState::Other;
    }
}

bool IsAllDigits(const char* s) {
    if (*s == '\0') return false;
    for (; *s != '\0'; ++s) {
        if (*s < '0' || *s > '9') return false;
    }
    return true;
}

} // anonymous namespace

ProcfsProcessTable::ProcfsProcessTable(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::optional<ProcessInfo> ProcfsProcessTable::Query(int pid) {
    const std::string base = proc_root_ + "/" + std::to_string(pid);

    std::ifstream stat_file(base + "/stat");
    if (!stat_file) {
        return std::nullopt;
    }
    std::string stat;
    std::getline(stat_file, stat);

    // Format: pid (comm) state ppid ...; comm may contain spaces and ')'.
    auto close_paren = stat.rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 >= stat.size()) {
        return std::nullopt;
    }
    std::istringstream rest(stat.substr(close_paren + 2));
    char state_code = '?';
    int ppid = 0;
    rest >> state_code >> ppid;

    ProcessInfo info;
    info.pid = pid;
    info.ppid = ppid;
    info.state = StateFromCode(state_code);

    std::ifstream cmd_file(base + "/cmdline", std::ios::binary);
    if (cmd_file) {
        std::string raw((std::istreambuf_iterator<char>(cmd_file)),
                        std::istreambuf_iterator<char>());
        while (!raw.empty() && raw.back() == '\0') {
            raw.pop_back();
        }
        for (auto& c : raw) {
            if (c == '\0') c = ' ';
        }
        info.cmdline = std::move(raw);
    }
    return info;
}

Result<std::vector<ProcessInfo>, Error> ProcfsProcessTable::List() {
    DIR* dir = ::opendir(proc_root_.c_str());
    if (dir == nullptr) {
        return Result<std::vector<ProcessInfo>, Error>::Err(Error::Make(
            ErrorCategory::Internal, "ListProcesses", "",
            "cannot open " + proc_root_ + ": " + std::strerror(errno)));
    }
    std::vector<ProcessInfo> processes;
    while (auto* entry = ::readdir(dir)) {
        if (!IsAllDigits(entry->d_name)) {
            continue;
        }
        // Processes may exit between readdir and Query; skip those.
        if (auto info = Query(std::atoi(entry->d_name))) {
            processes.push_back(std::move(*info));
        }
    }
    ::closedir(dir);
    return Result<std::vector<ProcessInfo>, Error>::Ok(std::move(processes));
}

bool ProcfsProcessTable::Exists(int pid) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

Result<void, Error> ProcfsProcessTable::Signal(int pid, int signal) {
    if (::kill(pid, signal) == 0) {
        return Result<void, Error>::Ok();
    }
    const int err = errno;
    if (err == ESRCH) {
        // Already gone counts as delivered.
        return Result<void, Error>::Ok();
    }
    return Result<void, Error>::Err(Error::Make(
        err == EPERM ? ErrorCategory::Unauthorized : ErrorCategory::Internal,
        "SignalProcess", "",
        "kill(" + std::to_string(pid) + ", " + std::to_string(signal) + ") failed: " +
            std::strerror(err)));
}

} // namespace mcp_fleet
