#include <mcp_fleet/process/backend_process.hpp>

#include <mcp_fleet/core/log.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <map>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_fleet {

namespace {

constexpr size_t kReadChunk = 4096;
constexpr size_t kMaxLineBytes = 16 * 1024 * 1024;
constexpr size_t kMaxDiagnosticBytes = 64 * 1024;
constexpr auto kReaderPoll = std::chrono::milliseconds(100);
constexpr auto kExitPoll = std::chrono::milliseconds(20);

Error MakeProcessError(ErrorCategory category, const std::string& operation,
                       const std::string& backend, const std::string& message,
                       std::optional<std::string> detail = std::nullopt) {
    return Error::Make(category, operation, backend, message, std::move(detail));
}

// Backends that exit make later writes fail with EPIPE; without this the
// whole gateway would receive SIGPIPE.
void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> PointerArray(std::vector<std::string>& strings) {
    std::vector<char*> ptrs;
    ptrs.reserve(strings.size() + 1);
    for (auto& s : strings) {
        ptrs.push_back(s.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

// Drain whatever a dead child left in a pipe, without blocking.
std::string DrainPipe(int fd) {
    std::string out;
    if (fd < 0) {
        return out;
    }
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    char buf[kReadChunk];
    while (out.size() < kMaxDiagnosticBytes) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    fcntl(fd, F_SETFL, flags);
    return out;
}

std::string DescribeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "stopped";
}

void ReaderLoop(int fd, LineHandler handler, const std::atomic<bool>& running,
                std::string backend, const char* stream) {
    std::string buffer;
    char chunk[kReadChunk];

    auto emit = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || !handler) {
            return;
        }
        handler(line);
    };

    while (running.load()) {
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(kReaderPoll.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            LogWarn("process", backend + ": poll on " + stream + " failed: " +
                                   std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) {
            break;
        }
        buffer.append(chunk, static_cast<size_t>(n));

        size_t start = 0;
        for (auto nl = buffer.find('\n', start); nl != std::string::npos;
             nl = buffer.find('\n', start)) {
            emit(buffer.substr(start, nl - start));
            start = nl + 1;
        }
        buffer.erase(0, start);

        if (buffer.size() > kMaxLineBytes) {
            LogWarn("process", backend + ": dropping " + std::to_string(buffer.size()) +
                                   " bytes on " + stream + " without a newline");
            buffer.clear();
        }
    }
    if (!buffer.empty()) {
        emit(std::move(buffer));
    }
    LogDebug("process", backend + ": " + stream + " reader finished");
}

} // anonymous namespace

BackendProcess::BackendProcess(std::string name, BackendConfig config, BackendOptions options)
    : name_(std::move(name)), config_(std::move(config)), options_(options) {}

BackendProcess::~BackendProcess() {
    Stop();
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------
Result<void, Error> BackendProcess::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    return StartLocked();
}

Result<void, Error> BackendProcess::StartLocked() {
    if (IsAliveLocked()) {
        return Result<void, Error>::Ok();
    }
    IgnoreSigpipeOnce();
    ReleaseLocked();

    if (config_.command.empty()) {
        return Result<void, Error>::Err(MakeProcessError(
            ErrorCategory::ProcessStartFailure, "Start", name_, "empty command"));
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return Result<void, Error>::Err(MakeProcessError(
            ErrorCategory::ProcessStartFailure, "Start", name_,
            "failed to create pipes: " + reason));
    }

    // Everything the child needs is allocated before fork().
    std::vector<std::string> argv_storage;
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());
    auto argv = PointerArray(argv_storage);
    auto env_storage = BuildEnvironment(config_.env);
    auto envp = PointerArray(env_storage);
    const char* cwd = config_.cwd ? config_.cwd->c_str() : nullptr;

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return Result<void, Error>::Err(MakeProcessError(
            ErrorCategory::ProcessStartFailure, "Start", name_, "fork failed: " + reason));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            const char msg[] = "mcp-fleet: cannot change to working directory\n";
            (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            ::_exit(127);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        const char* reason = std::strerror(errno);
        const char prefix[] = "mcp-fleet: exec failed: ";
        (void)!::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
        (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
        (void)!::write(STDERR_FILENO, "\n", 1);
        ::_exit(127);
    }

    // Also set from the parent so Stop() cannot race the child's setpgid.
    ::setpgid(pid, pid);
    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    exit_status_.reset();

    // Grace window: a backend that dies immediately is a failed start.
    const auto deadline = std::chrono::steady_clock::now() + options_.startup_grace;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t waited = ::waitpid(pid_, &status, WNOHANG);
        if (waited == pid_) {
            exit_status_ = status;
            pid_ = -1;
            std::string detail;
            auto out = DrainPipe(stdout_fd_);
            auto err = DrainPipe(stderr_fd_);
            if (!err.empty()) detail += "stderr: " + err;
            if (!out.empty()) detail += (detail.empty() ? "" : "\n") + std::string("stdout: ") + out;
            ReleaseLocked();
            LogWarn("process", name_ + " " + DescribeWaitStatus(status) +
                                   " during startup");
            return Result<void, Error>::Err(MakeProcessError(
                ErrorCategory::ProcessStartFailure, "Start", name_,
                "process " + DescribeWaitStatus(status) + " during startup",
                detail.empty() ? std::nullopt : std::optional<std::string>(detail)));
        }
        std::this_thread::sleep_for(kExitPoll);
    }

    readers_running_ = true;
    stdout_reader_ = std::thread(ReaderLoop, stdout_fd_, output_handler_,
                                 std::cref(readers_running_), name_, "stdout");
    stderr_reader_ = std::thread(ReaderLoop, stderr_fd_, error_handler_,
                                 std::cref(readers_running_), name_, "stderr");

    ++start_count_;
    LogInfo("process", "started " + name_ + " (pid " + std::to_string(pid_) + ")");
    if (started_callback_) {
        started_callback_();
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Stop
// ---------------------------------------------------------------------------
void BackendProcess::Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    StopLocked();
}

void BackendProcess::StopLocked() {
    if (pid_ > 0) {
        // Closing stdin first lets well-behaved servers exit on EOF.
        CloseFd(stdin_fd_);
        if (::kill(-pid_, SIGTERM) != 0) {
            ::kill(pid_, SIGTERM);
        }

        const auto deadline = std::chrono::steady_clock::now() + options_.stop_timeout;
        int status = 0;
        pid_t waited = 0;
        while ((waited = ::waitpid(pid_, &status, WNOHANG)) == 0 &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kExitPoll);
        }
        if (waited == 0) {
            LogWarn("process", name_ + " did not exit after SIGTERM, sending SIGKILL");
            if (::kill(-pid_, SIGKILL) != 0) {
                ::kill(pid_, SIGKILL);
            }
            waited = ::waitpid(pid_, &status, 0);
        }
        if (waited == pid_) {
            exit_status_ = status;
        }
        LogInfo("process", "stopped " + name_);
        pid_ = -1;
    }
    ReleaseLocked();
}

// Join readers and close every fd of a process that is no longer running.
void BackendProcess::ReleaseLocked() {
    readers_running_ = false;
    if (stdout_reader_.joinable()) stdout_reader_.join();
    if (stderr_reader_.joinable()) stderr_reader_.join();
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

// ---------------------------------------------------------------------------
// Send
// ---------------------------------------------------------------------------
Result<void, Error> BackendProcess::Send(std::string_view line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsAliveLocked()) {
        LogInfo("process", name_ + " is not running, starting it before send");
        auto started = StartLocked();
        if (started.IsErr()) {
            return started;
        }
    }
    return WriteLocked(line);
}

Result<void, Error> BackendProcess::WriteLocked(std::string_view line) {
    std::string frame(line);
    frame.push_back('\n');

    size_t written = 0;
    while (written < frame.size()) {
        ssize_t n = ::write(stdin_fd_, frame.data() + written, frame.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void, Error>::Err(MakeProcessError(
                ErrorCategory::SendFailure, "Send", name_,
                std::string("write to backend stdin failed: ") + std::strerror(errno)));
        }
        written += static_cast<size_t>(n);
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------
bool BackendProcess::IsAlive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return IsAliveLocked();
}

bool BackendProcess::IsAliveLocked() {
    if (pid_ <= 0) {
        return false;
    }
    int status = 0;
    pid_t waited = ::waitpid(pid_, &status, WNOHANG);
    if (waited == 0) {
        return true;
    }
    if (waited == pid_) {
        exit_status_ = status;
        LogWarn("process", name_ + " " + DescribeWaitStatus(status));
    }
    pid_ = -1;
    return false;
}

std::optional<int> BackendProcess::Pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) {
        return std::nullopt;
    }
    return static_cast<int>(pid_);
}

int BackendProcess::StartCount() const {
    return start_count_.load();
}

std::optional<int> BackendProcess::LastExitStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_status_;
}

void BackendProcess::SetOutputHandler(LineHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_handler_ = std::move(handler);
}

void BackendProcess::SetErrorHandler(LineHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_handler_ = std::move(handler);
}

void BackendProcess::SetStartedCallback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    started_callback_ = std::move(callback);
}

} // namespace mcp_fleet
