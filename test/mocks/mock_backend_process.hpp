#pragma once

#include <mcp_fleet/process/i_backend_process.hpp>
#include <mcp_fleet/protocol/jsonrpc.hpp>
#include <mcp_fleet/registry/backend_registry.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {
namespace testing {

// ---------------------------------------------------------------------------
// MockBackend: scripted behavior of one stdio MCP server.
//
// The state outlives the IBackendProcess the registry owns, so a test can
// keep inspecting it after the backend was removed.
//
// Usage:
//   auto backend = std::make_shared<MockBackend>();
//   backend->SetTools({{{"name", "echo"}}});
//   backend->FailStarts(2);                  // next two Start() calls fail
//   backend->Silence("tools/call");          // never answer this method
//   backend->Reply("tools/call", {{"content", ...}});
//
// Requests are answered synchronously from Send(), through the output
// handler, the way a reader thread would hand over a reply line.
// "initialize" and "tools/list" have built-in answers; every other method
// gets a -32601 error unless scripted.
// ---------------------------------------------------------------------------
class MockBackend {
public:
    static constexpr int kFirstPid = 50000;

    void SetTools(nlohmann::json tools) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = std::move(tools);
    }

    /// Next `count` Start() calls fail; -1 fails forever.
    void FailStarts(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        start_failures_ = count;
    }

    /// Next `count` writes fail with SendFailure.
    void FailSends(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        send_failures_ = count;
    }

    void Silence(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex_);
        silent_.insert(method);
    }

    void Reply(const std::string& method, nlohmann::json result) {
        std::lock_guard<std::mutex> lock(mutex_);
        results_[method] = std::move(result);
        errors_.erase(method);
    }

    void ReplyError(const std::string& method, int code, std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_[method] = {code, std::move(message)};
        results_.erase(method);
    }

    /// The process dies on its own; the next Send() or Ensure() sees it.
    void SimulateExit() {
        std::lock_guard<std::mutex> lock(mutex_);
        alive_ = false;
    }

    /// Unsolicited output line, as if the server printed it.
    void Emit(const std::string& line) {
        LineHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = output_handler_;
        }
        if (handler) {
            handler(line);
        }
    }

    void EmitStderr(const std::string& line) {
        LineHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = error_handler_;
        }
        if (handler) {
            handler(line);
        }
    }

    [[nodiscard]] int StartAttempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return start_attempts_;
    }

    [[nodiscard]] int Starts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return start_count_;
    }

    [[nodiscard]] int Stops() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_count_;
    }

    [[nodiscard]] bool Alive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alive_;
    }

    [[nodiscard]] std::optional<int> CurrentPid() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!alive_) {
            return std::nullopt;
        }
        return pid_;
    }

    [[nodiscard]] std::vector<std::string> SentLines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    /// Methods of every request and notification written so far, in order.
    [[nodiscard]] std::vector<std::string> SentMethods() const {
        std::vector<std::string> methods;
        for (const auto& line : SentLines()) {
            auto decoded = protocol::Decode(line);
            if (decoded.IsOk()) {
                if (auto method = protocol::MethodOf(decoded.Value())) {
                    methods.push_back(*method);
                }
            }
        }
        return methods;
    }

    [[nodiscard]] size_t CountSent(const std::string& method) const {
        size_t count = 0;
        for (const auto& m : SentMethods()) {
            if (m == method) {
                ++count;
            }
        }
        return count;
    }

    // -- IBackendProcess behavior --------------------------------------------

    Result<void, Error> Start() {
        std::function<void()> started;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++start_attempts_;
            if (start_failures_ != 0) {
                if (start_failures_ > 0) {
                    --start_failures_;
                }
                return Result<void, Error>::Err(Error::Make(
                    ErrorCategory::ProcessStartFailure, "StartBackend", name_,
                    "process exited during startup", "exit status 1"));
            }
            alive_ = true;
            ++start_count_;
            pid_ = kFirstPid + start_count_;
            started = started_callback_;
        }
        if (started) {
            started();
        }
        return Result<void, Error>::Ok();
    }

    void Stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (alive_) {
            ++stop_count_;
        }
        alive_ = false;
    }

    Result<void, Error> Send(std::string_view line) {
        bool alive = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            alive = alive_;
        }
        if (!alive) {
            auto started = Start();
            if (started.IsErr()) {
                return started;
            }
        }

        std::optional<std::string> reply;
        LineHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (send_failures_ > 0) {
                --send_failures_;
                alive_ = false;
                return Result<void, Error>::Err(Error::Make(
                    ErrorCategory::SendFailure, "SendMessage", name_, "Broken pipe"));
            }
            sent_.emplace_back(line);
            reply = AnswerLocked(line);
            handler = output_handler_;
        }
        if (reply && handler) {
            handler(*reply);
        }
        return Result<void, Error>::Ok();
    }

    void SetName(std::string name) {
        std::lock_guard<std::mutex> lock(mutex_);
        name_ = std::move(name);
    }

    void SetOutputHandler(LineHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_handler_ = std::move(handler);
    }

    void SetErrorHandler(LineHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_handler_ = std::move(handler);
    }

    void SetStartedCallback(std::function<void()> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        started_callback_ = std::move(callback);
    }

    void Detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        output_handler_ = nullptr;
        error_handler_ = nullptr;
        started_callback_ = nullptr;
    }

private:
    std::optional<std::string> AnswerLocked(std::string_view line) {
        auto decoded = protocol::Decode(line);
        if (decoded.IsErr()) {
            return std::nullopt;
        }
        const auto* request = std::get_if<protocol::Request>(&decoded.Value());
        if (!request || silent_.count(request->method) != 0) {
            return std::nullopt;
        }

        const auto& method = request->method;
        auto error = errors_.find(method);
        if (error != errors_.end()) {
            return protocol::Encode(protocol::MakeErrorResponse(request->id, error->second.first,
                                                                error->second.second));
        }
        auto result = results_.find(method);
        if (result != results_.end()) {
            return protocol::Encode(protocol::MakeResponse(request->id, result->second));
        }
        if (method == "initialize") {
            return protocol::Encode(protocol::MakeResponse(
                request->id, {{"protocolVersion", "2024-11-05"},
                              {"capabilities", {{"tools", nlohmann::json::object()}}},
                              {"serverInfo", {{"name", "mock-" + name_}, {"version", "1.0"}}}}));
        }
        if (method == "tools/list") {
            return protocol::Encode(protocol::MakeResponse(request->id, {{"tools", tools_}}));
        }
        return protocol::Encode(protocol::MakeErrorResponse(
            request->id, protocol::kMethodNotFound, "Method not found"));
    }

    mutable std::mutex mutex_;
    std::string name_ = "mock";
    nlohmann::json tools_ = nlohmann::json::array();
    int start_failures_ = 0;
    int send_failures_ = 0;
    std::set<std::string> silent_;
    std::map<std::string, nlohmann::json> results_;
    std::map<std::string, std::pair<int, std::string>> errors_;

    bool alive_ = false;
    int pid_ = 0;
    int start_attempts_ = 0;
    int start_count_ = 0;
    int stop_count_ = 0;
    std::vector<std::string> sent_;

    LineHandler output_handler_;
    LineHandler error_handler_;
    std::function<void()> started_callback_;
};

// ---------------------------------------------------------------------------
// MockBackendProcess: the IBackendProcess handed to the registry. Forwards
// to a shared MockBackend and detaches from it when destroyed.
// ---------------------------------------------------------------------------
class MockBackendProcess : public IBackendProcess {
public:
    explicit MockBackendProcess(std::shared_ptr<MockBackend> backend)
        : backend_(std::move(backend)) {}

    ~MockBackendProcess() override { backend_->Detach(); }

    Result<void, Error> Start() override { return backend_->Start(); }
    void Stop() override { backend_->Stop(); }
    Result<void, Error> Send(std::string_view line) override { return backend_->Send(line); }
    bool IsAlive() override { return backend_->Alive(); }
    std::optional<int> Pid() const override { return backend_->CurrentPid(); }
    int StartCount() const override { return backend_->Starts(); }

    void SetOutputHandler(LineHandler handler) override {
        backend_->SetOutputHandler(std::move(handler));
    }
    void SetErrorHandler(LineHandler handler) override {
        backend_->SetErrorHandler(std::move(handler));
    }
    void SetStartedCallback(std::function<void()> callback) override {
        backend_->SetStartedCallback(std::move(callback));
    }

private:
    std::shared_ptr<MockBackend> backend_;
};

// ---------------------------------------------------------------------------
// MockFleet: ProcessFactory producing MockBackendProcess instances. A
// backend scripted with Script() before it is created keeps that script;
// any other name gets a default MockBackend.
// ---------------------------------------------------------------------------
class MockFleet {
public:
    std::shared_ptr<MockBackend> Script(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& backend = backends_[name];
        if (!backend) {
            backend = std::make_shared<MockBackend>();
            backend->SetName(name);
        }
        return backend;
    }

    [[nodiscard]] std::shared_ptr<MockBackend> Get(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = backends_.find(name);
        return it == backends_.end() ? nullptr : it->second;
    }

    [[nodiscard]] int Created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }

    ProcessFactory Factory() {
        return [this](const std::string& name, const BackendConfig&) {
            auto backend = Script(name);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++created_;
            }
            return std::make_unique<MockBackendProcess>(std::move(backend));
        };
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<MockBackend>> backends_;
    int created_ = 0;
};

} // namespace testing
} // namespace mcp_fleet
