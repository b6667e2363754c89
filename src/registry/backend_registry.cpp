#include <mcp_fleet/registry/backend_registry.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>
#include <mcp_fleet/core/version.hpp>
#include <mcp_fleet/process/backend_process.hpp>
#include <mcp_fleet/runtime/message_distributor.hpp>

#include <future>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// Entry
// ---------------------------------------------------------------------------
struct BackendRegistry::Entry {
    Entry(std::string entry_name, BackendConfig entry_config, bool is_popular,
          ResponseRouting routing, BreakerOptions breaker_options, ClockFn clock)
        : name(std::move(entry_name)),
          config(std::move(entry_config)),
          popular(is_popular),
          distributor(std::make_shared<MessageDistributor>(name, routing)),
          health(name),
          breaker(breaker_options, std::move(clock)) {}

    const std::string name;
    const BackendConfig config;
    const bool popular;
    std::shared_ptr<MessageDistributor> distributor;
    ServerHealth health;
    CircuitBreaker breaker;

    std::atomic<SteadyClock::rep> last_used{0};
    std::atomic<bool> handshake_done{false};
    std::atomic<bool> removed{false};
    std::atomic<int> tracked_pid{0};

    // Serializes start, stop, restart and writes. Never held while a caller
    // waits for a reply, except during the handshake and catalog refresh.
    std::mutex lifecycle_mutex;

    // Declared last: destroyed first, joining its reader threads while the
    // distributor is still alive.
    std::unique_ptr<IBackendProcess> process;
};

namespace {

Error NotFound(const char* operation, const std::string& name) {
    return Error::Make(ErrorCategory::BackendNotFound, operation, name,
                       "backend '" + name + "' is not registered");
}

Error CircuitOpenError(const char* operation, const std::string& name,
                       std::optional<std::string> detail = std::nullopt) {
    return Error::Make(ErrorCategory::CircuitOpen, operation, name,
                       "circuit breaker is open, not restarting", std::move(detail));
}

nlohmann::json InitializeParams() {
    return {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "mcp-fleet"}, {"version", kVersion}}},
    };
}

} // anonymous namespace

ProcessFactory PosixProcessFactory(BackendOptions options) {
    return [options](const std::string& name, const BackendConfig& config) {
        return std::make_unique<BackendProcess>(name, config, options);
    };
}

RegistryOptions RegistryOptions::FromConfig(const AppConfig& config) {
    RegistryOptions options;
    options.max_dynamic_backends = config.max_dynamic_backends;
    options.message_timeout = config.message_timeout;
    options.routing = config.response_routing;
    options.breaker = config.breaker;
    return options;
}

nlohmann::json BackendStatus::ToJson() const {
    auto last_used_epoch = std::chrono::duration<double>(last_used.time_since_epoch()).count();
    nlohmann::json env_keys = nlohmann::json::array();
    for (const auto& [key, value] : config.env) {
        env_keys.push_back(key);
    }
    return {
        {"alive", alive},
        {"lastUsed", last_used_epoch},
        {"idle_seconds", idle.count()},
        {"popular", popular},
        {"state", HealthStateName(health.state)},
        {"initialized", initialized},
        {"pid", pid ? nlohmann::json(*pid) : nlohmann::json(nullptr)},
        {"start_count", start_count},
        {"breaker", BreakerStateName(breaker)},
        {"sessions", sessions},
        {"pending_requests", pending_requests},
        {"tools", tools},
        {"command", config.command},
        {"args", config.args},
        {"env_keys", env_keys},
    };
}

// ---------------------------------------------------------------------------
// BackendRegistry
// ---------------------------------------------------------------------------
BackendRegistry::BackendRegistry(RegistryOptions options, ToolCatalog& catalog,
                                 ProcessFactory factory, ClockFn clock)
    : options_(options),
      catalog_(catalog),
      factory_(std::move(factory)),
      clock_(std::move(clock)) {}

BackendRegistry::~BackendRegistry() {
    Shutdown();
}

std::shared_ptr<BackendRegistry::Entry> BackendRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : it->second;
}

Result<std::shared_ptr<BackendRegistry::Entry>, Error> BackendRegistry::FindOrError(
    const std::string& name, const char* operation) const {
    auto entry = Find(name);
    if (!entry) {
        return Result<std::shared_ptr<Entry>, Error>::Err(NotFound(operation, name));
    }
    return Result<std::shared_ptr<Entry>, Error>::Ok(std::move(entry));
}

Result<std::shared_ptr<BackendRegistry::Entry>, Error> BackendRegistry::Insert(
    const std::string& name, const BackendConfig& config, bool popular) {
    using R = Result<std::shared_ptr<Entry>, Error>;
    const char* operation = popular ? "RegisterPopular" : "AddBackend";

    auto valid = BackendName::Create(name);
    if (valid.IsErr()) {
        return R::Err(Error::Make(ErrorCategory::InvalidRequest, operation, name,
                                  valid.Error()));
    }
    if (config.command.empty()) {
        return R::Err(Error::Make(ErrorCategory::InvalidRequest, operation, name,
                                  "backend command is empty"));
    }
    if (!config.enabled) {
        return R::Err(Error::Make(ErrorCategory::InvalidRequest, operation, name,
                                  "backend is disabled"));
    }

    auto entry = std::make_shared<Entry>(name, config, popular, options_.routing,
                                         options_.breaker, clock_);
    entry->process = factory_(name, config);
    if (!entry->process) {
        return R::Err(Error::Make(ErrorCategory::Internal, operation, name,
                                  "process factory returned no process"));
    }
    auto distributor = entry->distributor;
    Entry* raw = entry.get();
    entry->process->SetOutputHandler(
        [distributor](const std::string& line) { distributor->OnOutputLine(line); });
    entry->process->SetErrorHandler(
        [distributor](const std::string& line) { distributor->OnErrorLine(line); });
    entry->process->SetStartedCallback([raw] { raw->handshake_done = false; });
    entry->last_used = clock_().time_since_epoch().count();

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(name) != 0) {
        return R::Err(Error::Make(ErrorCategory::InvalidRequest, operation, name,
                                  "backend '" + name + "' is already registered"));
    }
    if (!popular) {
        size_t dynamic = 0;
        for (const auto& [existing, e] : entries_) {
            if (!e->popular) {
                ++dynamic;
            }
        }
        if (dynamic >= options_.max_dynamic_backends) {
            return R::Err(Error::Make(
                ErrorCategory::InvalidRequest, operation, name,
                "maximum of " + std::to_string(options_.max_dynamic_backends) +
                    " dynamic backends reached"));
        }
    }
    entries_[name] = entry;
    return R::Ok(std::move(entry));
}

Result<void, Error> BackendRegistry::RegisterPopular(const std::string& name,
                                                     const BackendConfig& config) {
    auto inserted = Insert(name, config, true);
    if (inserted.IsErr()) {
        return Result<void, Error>::Err(inserted.Error());
    }
    LogDebug("registry", "registered popular backend " + name);
    return Result<void, Error>::Ok();
}

size_t BackendRegistry::StartPopular() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : entries_) {
            if (entry->popular) {
                names.push_back(name);
            }
        }
    }
    size_t running = 0;
    for (const auto& name : names) {
        auto ensured = Ensure(name);
        if (ensured.IsErr()) {
            LogError("registry", "popular backend " + name + " failed to start: " +
                                     ensured.Error().ToString());
            continue;
        }
        ++running;
    }
    LogInfo("registry", std::to_string(running) + "/" + std::to_string(names.size()) +
                            " popular backends running");
    return running;
}

Result<void, Error> BackendRegistry::Ensure(const std::string& name,
                                            const std::optional<BackendConfig>& config) {
    auto entry = Find(name);
    if (!entry) {
        if (config) {
            return Add(name, *config);
        }
        return Result<void, Error>::Err(NotFound("EnsureBackend", name));
    }
    if (config && *config != entry->config) {
        LogWarn("registry", name + " is already registered with a different configuration, "
                                   "keeping the existing one");
    }
    std::lock_guard<std::mutex> lock(entry->lifecycle_mutex);
    return EnsureLocked(*entry);
}

Result<void, Error> BackendRegistry::Add(const std::string& name, const BackendConfig& config) {
    if (auto existing = Find(name)) {
        if (existing->popular || existing->config != config) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::InvalidRequest, "AddBackend", name,
                "backend '" + name + "' is already registered"));
        }
        std::lock_guard<std::mutex> lock(existing->lifecycle_mutex);
        return EnsureLocked(*existing);
    }

    auto inserted = Insert(name, config, false);
    if (inserted.IsErr()) {
        return Result<void, Error>::Err(inserted.Error());
    }
    auto entry = inserted.Value();
    LogInfo("registry", "added dynamic backend " + name + " (" + config.command + ")");

    Result<void, Error> started = Result<void, Error>::Ok();
    {
        std::lock_guard<std::mutex> lock(entry->lifecycle_mutex);
        started = EnsureLocked(*entry);
    }
    if (started.IsErr()) {
        LogWarn("registry", "dropping " + name + ", it did not start");
        auto removed = Remove(name);
        if (removed.IsErr()) {
            LogDebug("registry", removed.Error().ToString());
        }
    }
    return started;
}

Result<void, Error> BackendRegistry::Remove(const std::string& name) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            return Result<void, Error>::Err(NotFound("RemoveBackend", name));
        }
        if (it->second->popular) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::InvalidRequest, "RemoveBackend", name,
                "popular backends cannot be removed"));
        }
        entry = it->second;
        entries_.erase(it);
    }
    entry->removed = true;
    {
        std::lock_guard<std::mutex> lock(entry->lifecycle_mutex);
        StopLocked(*entry);
    }
    entry->health.MarkStopped();
    catalog_.Invalidate(name);
    LogInfo("registry", "removed backend " + name);
    return Result<void, Error>::Ok();
}

Result<void, Error> BackendRegistry::Restart(const std::string& name) {
    auto found = FindOrError(name, "RestartBackend");
    if (found.IsErr()) {
        return Result<void, Error>::Err(found.Error());
    }
    auto& entry = *found.Value();
    std::lock_guard<std::mutex> lock(entry.lifecycle_mutex);
    if (entry.removed) {
        return Result<void, Error>::Err(NotFound("RestartBackend", name));
    }
    LogInfo("registry", "restarting " + name);
    StopLocked(entry);
    auto restarted = RestartLocked(entry);
    if (restarted.IsErr()) {
        entry.health.RecordFailure(restarted.Error().message);
        entry.breaker.RecordFailure();
        return restarted;
    }
    entry.breaker.RecordSuccess();
    Touch(entry);
    return restarted;
}

Result<void, Error> BackendRegistry::EnsureLocked(Entry& entry) {
    if (entry.removed) {
        return Result<void, Error>::Err(NotFound("EnsureBackend", entry.name));
    }
    if (entry.handshake_done && entry.process->IsAlive()) {
        Touch(entry);
        return Result<void, Error>::Ok();
    }
    if (!entry.breaker.CanExecute()) {
        return Result<void, Error>::Err(CircuitOpenError("EnsureBackend", entry.name));
    }
    auto restarted = RestartLocked(entry);
    if (restarted.IsErr()) {
        entry.health.RecordFailure(restarted.Error().message);
        entry.breaker.RecordFailure();
        return restarted;
    }
    entry.breaker.RecordSuccess();
    Touch(entry);
    return restarted;
}

Result<void, Error> BackendRegistry::RestartLocked(Entry& entry) {
    if (!entry.process->IsAlive()) {
        auto started = entry.process->Start();
        if (started.IsErr()) {
            return started;
        }
    }
    entry.tracked_pid = entry.process->Pid().value_or(0);
    entry.health.SetPid(entry.process->Pid());

    auto handshake = HandshakeLocked(entry);
    if (handshake.IsErr()) {
        const auto& cause = handshake.Error();
        StopLocked(entry);
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::ProcessStartFailure, "StartBackend", entry.name,
            "backend did not complete the MCP handshake", cause.ToString()));
    }
    RefreshCatalogLocked(entry);
    return Result<void, Error>::Ok();
}

Result<void, Error> BackendRegistry::HandshakeLocked(Entry& entry) {
    auto result = RoundTripLocked(entry, "initialize", InitializeParams());
    if (result.IsErr()) {
        return Result<void, Error>::Err(result.Error());
    }
    auto initialized = protocol::MakeNotification("notifications/initialized");
    auto sent = entry.process->Send(protocol::Encode(initialized));
    if (sent.IsErr()) {
        return sent;
    }
    entry.handshake_done = true;

    std::string server = "unknown server";
    const auto& body = result.Value();
    if (body.is_object()) {
        auto info = body.find("serverInfo");
        if (info != body.end() && info->is_object() && info->contains("name") &&
            (*info)["name"].is_string()) {
            server = (*info)["name"].get<std::string>();
        }
    }
    LogInfo("registry", entry.name + " initialized (" + server + ", pid " +
                            std::to_string(entry.tracked_pid.load()) + ")");
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> BackendRegistry::RoundTripLocked(Entry& entry,
                                                              const std::string& method,
                                                              const nlohmann::json& params) {
    using R = Result<nlohmann::json, Error>;
    nlohmann::json id = NextRequestId();
    auto key = protocol::IdKey(id);
    auto expected = entry.distributor->ExpectReply(key);
    if (expected.IsErr()) {
        return R::Err(expected.Error());
    }
    auto future = std::move(expected).Value();

    auto sent = entry.process->Send(protocol::Encode(protocol::MakeRequest(id, method, params)));
    if (sent.IsErr()) {
        entry.distributor->CancelReply(key);
        return R::Err(sent.Error());
    }

    if (future.wait_for(options_.message_timeout) != std::future_status::ready &&
        entry.distributor->CancelReply(key)) {
        return R::Err(Error::Make(ErrorCategory::ResponseTimeout, method, entry.name,
                                  "no reply within " +
                                      std::to_string(options_.message_timeout.count()) + " ms"));
    }
    auto reply = future.get();
    if (const auto* error = std::get_if<protocol::ErrorResponse>(&reply)) {
        return R::Err(Error::Make(ErrorCategory::BackendError, method, entry.name,
                                  error->message, "code " + std::to_string(error->code)));
    }
    return R::Ok(std::get<protocol::Response>(reply).result);
}

void BackendRegistry::RefreshCatalogLocked(Entry& entry) {
    auto refreshed = catalog_.Refresh(
        entry.name, [this, &entry](const std::string& method, const nlohmann::json& params) {
            return RoundTripLocked(entry, method, params);
        });
    if (refreshed.IsErr()) {
        LogWarn("registry", entry.name + ": catalog refresh failed: " +
                                refreshed.Error().message);
    }
}

void BackendRegistry::StopLocked(Entry& entry) {
    entry.process->Stop();
    entry.handshake_done = false;
    entry.tracked_pid = 0;
    entry.health.SetPid(std::nullopt);
}

Result<void, Error> BackendRegistry::SendWithRecovery(Entry& entry, const std::string& line) {
    std::lock_guard<std::mutex> lock(entry.lifecycle_mutex);
    if (entry.removed) {
        return Result<void, Error>::Err(NotFound("SendMessage", entry.name));
    }

    auto record_failure = [&entry](const Error& error) {
        entry.health.RecordFailure(error.message);
        entry.breaker.RecordFailure();
    };

    if (!entry.handshake_done || !entry.process->IsAlive()) {
        if (!entry.breaker.CanExecute()) {
            return Result<void, Error>::Err(CircuitOpenError("SendMessage", entry.name));
        }
        LogInfo("registry", entry.name + " is not running, restarting it");
        auto restarted = RestartLocked(entry);
        if (restarted.IsErr()) {
            record_failure(restarted.Error());
            return restarted;
        }
    }

    auto written = entry.process->Send(line);
    if (written.IsErr()) {
        record_failure(written.Error());
        if (!entry.breaker.CanExecute()) {
            return Result<void, Error>::Err(
                CircuitOpenError("SendMessage", entry.name, written.Error().message));
        }
        LogWarn("registry", entry.name + ": send failed (" + written.Error().message +
                                "), restarting once");
        StopLocked(entry);
        auto restarted = RestartLocked(entry);
        if (restarted.IsErr()) {
            record_failure(restarted.Error());
            return restarted;
        }
        written = entry.process->Send(line);
        if (written.IsErr()) {
            record_failure(written.Error());
            return written;
        }
    }

    // Send() restarts a process that died right before the write; that
    // incarnation has not seen the handshake yet.
    if (!entry.handshake_done) {
        auto handshake = HandshakeLocked(entry);
        if (handshake.IsErr()) {
            LogWarn("registry", entry.name + ": late handshake failed: " +
                                    handshake.Error().message);
        } else {
            RefreshCatalogLocked(entry);
        }
    }

    entry.health.RecordSuccess();
    entry.breaker.RecordSuccess();
    Touch(entry);
    return Result<void, Error>::Ok();
}

Result<void, Error> BackendRegistry::Send(const std::string& name,
                                          const protocol::Message& message) {
    auto found = FindOrError(name, "SendMessage");
    if (found.IsErr()) {
        return Result<void, Error>::Err(found.Error());
    }
    return SendWithRecovery(*found.Value(), protocol::Encode(message));
}

Result<protocol::Message, Error> BackendRegistry::Exchange(const std::string& name,
                                                           const protocol::Request& request,
                                                           std::chrono::milliseconds timeout) {
    using R = Result<protocol::Message, Error>;
    auto found = FindOrError(name, request.method.c_str());
    if (found.IsErr()) {
        return R::Err(found.Error());
    }
    auto entry = found.Value();
    Touch(*entry);

    auto key = protocol::IdKey(request.id);
    auto expected = entry->distributor->ExpectReply(key);
    if (expected.IsErr()) {
        return R::Err(expected.Error());
    }
    auto future = std::move(expected).Value();

    auto sent = SendWithRecovery(*entry, protocol::Encode(protocol::Message(request)));
    if (sent.IsErr()) {
        entry->distributor->CancelReply(key);
        return R::Err(sent.Error());
    }

    if (future.wait_for(timeout) != std::future_status::ready &&
        entry->distributor->CancelReply(key)) {
        LogWarn("registry", name + ": no reply to " + request.method + " (id " + key +
                                ") within " + std::to_string(timeout.count()) + " ms");
        return R::Err(Error::Make(ErrorCategory::ResponseTimeout, request.method, name,
                                  "no reply within " + std::to_string(timeout.count()) + " ms"));
    }
    Touch(*entry);
    return R::Ok(future.get());
}

Result<protocol::Message, Error> BackendRegistry::Request(const std::string& name,
                                                          const std::string& method,
                                                          const nlohmann::json& params,
                                                          std::chrono::milliseconds timeout) {
    protocol::Request request{NextRequestId(), method, params};
    return Exchange(name, request, timeout);
}

Result<nlohmann::json, Error> BackendRegistry::Call(const std::string& name,
                                                   const std::string& method,
                                                   const nlohmann::json& params,
                                                   std::chrono::milliseconds timeout) {
    using R = Result<nlohmann::json, Error>;
    auto reply = Request(name, method, params, timeout);
    if (reply.IsErr()) {
        return R::Err(reply.Error());
    }
    const auto& message = reply.Value();
    if (const auto* error = std::get_if<protocol::ErrorResponse>(&message)) {
        std::optional<std::string> detail;
        if (!error->data.is_null()) {
            detail = error->data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        return R::Err(Error::Make(ErrorCategory::BackendError, method, name,
                                  error->message + " (code " + std::to_string(error->code) + ")",
                                  detail));
    }
    return R::Ok(std::get<protocol::Response>(message).result);
}

std::vector<std::string> BackendRegistry::CleanupIdle(std::chrono::seconds ttl) {
    const auto now = clock_();
    std::vector<std::string> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : entries_) {
            if (entry->popular) {
                continue;
            }
            SteadyClock::time_point last{SteadyClock::duration(entry->last_used.load())};
            if (now - last > ttl) {
                idle.push_back(name);
            }
        }
    }
    std::vector<std::string> removed;
    for (const auto& name : idle) {
        LogInfo("registry", "reclaiming idle backend " + name);
        if (Remove(name).IsOk()) {
            removed.push_back(name);
        }
    }
    return removed;
}

void BackendRegistry::Shutdown() {
    std::vector<std::shared_ptr<Entry>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : entries_) {
            all.push_back(entry);
        }
    }
    for (const auto& entry : all) {
        std::lock_guard<std::mutex> lock(entry->lifecycle_mutex);
        if (entry->process->IsAlive()) {
            LogInfo("registry", "stopping " + entry->name);
        }
        StopLocked(*entry);
    }
}

bool BackendRegistry::Contains(const std::string& name) const {
    return Find(name) != nullptr;
}

bool BackendRegistry::IsPopular(const std::string& name) const {
    auto entry = Find(name);
    return entry && entry->popular;
}

size_t BackendRegistry::DynamicCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [name, entry] : entries_) {
        if (!entry->popular) {
            ++count;
        }
    }
    return count;
}

BackendStatus BackendRegistry::StatusOf(const Entry& entry) const {
    const auto now = clock_();
    SteadyClock::time_point last{SteadyClock::duration(entry.last_used.load())};
    auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - last);

    BackendStatus status;
    status.name = entry.name;
    status.popular = entry.popular;
    status.alive = entry.process->IsAlive();
    status.initialized = entry.handshake_done;
    status.pid = entry.process->Pid();
    status.start_count = entry.process->StartCount();
    status.last_used = std::chrono::system_clock::now() -
                       std::chrono::duration_cast<std::chrono::system_clock::duration>(now - last);
    status.idle = idle.count() < 0 ? std::chrono::seconds(0) : idle;
    status.health = entry.health.Snapshot();
    status.breaker = entry.breaker.State();
    status.sessions = entry.distributor->SubscriberCount();
    status.pending_requests = entry.distributor->PendingCount();
    status.tools = catalog_.ToolsFor(entry.name).size();
    status.config = entry.config;
    return status;
}

std::vector<BackendStatus> BackendRegistry::List() const {
    std::vector<std::shared_ptr<Entry>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : entries_) {
            all.push_back(entry);
        }
    }
    std::vector<BackendStatus> out;
    out.reserve(all.size());
    for (const auto& entry : all) {
        out.push_back(StatusOf(*entry));
    }
    return out;
}

Result<BackendStatus, Error> BackendRegistry::Describe(const std::string& name) const {
    auto found = FindOrError(name, "DescribeBackend");
    if (found.IsErr()) {
        return Result<BackendStatus, Error>::Err(found.Error());
    }
    return Result<BackendStatus, Error>::Ok(StatusOf(*found.Value()));
}

void BackendRegistry::Touch(Entry& entry) {
    entry.last_used = clock_().time_since_epoch().count();
}

std::string BackendRegistry::NextRequestId() {
    return "gw-" + std::to_string(next_id_++);
}

Result<void, Error> BackendRegistry::Subscribe(const std::string& backend,
                                               const std::string& session_id,
                                               std::shared_ptr<SessionQueue> queue) {
    auto found = FindOrError(backend, "OpenSession");
    if (found.IsErr()) {
        return Result<void, Error>::Err(found.Error());
    }
    found.Value()->distributor->Subscribe(session_id, std::move(queue));
    return Result<void, Error>::Ok();
}

void BackendRegistry::Unsubscribe(const std::string& backend, const std::string& session_id) {
    if (auto entry = Find(backend)) {
        entry->distributor->Unsubscribe(session_id);
    }
}

void BackendRegistry::ClaimReply(const std::string& backend, const std::string& id_key,
                                 const std::string& session_id) {
    if (auto entry = Find(backend)) {
        entry->distributor->ClaimReply(id_key, session_id);
    }
}

std::vector<MonitoredProcess> BackendRegistry::LiveProcesses() {
    std::vector<MonitoredProcess> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, entry] : entries_) {
        int pid = entry->tracked_pid.load();
        if (entry->handshake_done && pid > 0) {
            out.push_back(MonitoredProcess{name, pid});
        }
    }
    return out;
}

bool BackendRegistry::ReportProcessLost(const std::string& backend, int pid,
                                        const std::string& reason) {
    auto entry = Find(backend);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->lifecycle_mutex);
    // A send or restart may have replaced the process after the snapshot.
    if (pid <= 0 || entry->tracked_pid.load() != pid) {
        return false;
    }
    entry->health.RecordFailure(reason);
    StopLocked(*entry);
    LogWarn("registry", backend + " marked not running: " + reason);
    return true;
}

} // namespace mcp_fleet
