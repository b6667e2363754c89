#include <mcp_fleet/runtime/session_manager.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>

namespace mcp_fleet {

namespace {

Error SessionNotFound(const std::string& operation, const std::string& id) {
    return Error::Make(ErrorCategory::SessionNotFound, operation, "",
                       "session " + id + " does not exist");
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------
Session::Session(std::string id, std::string backend, size_t queue_capacity,
                 SteadyClock::time_point now)
    : id_(std::move(id)),
      backend_(std::move(backend)),
      queue_(std::make_shared<SessionQueue>(queue_capacity)),
      last_activity_(now) {}

void Session::ObserveClientMessage(const protocol::Message& message,
                                   SteadyClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = now;

    if (const auto* request = std::get_if<protocol::Request>(&message)) {
        if (request->method != "initialize" || initialize_seen_) {
            return;
        }
        initialize_seen_ = true;
        const auto& params = request->params;
        if (params.is_object()) {
            auto version = params.find("protocolVersion");
            if (version != params.end() && version->is_string()) {
                protocol_version_ = version->get<std::string>();
            }
            auto caps = params.find("capabilities");
            if (caps != params.end() && caps->is_object()) {
                capabilities_ = *caps;
            }
            auto info = params.find("clientInfo");
            if (info != params.end()) {
                client_info_ = *info;
            }
        }
        return;
    }

    if (const auto* note = std::get_if<protocol::Notification>(&message)) {
        if (note->method == "notifications/initialized" || note->method == "initialized") {
            initialized_ = true;
        }
    }
}

void Session::Touch(SteadyClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = now;
}

bool Session::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

std::optional<std::string> Session::ProtocolVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

nlohmann::json Session::Capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_;
}

SteadyClock::time_point Session::LastActivity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

nlohmann::json Session::ToJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json j = {
        {"id", id_},
        {"backend", backend_},
        {"initialized", initialized_},
        {"capabilities", capabilities_},
        {"queued", queue_->Size()},
        {"dropped", queue_->DroppedTotal()},
    };
    j["protocolVersion"] = protocol_version_ ? nlohmann::json(*protocol_version_)
                                             : nlohmann::json(nullptr);
    if (!client_info_.is_null()) {
        j["clientInfo"] = client_info_;
    }
    return j;
}

// ---------------------------------------------------------------------------
// SessionManager
// ---------------------------------------------------------------------------
SessionManager::SessionManager(ISubscriptionHub& hub, SessionOptions options, ClockFn clock)
    : hub_(hub), options_(options), clock_(std::move(clock)) {}

SessionManager::~SessionManager() {
    DestroyAll();
}

Result<std::shared_ptr<Session>, Error> SessionManager::Create(const std::string& backend) {
    auto session = std::make_shared<Session>(GenerateSessionId(), backend,
                                             options_.queue_capacity, clock_());
    auto subscribed = hub_.Subscribe(backend, session->Id(), session->Queue());
    if (subscribed.IsErr()) {
        return Result<std::shared_ptr<Session>, Error>::Err(subscribed.Error());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session->Id()] = session;
    }
    LogInfo("session", "opened " + session->Id() + " on " + backend);
    return Result<std::shared_ptr<Session>, Error>::Ok(std::move(session));
}

Result<std::shared_ptr<Session>, Error> SessionManager::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Result<std::shared_ptr<Session>, Error>::Err(SessionNotFound("FindSession", id));
    }
    return Result<std::shared_ptr<Session>, Error>::Ok(it->second);
}

Result<std::shared_ptr<Session>, Error> SessionManager::ObserveClientMessage(
    const std::string& id, const protocol::Message& message) {
    auto found = Find(id);
    if (found.IsErr()) {
        return found;
    }
    const auto& session = found.Value();
    session->ObserveClientMessage(message, clock_());
    if (protocol::IsRequest(message)) {
        if (auto key = protocol::IdKeyOf(message)) {
            hub_.ClaimReply(session->Backend(), *key, session->Id());
        }
    }
    return found;
}

Result<void, Error> SessionManager::Destroy(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return Result<void, Error>::Err(SessionNotFound("DestroySession", id));
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    Release(session);
    LogInfo("session", "closed " + id);
    return Result<void, Error>::Ok();
}

void SessionManager::Release(const std::shared_ptr<Session>& session) {
    hub_.Unsubscribe(session->Backend(), session->Id());
    session->Queue()->Close();
    session->Queue()->Clear();
}

size_t SessionManager::DestroyForBackend(const std::string& backend) {
    std::vector<std::shared_ptr<Session>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->Backend() == backend) {
                victims.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& session : victims) {
        Release(session);
    }
    return victims.size();
}

size_t SessionManager::ReapInactive(std::chrono::seconds idle_timeout) {
    const auto now = clock_();
    std::vector<std::shared_ptr<Session>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second->LastActivity() > idle_timeout) {
                victims.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& session : victims) {
        LogInfo("session", "reaped inactive session " + session->Id());
        Release(session);
    }
    return victims.size();
}

void SessionManager::DestroyAll() {
    std::map<std::string, std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(sessions_);
    }
    for (const auto& [id, session] : all) {
        Release(session);
    }
}

size_t SessionManager::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::shared_ptr<Session>> SessionManager::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        out.push_back(session);
    }
    return out;
}

} // namespace mcp_fleet
