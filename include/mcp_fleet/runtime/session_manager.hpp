#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/runtime/message_distributor.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// ISubscriptionHub: where session queues are attached to a backend's
// message stream. BackendRegistry implements it; sessions only know ids.
// ---------------------------------------------------------------------------
class ISubscriptionHub {
public:
    virtual ~ISubscriptionHub() = default;

    [[nodiscard]] virtual Result<void, Error> Subscribe(
        const std::string& backend, const std::string& session_id,
        std::shared_ptr<SessionQueue> queue) = 0;

    virtual void Unsubscribe(const std::string& backend, const std::string& session_id) = 0;

    virtual void ClaimReply(const std::string& backend, const std::string& id_key,
                            const std::string& session_id) = 0;
};

// ---------------------------------------------------------------------------
// Session: one client's dialogue with one backend over a long-lived
// transport: handshake state plus a bounded inbound queue.
// ---------------------------------------------------------------------------
class Session {
public:
    Session(std::string id, std::string backend, size_t queue_capacity,
            SteadyClock::time_point now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& Backend() const noexcept { return backend_; }
    [[nodiscard]] const std::shared_ptr<SessionQueue>& Queue() const noexcept { return queue_; }

    /// Track the MCP handshake from client traffic: the first "initialize"
    /// request fixes protocol version and capabilities, the "initialized"
    /// notification completes it.
    void ObserveClientMessage(const protocol::Message& message, SteadyClock::time_point now);

    void Touch(SteadyClock::time_point now);

    [[nodiscard]] bool IsInitialized() const;
    [[nodiscard]] std::optional<std::string> ProtocolVersion() const;
    [[nodiscard]] nlohmann::json Capabilities() const;
    [[nodiscard]] SteadyClock::time_point LastActivity() const;
    [[nodiscard]] nlohmann::json ToJson() const;

private:
    const std::string id_;
    const std::string backend_;
    std::shared_ptr<SessionQueue> queue_;

    mutable std::mutex mutex_;
    bool initialize_seen_ = false;
    bool initialized_ = false;
    std::optional<std::string> protocol_version_;
    nlohmann::json capabilities_ = nlohmann::json::object();
    nlohmann::json client_info_;
    SteadyClock::time_point last_activity_;
};

// ---------------------------------------------------------------------------
// SessionManager: owns every live Session, keyed by id.
// ---------------------------------------------------------------------------
class SessionManager {
public:
    SessionManager(ISubscriptionHub& hub, SessionOptions options,
                   ClockFn clock = SystemSteadyClock());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// New session with a fresh, empty queue subscribed to backend.
    [[nodiscard]] Result<std::shared_ptr<Session>, Error> Create(const std::string& backend);

    [[nodiscard]] Result<std::shared_ptr<Session>, Error> Find(const std::string& id) const;

    /// Record client traffic on a session (handshake tracking, activity,
    /// reply ownership).
    [[nodiscard]] Result<std::shared_ptr<Session>, Error> ObserveClientMessage(
        const std::string& id, const protocol::Message& message);

    /// Unsubscribe and close the queue. SessionNotFound if already gone.
    [[nodiscard]] Result<void, Error> Destroy(const std::string& id);

    size_t DestroyForBackend(const std::string& backend);
    size_t ReapInactive(std::chrono::seconds idle_timeout);
    void DestroyAll();

    [[nodiscard]] size_t Count() const;
    [[nodiscard]] std::vector<std::shared_ptr<Session>> List() const;

private:
    void Release(const std::shared_ptr<Session>& session);

    ISubscriptionHub& hub_;
    SessionOptions options_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace mcp_fleet
