#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/protocol/jsonrpc.hpp>
#include <mcp_fleet/runtime/bounded_queue.hpp>

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mcp_fleet {

using SessionQueue = BoundedQueue<protocol::Message>;

// ---------------------------------------------------------------------------
// MessageDistributor: fans one backend's output out to its consumers.
//
// Every decoded message is checked against the pending synchronous replies
// (matched by id key) and delivered to every subscribed session queue. With
// ResponseRouting::Owner, a reply whose id a session claimed goes only to
// that session, and a reply consumed by a synchronous caller is not
// broadcast.
//
// Lives as long as the backend's registry entry, across process restarts.
// ---------------------------------------------------------------------------
class MessageDistributor {
public:
    explicit MessageDistributor(std::string backend,
                                ResponseRouting routing = ResponseRouting::Broadcast);

    MessageDistributor(const MessageDistributor&) = delete;
    MessageDistributor& operator=(const MessageDistributor&) = delete;

    /// One stdout line. Lines that are not JSON-RPC are logged and dropped.
    void OnOutputLine(const std::string& line);

    /// One stderr line. Logged, never treated as protocol data.
    void OnErrorLine(const std::string& line);

    /// Route an already-decoded message.
    void Deliver(const protocol::Message& message);

    /// Register a waiter for the reply carrying id_key. Fails if the same id
    /// is already awaited.
    [[nodiscard]] Result<std::future<protocol::Message>, Error> ExpectReply(
        const std::string& id_key);

    /// Remove a waiter. Returns false if the reply already arrived.
    bool CancelReply(const std::string& id_key);

    void Subscribe(const std::string& session_id, std::shared_ptr<SessionQueue> queue);
    void Unsubscribe(const std::string& session_id);

    /// Record that session_id sent the request id_key (owner routing only).
    void ClaimReply(const std::string& id_key, const std::string& session_id);

    [[nodiscard]] size_t PendingCount() const;
    [[nodiscard]] size_t SubscriberCount() const;
    [[nodiscard]] uint64_t DroppedLines() const noexcept { return dropped_lines_.load(); }
    [[nodiscard]] uint64_t DeliveredMessages() const noexcept { return delivered_.load(); }

private:
    void PushLocked(const std::string& session_id, SessionQueue& queue,
                    const protocol::Message& message);

    std::string backend_;
    ResponseRouting routing_;

    mutable std::mutex mutex_;
    std::map<std::string, std::promise<protocol::Message>> pending_;
    std::map<std::string, std::shared_ptr<SessionQueue>> subscribers_;
    std::map<std::string, std::string> claims_;   // id key -> session id

    std::atomic<uint64_t> dropped_lines_{0};
    std::atomic<uint64_t> delivered_{0};
};

} // namespace mcp_fleet
