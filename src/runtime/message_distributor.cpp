#include <mcp_fleet/runtime/message_distributor.hpp>

#include <mcp_fleet/core/log.hpp>

namespace mcp_fleet {

namespace {

constexpr size_t kLoggedLinePrefix = 200;

std::string Truncate(const std::string& line) {
    if (line.size() <= kLoggedLinePrefix) {
        return line;
    }
    return line.substr(0, kLoggedLinePrefix) + "...";
}

} // anonymous namespace

MessageDistributor::MessageDistributor(std::string backend, ResponseRouting routing)
    : backend_(std::move(backend)), routing_(routing) {}

void MessageDistributor::OnOutputLine(const std::string& line) {
    auto decoded = protocol::Decode(line);
    if (decoded.IsErr()) {
        ++dropped_lines_;
        LogWarn("distributor", backend_ + ": dropping line (" + decoded.Error().message +
                                   "): " + Truncate(line));
        return;
    }
    Deliver(decoded.Value());
}

void MessageDistributor::OnErrorLine(const std::string& line) {
    LogBackendLine(backend_, line);
}

void MessageDistributor::Deliver(const protocol::Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool consumed_by_caller = false;
    std::optional<std::string> owner;

    if (protocol::IsReply(message)) {
        if (auto key = protocol::IdKeyOf(message)) {
            auto it = pending_.find(*key);
            if (it != pending_.end()) {
                it->second.set_value(message);
                pending_.erase(it);
                consumed_by_caller = true;
            }
            auto claim = claims_.find(*key);
            if (claim != claims_.end()) {
                owner = claim->second;
                claims_.erase(claim);
            }
        }
    }

    if (routing_ == ResponseRouting::Owner) {
        if (consumed_by_caller) {
            return;
        }
        if (owner) {
            auto sub = subscribers_.find(*owner);
            if (sub != subscribers_.end()) {
                PushLocked(sub->first, *sub->second, message);
            }
            return;
        }
    }

    for (auto& [session_id, queue] : subscribers_) {
        PushLocked(session_id, *queue, message);
    }
}

void MessageDistributor::PushLocked(const std::string& session_id, SessionQueue& queue,
                                    const protocol::Message& message) {
    bool dropped = false;
    if (!queue.Push(message, &dropped)) {
        return;   // session already closed
    }
    ++delivered_;
    if (dropped) {
        LogWarn("distributor", backend_ + ": session " + session_id +
                                   " queue full, dropped oldest message");
    }
}

Result<std::future<protocol::Message>, Error> MessageDistributor::ExpectReply(
    const std::string& id_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.count(id_key) != 0) {
        return Result<std::future<protocol::Message>, Error>::Err(Error::Make(
            ErrorCategory::InvalidRequest, "ExpectReply", backend_,
            "a request with id " + id_key + " is already awaiting a reply"));
    }
    std::promise<protocol::Message> promise;
    auto future = promise.get_future();
    pending_.emplace(id_key, std::move(promise));
    return Result<std::future<protocol::Message>, Error>::Ok(std::move(future));
}

bool MessageDistributor::CancelReply(const std::string& id_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(id_key) > 0;
}

void MessageDistributor::Subscribe(const std::string& session_id,
                                   std::shared_ptr<SessionQueue> queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[session_id] = std::move(queue);
}

void MessageDistributor::Unsubscribe(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(session_id);
    for (auto it = claims_.begin(); it != claims_.end();) {
        if (it->second == session_id) {
            it = claims_.erase(it);
        } else {
            ++it;
        }
    }
}

void MessageDistributor::ClaimReply(const std::string& id_key, const std::string& session_id) {
    if (routing_ != ResponseRouting::Owner) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    claims_[id_key] = session_id;
}

size_t MessageDistributor::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t MessageDistributor::SubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace mcp_fleet
