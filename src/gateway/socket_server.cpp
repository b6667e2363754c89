#include <mcp_fleet/gateway/socket_server.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace mcp_fleet {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;
using ConnectionHdl = websocketpp::connection_hdl;

std::string ErrorFrame(const nlohmann::json& id, int code, const std::string& message,
                       const nlohmann::json& data = nullptr) {
    return protocol::Encode(protocol::MakeErrorResponse(id, code, message, data));
}

} // anonymous namespace

std::optional<std::string> BackendFromSocketResource(const std::string& resource) {
    std::string path = resource.substr(0, resource.find('?'));
    const std::string prefix = "/backends/";
    const std::string suffix = "/socket";
    if (path.size() <= prefix.size() + suffix.size() ||
        path.compare(0, prefix.size(), prefix) != 0 ||
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    std::string name = path.substr(prefix.size(), path.size() - prefix.size() - suffix.size());
    if (BackendName::Create(name).IsErr()) {
        return std::nullopt;
    }
    return name;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct SocketServer::Impl {
    // Shared by the I/O thread (inbound, closing) and the connection's worker.
    struct Connection {
        ConnectionHdl hdl;
        std::string backend;

        std::mutex mutex;
        std::condition_variable wake;
        std::deque<std::string> inbound;
        bool closing = false;
        std::shared_ptr<Session> session;

        std::thread worker;
        std::thread pump;
        std::atomic<bool> finished{false};
    };
    using ConnectionPtr = std::shared_ptr<Connection>;

    Impl(GatewayFacade& gw, const IRequestGate& g, SocketServerOptions opts)
        : gateway(gw), gate(g), options(std::move(opts)) {}

    GatewayFacade& gateway;
    const IRequestGate& gate;
    SocketServerOptions options;

    WsServer server;
    std::thread thread;
    std::atomic<bool> running{false};
    int bound_port = -1;

    mutable std::mutex mutex;
    std::map<ConnectionHdl, ConnectionPtr, std::owner_less<ConnectionHdl>> connections;
    std::vector<ConnectionPtr> retired;   // closed, worker not joined yet

    void Install();
    bool OnValidate(ConnectionHdl hdl);
    void OnOpen(ConnectionHdl hdl);
    void OnMessage(ConnectionHdl hdl, WsServer::message_ptr msg);
    void OnClose(ConnectionHdl hdl);
    void Serve(const ConnectionPtr& connection);
    void Forward(const ConnectionPtr& connection, const std::string& payload);
    void Release(const ConnectionPtr& connection);
    void Pump(ConnectionHdl hdl, std::shared_ptr<Session> session);
    void SendText(ConnectionHdl hdl, const std::string& text);
    void ReapRetired();
};

void SocketServer::Impl::Install() {
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([this](ConnectionHdl hdl) { return OnValidate(hdl); });
    server.set_open_handler([this](ConnectionHdl hdl) { OnOpen(hdl); });
    server.set_message_handler(
        [this](ConnectionHdl hdl, WsServer::message_ptr msg) { OnMessage(hdl, msg); });
    server.set_close_handler([this](ConnectionHdl hdl) { OnClose(hdl); });
    server.set_fail_handler([this](ConnectionHdl hdl) { OnClose(hdl); });
}

bool SocketServer::Impl::OnValidate(ConnectionHdl hdl) {
    try {
        auto con = server.get_con_from_hdl(hdl);
        if (!BackendFromSocketResource(con->get_resource())) {
            con->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        auto admitted = gate.Admit([&con](const std::string& name) -> std::optional<std::string> {
            std::string value = con->get_request_header(name);
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        });
        if (admitted.IsErr()) {
            LogWarn("socket", "rejected " + con->get_resource() + ": " + admitted.Error().message);
            con->set_status(websocketpp::http::status_code::unauthorized);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LogError("socket", std::string("validate failed: ") + e.what());
        return false;
    }
}

void SocketServer::Impl::OnOpen(ConnectionHdl hdl) {
    ReapRetired();
    try {
        auto con = server.get_con_from_hdl(hdl);
        auto backend = BackendFromSocketResource(con->get_resource());
        if (!backend) {
            con->close(websocketpp::close::status::policy_violation, "unknown endpoint");
            return;
        }
        auto connection = std::make_shared<Connection>();
        connection->hdl = hdl;
        connection->backend = *backend;

        std::lock_guard<std::mutex> lock(mutex);
        if (!running) {
            con->close(websocketpp::close::status::going_away, "gateway shutting down");
            return;
        }
        connection->worker = std::thread([this, connection] { Serve(connection); });
        connections[hdl] = connection;
    } catch (const std::exception& e) {
        LogError("socket", std::string("open failed: ") + e.what());
    }
}

void SocketServer::Impl::OnMessage(ConnectionHdl hdl, WsServer::message_ptr msg) {
    ConnectionPtr connection;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = connections.find(hdl);
        if (it != connections.end()) {
            connection = it->second;
        }
    }
    if (!connection) {
        return;
    }
    if (msg->get_opcode() != websocketpp::frame::opcode::text) {
        SendText(hdl, ErrorFrame(nullptr, protocol::kInvalidRequest, "only text frames are accepted"));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        if (connection->closing) {
            return;
        }
        if (connection->inbound.size() < options.max_queued_frames) {
            connection->inbound.push_back(msg->get_payload());
            connection->wake.notify_one();
            return;
        }
    }
    LogWarn("socket", connection->backend + ": dropping frame, " +
                          std::to_string(options.max_queued_frames) + " frames pending");
    SendText(hdl, ErrorFrame(nullptr, protocol::kServerError, "too many pending frames",
                             {{"category", "overloaded"}}));
}

void SocketServer::Impl::OnClose(ConnectionHdl hdl) {
    ConnectionPtr connection;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = connections.find(hdl);
        if (it == connections.end()) {
            return;
        }
        connection = it->second;
        connections.erase(it);
        retired.push_back(connection);
    }
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        connection->closing = true;
    }
    connection->wake.notify_one();
    ReapRetired();
}

// Worker: open the session, then forward queued frames until the client leaves.
void SocketServer::Impl::Serve(const ConnectionPtr& connection) {
    auto opened = gateway.OpenSession(connection->backend);
    if (opened.IsErr()) {
        const auto& error = opened.Error();
        LogWarn("socket", "cannot open session on " + connection->backend + ": " +
                              error.ToString());
        SendText(connection->hdl, ErrorFrame(nullptr, protocol::kServerError, error.message,
                                             {{"category", error.CategoryName()}}));
        websocketpp::lib::error_code ec;
        server.close(connection->hdl, websocketpp::close::status::try_again_later,
                     error.CategoryName(), ec);
        connection->finished = true;
        return;
    }

    bool closed_early = false;
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        connection->session = opened.Value();
        closed_early = connection->closing;
    }
    if (!closed_early) {
        LogInfo("socket", "connection opened, session " + opened.Value()->Id() + " on " +
                              connection->backend);
        connection->pump = std::thread([this, hdl = connection->hdl, session = opened.Value()] {
            Pump(hdl, session);
        });
        for (;;) {
            std::string payload;
            {
                std::unique_lock<std::mutex> lock(connection->mutex);
                connection->wake.wait(lock, [&connection] {
                    return connection->closing || !connection->inbound.empty();
                });
                if (connection->closing) {
                    break;
                }
                payload = std::move(connection->inbound.front());
                connection->inbound.pop_front();
            }
            Forward(connection, payload);
        }
    }
    Release(connection);
    connection->finished = true;
}

void SocketServer::Impl::Forward(const ConnectionPtr& connection, const std::string& payload) {
    auto body = nlohmann::json::parse(payload, nullptr, false);
    if (body.is_discarded()) {
        SendText(connection->hdl, ErrorFrame(nullptr, protocol::kParseError,
                                             "frame is not valid JSON"));
        return;
    }
    auto decoded = protocol::FromJson(body);
    if (decoded.IsErr()) {
        nlohmann::json id = body.is_object() && body.contains("id") ? body["id"] : nullptr;
        SendText(connection->hdl,
                 ErrorFrame(id, protocol::kInvalidRequest, decoded.Error().message));
        return;
    }

    auto posted = gateway.PostSessionMessage(connection->backend, connection->session->Id(), body);
    if (posted.IsErr()) {
        auto id_key = protocol::IdKeyOf(decoded.Value());
        nlohmann::json id = id_key && body.contains("id") ? body["id"] : nullptr;
        SendText(connection->hdl, ErrorFrame(id, protocol::kServerError, posted.Error().message,
                                             {{"category", posted.Error().CategoryName()}}));
    }
}

void SocketServer::Impl::Release(const ConnectionPtr& connection) {
    const auto id = connection->session->Id();
    auto closed = gateway.CloseSession(id);
    if (closed.IsErr()) {
        LogDebug("socket", closed.Error().message);
    }
    // Closing the session closes its queue, which ends the pump.
    connection->session->Queue()->Close();
    if (connection->pump.joinable()) {
        connection->pump.join();
    }
    LogInfo("socket", "connection closed, session " + id);
}

void SocketServer::Impl::Pump(ConnectionHdl hdl, std::shared_ptr<Session> session) {
    auto queue = session->Queue();
    while (running) {
        auto message = queue->Pop(options.pump_poll);
        if (message) {
            session->Touch(SteadyClock::now());
            SendText(hdl, protocol::Encode(*message));
            continue;
        }
        if (queue->IsClosed()) {
            break;
        }
    }
}

void SocketServer::Impl::SendText(ConnectionHdl hdl, const std::string& text) {
    websocketpp::lib::error_code ec;
    server.send(hdl, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        LogDebug("socket", "send failed: " + ec.message());
    }
}

// Joins workers that already returned; never blocks on a busy one.
void SocketServer::Impl::ReapRetired() {
    std::vector<ConnectionPtr> done;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto split = std::stable_partition(retired.begin(), retired.end(),
                                           [](const ConnectionPtr& c) { return !c->finished; });
        done.assign(split, retired.end());
        retired.erase(split, retired.end());
    }
    for (auto& connection : done) {
        if (connection->worker.joinable()) {
            connection->worker.join();
        }
    }
}

// ---------------------------------------------------------------------------
// SocketServer
// ---------------------------------------------------------------------------
SocketServer::SocketServer(GatewayFacade& gateway, const IRequestGate& gate,
                           SocketServerOptions options)
    : impl_(std::make_unique<Impl>(gateway, gate, std::move(options))) {
    impl_->Install();
}

SocketServer::~SocketServer() {
    Stop();
}

Result<void, Error> SocketServer::Start() {
    auto& impl = *impl_;
    if (impl.running) {
        return Result<void, Error>::Ok();
    }
    websocketpp::lib::error_code ec;
    impl.server.listen(impl.options.host, std::to_string(impl.options.port), ec);
    if (!ec) {
        impl.server.start_accept(ec);
    }
    if (ec) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "StartSocketServer", "",
            "cannot listen on " + impl.options.host + ":" + std::to_string(impl.options.port),
            ec.message()));
    }
    auto endpoint = impl.server.get_local_endpoint(ec);
    impl.bound_port = ec ? impl.options.port : endpoint.port();

    impl.running = true;
    impl.thread = std::thread([&impl] {
        try {
            impl.server.run();
        } catch (const std::exception& e) {
            LogError("socket", std::string("server loop failed: ") + e.what());
        }
    });
    LogInfo("socket", "listening on " + impl.options.host + ":" +
                          std::to_string(impl.bound_port));
    return Result<void, Error>::Ok();
}

void SocketServer::Stop() {
    auto& impl = *impl_;
    if (!impl.running.exchange(false)) {
        return;
    }
    websocketpp::lib::error_code ec;
    impl.server.stop_listening(ec);

    std::vector<Impl::ConnectionPtr> all;
    {
        std::lock_guard<std::mutex> lock(impl.mutex);
        for (auto& entry : impl.connections) {
            all.push_back(entry.second);
        }
        impl.connections.clear();
        all.insert(all.end(), impl.retired.begin(), impl.retired.end());
        impl.retired.clear();
    }
    for (const auto& connection : all) {
        impl.server.close(connection->hdl, websocketpp::close::status::going_away,
                          "gateway shutting down", ec);
        {
            std::lock_guard<std::mutex> lock(connection->mutex);
            connection->closing = true;
        }
        connection->wake.notify_one();
    }
    // A worker still opening its session finishes that first, then releases it.
    for (const auto& connection : all) {
        if (connection->worker.joinable()) {
            connection->worker.join();
        }
    }

    impl.server.stop();
    if (impl.thread.joinable()) {
        impl.thread.join();
    }
    LogInfo("socket", "stopped");
}

int SocketServer::BoundPort() const {
    return impl_->bound_port;
}

size_t SocketServer::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->connections.size();
}

} // namespace mcp_fleet
