#pragma once

#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/gateway/gateway_facade.hpp>
#include <mcp_fleet/gateway/request_gate.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mcp_fleet {

struct SocketServerOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8001;          // 0 binds an ephemeral port
    std::chrono::milliseconds pump_poll{500};
    size_t max_queued_frames = 256;   // per connection, while the worker is busy
};

// ---------------------------------------------------------------------------
// SocketServer: WebSocket endpoint /backends/{name}/socket over websocketpp.
//
// Every connection owns one Session and a worker thread. The I/O thread only
// queues client frames; the worker opens the Session (which may start the
// backend) and forwards the queued frames in arrival order. A pump thread
// per connection pushes the Session's queue back as text frames. Frames that
// are not JSON-RPC 2.0 are answered with a JSON-RPC error frame and never
// reach the backend.
// ---------------------------------------------------------------------------
class SocketServer {
public:
    SocketServer(GatewayFacade& gateway, const IRequestGate& gate, SocketServerOptions options);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    [[nodiscard]] Result<void, Error> Start();
    void Stop();

    [[nodiscard]] int BoundPort() const;
    [[nodiscard]] size_t ConnectionCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Backend name from a "/backends/{name}/socket" resource, if it matches.
[[nodiscard]] std::optional<std::string> BackendFromSocketResource(const std::string& resource);

} // namespace mcp_fleet
