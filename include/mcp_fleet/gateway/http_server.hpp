#pragma once

#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/gateway/gateway_facade.hpp>
#include <mcp_fleet/gateway/request_gate.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace mcp_fleet {

// Workers kept free of streams when max_streams is left at 0.
constexpr size_t kReservedWorkers = 4;

struct HttpServerOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;          // 0 binds an ephemeral port
    size_t threads = 32;
    // Concurrent SSE streams; 0 leaves kReservedWorkers of `threads` for
    // plain requests. Always clamped below the effective thread count.
    size_t max_streams = 0;
    std::chrono::seconds heartbeat{30};
    std::chrono::milliseconds stream_poll{1000};
};

// ---------------------------------------------------------------------------
// HttpServer: REST endpoints and server-sent event streams over
// cpp-httplib. Each open stream occupies one worker thread that drains its
// Session queue; the pool is sized by `threads`. Streams past the cap are
// refused with 503 so plain requests always find a free worker.
// ---------------------------------------------------------------------------
class HttpServer {
public:
    HttpServer(GatewayFacade& gateway, const IRequestGate& gate, HttpServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve on a background thread.
    [[nodiscard]] Result<void, Error> Start();

    /// Stop accepting, end open streams and join the server thread.
    void Stop();

    [[nodiscard]] int BoundPort() const;

    [[nodiscard]] size_t OpenStreams() const;
    [[nodiscard]] size_t MaxStreams() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_fleet
