#pragma once

#include <mcp_fleet/gateway/gateway_facade.hpp>
#include <mcp_fleet/protocol/jsonrpc.hpp>

#include <iostream>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// McpServer: the whole fleet as one MCP server on stdin/stdout.
//
// Each catalog entry becomes a tool named "backend.tool"; tools/call goes
// through GatewayFacade::CallToolRaw so lazy start, recovery and the breaker
// apply exactly as on the HTTP surface. Two gateway tools without a backend
// prefix report on the fleet itself: get_server_status and get_system_info.
// Log output must not go to `out`.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(GatewayFacade& gateway,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    /// Answer requests line by line until EOF on `in`.
    void Run();

    /// Answer one decoded JSON value. Notifications and client replies
    /// produce nothing.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

private:
    using Handler = protocol::Message (McpServer::*)(const protocol::Request&);

    struct GatewayTool {
        const char* description;
        nlohmann::json (McpServer::*report)();
    };

    protocol::Message Initialize(const protocol::Request& request);
    protocol::Message Ping(const protocol::Request& request);
    protocol::Message ListTools(const protocol::Request& request);
    protocol::Message CallTool(const protocol::Request& request);

    nlohmann::json ServerStatus();
    nlohmann::json SystemInfo();

    void WriteLine(const nlohmann::json& message);

    GatewayFacade& gateway_;
    std::istream& in_;
    std::ostream& out_;
    std::map<std::string, Handler> handlers_;
    std::map<std::string, GatewayTool> gateway_tools_;
    bool initialized_ = false;
};

} // namespace mcp_fleet
