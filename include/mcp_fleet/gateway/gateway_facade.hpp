#pragma once

#include <mcp_fleet/catalog/tool_catalog.hpp>
#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/health/process_monitor.hpp>
#include <mcp_fleet/protocol/jsonrpc.hpp>
#include <mcp_fleet/registry/backend_registry.hpp>
#include <mcp_fleet/runtime/session_manager.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

struct GatewayOptions {
    std::chrono::milliseconds message_timeout{10000};
    std::chrono::milliseconds tool_timeout{60000};
    std::chrono::seconds session_idle_timeout{1800};
    std::string http_base_url = "http://localhost:8000";
    std::string socket_base_url = "ws://localhost:8001";

    static GatewayOptions FromConfig(const AppConfig& config);
};

// ---------------------------------------------------------------------------
// GatewayFacade: transport-neutral operations behind the HTTP, stream,
// socket and stdio front ends. Every method returns a Result; transports
// only translate it into their own framing.
// ---------------------------------------------------------------------------
class GatewayFacade {
public:
    GatewayFacade(BackendRegistry& registry, ToolCatalog& catalog, SessionManager& sessions,
                  GatewayOptions options, const ProcessMonitor* monitor = nullptr);

    GatewayFacade(const GatewayFacade&) = delete;
    GatewayFacade& operator=(const GatewayFacade&) = delete;

    // -- Backends --

    /// name -> {alive, lastUsed, popular, state, ...}
    [[nodiscard]] nlohmann::json ListBackends() const;

    /// Status plus the backend's stream and socket URLs.
    [[nodiscard]] Result<nlohmann::json, Error> DescribeBackend(const std::string& name) const;

    /// Add one backend from {name, command, args, env, cwd}, or ensure every
    /// backend named by tool-retriever descriptors ({"descriptors": ...}).
    [[nodiscard]] Result<nlohmann::json, Error> AddBackends(const nlohmann::json& body);

    /// Remove a dynamic backend and close its sessions.
    [[nodiscard]] Result<void, Error> RemoveBackend(const std::string& name);

    [[nodiscard]] Result<nlohmann::json, Error> RestartBackend(const std::string& name);

    // -- Messages --

    /// Forward one client JSON-RPC message. Requests wait for the reply with
    /// the same id (message timeout); notifications and replies yield nullopt.
    [[nodiscard]] Result<std::optional<protocol::Message>, Error> SendMessage(
        const std::string& backend, const nlohmann::json& body);

    /// initialize, await the result, then notifications/initialized.
    [[nodiscard]] Result<nlohmann::json, Error> Initialize(const std::string& backend,
                                                           const nlohmann::json& params);

    // -- Tools --

    /// {tools: [...], total, backends: [...]}
    [[nodiscard]] nlohmann::json ListTools() const;

    /// Raw tools/call result of a tool named "backend.tool".
    [[nodiscard]] Result<nlohmann::json, Error> CallToolRaw(const std::string& qualified_name,
                                                            const nlohmann::json& arguments);

    /// CallToolRaw, reduced to the first text block (parsed as JSON when it
    /// looks like JSON). isError results become BackendError.
    [[nodiscard]] Result<nlohmann::json, Error> CallTool(const std::string& qualified_name,
                                                         const nlohmann::json& arguments);

    // -- Sessions --

    /// Ensure the backend, then open a Session subscribed to it.
    [[nodiscard]] Result<std::shared_ptr<Session>, Error> OpenSession(const std::string& backend);

    /// Deliver a client message for a session of `backend`: decoded,
    /// observed for the handshake, then written without waiting for a reply.
    [[nodiscard]] Result<void, Error> PostSessionMessage(const std::string& backend,
                                                         const std::string& session_id,
                                                         const nlohmann::json& body);

    [[nodiscard]] Result<void, Error> CloseSession(const std::string& session_id);

    // -- Maintenance and reporting --

    size_t ReapIdleSessions();
    std::vector<std::string> CleanupIdleBackends(std::chrono::seconds ttl);

    /// Aggregate health report; "status" is "healthy" or "degraded".
    [[nodiscard]] nlohmann::json SystemHealth() const;

    /// Name, version, status and endpoint map.
    [[nodiscard]] nlohmann::json Info() const;

    [[nodiscard]] const GatewayOptions& Options() const noexcept { return options_; }

private:
    [[nodiscard]] Result<ToolEntry, Error> ResolveTool(const std::string& qualified_name);

    BackendRegistry& registry_;
    ToolCatalog& catalog_;
    SessionManager& sessions_;
    GatewayOptions options_;
    const ProcessMonitor* monitor_;
};

/// Reduce a tools/call result to its useful payload.
[[nodiscard]] Result<nlohmann::json, Error> ProcessToolResult(const std::string& tool,
                                                              const nlohmann::json& result);

} // namespace mcp_fleet
