#include <mcp_fleet/mcp/mcp_server.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/version.hpp>

#include <string>
#include <variant>

namespace mcp_fleet {

McpServer::McpServer(GatewayFacade& gateway, std::istream& in, std::ostream& out)
    : gateway_(gateway),
      in_(in),
      out_(out),
      handlers_{
          {"initialize", &McpServer::Initialize},
          {"ping", &McpServer::Ping},
          {"tools/list", &McpServer::ListTools},
          {"tools/call", &McpServer::CallTool},
      },
      gateway_tools_{
          {"get_server_status",
           {"Status of every backend in the fleet", &McpServer::ServerStatus}},
          {"get_system_info",
           {"Health summary and metrics of the gateway", &McpServer::SystemInfo}},
      } {}

void McpServer::Run() {
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty() || line == "\r") {
            continue;
        }
        auto value = nlohmann::json::parse(line, nullptr, false);
        if (value.is_discarded()) {
            WriteLine(protocol::ToJson(
                protocol::MakeErrorResponse(nullptr, protocol::kParseError, "Parse error")));
            continue;
        }
        if (auto reply = HandleMessage(value)) {
            WriteLine(*reply);
        }
    }
    LogInfo("mcp", "stdin closed, leaving the MCP loop");
}

std::optional<nlohmann::json> McpServer::HandleMessage(const nlohmann::json& message) {
    auto decoded = protocol::FromJson(message);
    if (decoded.IsErr()) {
        // Only a malformed request carries an id worth answering.
        if (message.is_object() && message.contains("id")) {
            return protocol::ToJson(protocol::MakeErrorResponse(
                message["id"], protocol::kInvalidRequest, decoded.Error().message));
        }
        LogDebug("mcp", "dropping malformed message: " + decoded.Error().message);
        return std::nullopt;
    }

    const auto* request = std::get_if<protocol::Request>(&decoded.Value());
    if (request == nullptr) {
        return std::nullopt;
    }

    auto handler = handlers_.find(request->method);
    if (handler == handlers_.end()) {
        return protocol::ToJson(protocol::MakeErrorResponse(
            request->id, protocol::kMethodNotFound, "Method not found: " + request->method));
    }
    return protocol::ToJson((this->*(handler->second))(*request));
}

protocol::Message McpServer::Initialize(const protocol::Request& request) {
    initialized_ = true;
    if (request.params.is_object() && request.params.contains("clientInfo")) {
        LogInfo("mcp", "client connected: " + request.params["clientInfo"].dump());
    }
    return protocol::MakeResponse(request.id, {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", "mcp-fleet"}, {"version", kVersion}}},
    });
}

protocol::Message McpServer::Ping(const protocol::Request& request) {
    return protocol::MakeResponse(request.id, nlohmann::json::object());
}

protocol::Message McpServer::ListTools(const protocol::Request& request) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& entry : gateway_.ListTools()["tools"]) {
        // The backend tag keeps same-named tools from different backends apart
        // in clients that only show descriptions.
        tools.push_back({
            {"name", entry["name"]},
            {"description", "[" + entry.value("backend", "") + "] " +
                                entry.value("description", "")},
            {"inputSchema", entry.value("inputSchema", nlohmann::json{{"type", "object"}})},
        });
    }
    for (const auto& [name, tool] : gateway_tools_) {
        tools.push_back({
            {"name", name},
            {"description", tool.description},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}},
        });
    }
    return protocol::MakeResponse(request.id, {{"tools", std::move(tools)}});
}

protocol::Message McpServer::CallTool(const protocol::Request& request) {
    const auto& params = request.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return protocol::MakeErrorResponse(request.id, protocol::kInvalidParams,
                                           "tools/call needs a string 'name'");
    }
    auto name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    auto gateway_tool = gateway_tools_.find(name);
    if (gateway_tool != gateway_tools_.end()) {
        auto report = (this->*(gateway_tool->second.report))();
        return protocol::MakeResponse(request.id, {
            {"content", {{{"type", "text"},
                          {"text", report.dump(2, ' ', false,
                                               nlohmann::json::error_handler_t::replace)}}}},
            {"isError", false},
        });
    }

    auto result = gateway_.CallToolRaw(name, arguments);
    if (result.IsOk()) {
        return protocol::MakeResponse(request.id, result.Value());
    }

    const auto& error = result.Error();
    if (error.category == ErrorCategory::ToolNotFound) {
        return protocol::MakeErrorResponse(request.id, protocol::kInvalidParams, error.message);
    }
    // Everything past lookup failed inside the fleet; MCP clients expect
    // that as a tool result flagged isError.
    return protocol::MakeResponse(request.id, {
        {"content", {{{"type", "text"}, {"text", error.ToString()}}}},
        {"isError", true},
    });
}

nlohmann::json McpServer::ServerStatus() {
    return gateway_.ListBackends();
}

nlohmann::json McpServer::SystemInfo() {
    return gateway_.SystemHealth();
}

void McpServer::WriteLine(const nlohmann::json& message) {
    out_ << message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
}

} // namespace mcp_fleet
