#include <mcp_fleet/gateway/gateway_facade.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>
#include <mcp_fleet/core/version.hpp>
#include <mcp_fleet/gateway/tool_descriptors.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_fleet {

namespace {

std::string TrimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

// "https://example.com:8443/base" -> {"https", "example.com"}
std::pair<std::string, std::string> SchemeAndHost(const std::string& url) {
    std::string scheme = "http";
    std::string rest = url;
    auto sep = url.find("://");
    if (sep != std::string::npos) {
        scheme = url.substr(0, sep);
        rest = url.substr(sep + 3);
    }
    auto end = rest.find_first_of(":/");
    return {scheme, end == std::string::npos ? rest : rest.substr(0, end)};
}

Result<protocol::Message, Error> DecodeClientMessage(const std::string& backend,
                                                     const nlohmann::json& body) {
    auto decoded = protocol::FromJson(body);
    if (decoded.IsErr()) {
        return Result<protocol::Message, Error>::Err(Error::Make(
            ErrorCategory::InvalidRequest, "SendMessage", backend,
            "not a JSON-RPC 2.0 message: " + decoded.Error().message));
    }
    return decoded;
}

nlohmann::json DefaultInitializeParams() {
    return {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "mcp-fleet"}, {"version", kVersion}}},
    };
}

bool LooksLikeJson(const std::string& text) {
    auto first = std::find_if(text.begin(), text.end(),
                              [](unsigned char c) { return !std::isspace(c); });
    return first != text.end() && (*first == '{' || *first == '[');
}

} // anonymous namespace

GatewayOptions GatewayOptions::FromConfig(const AppConfig& config) {
    GatewayOptions options;
    options.message_timeout = config.message_timeout;
    options.tool_timeout = config.tool_timeout;
    options.session_idle_timeout = config.session.idle_timeout;

    std::string scheme = "http";
    std::string host = config.host == "0.0.0.0" || config.host == "::" ? "localhost" : config.host;
    if (config.public_url) {
        options.http_base_url = TrimTrailingSlash(*config.public_url);
        auto parts = SchemeAndHost(*config.public_url);
        scheme = parts.first;
        host = parts.second;
    } else {
        options.http_base_url = "http://" + host + ":" + std::to_string(config.port);
    }
    options.socket_base_url = std::string(scheme == "https" ? "wss" : "ws") + "://" + host +
                              ":" + std::to_string(config.socket_port);
    return options;
}

Result<nlohmann::json, Error> ProcessToolResult(const std::string& tool,
                                                const nlohmann::json& result) {
    using R = Result<nlohmann::json, Error>;
    if (!result.is_object() || !result.contains("content")) {
        return R::Ok(result);
    }
    const auto& content = result["content"];

    std::optional<std::string> first_text;
    if (content.is_array() && !content.empty() && content[0].is_object() &&
        content[0].contains("text") && content[0]["text"].is_string()) {
        first_text = content[0]["text"].get<std::string>();
    }

    if (result.value("isError", false)) {
        std::string message = first_text ? *first_text
                                         : content.dump(-1, ' ', false,
                                                        nlohmann::json::error_handler_t::replace);
        return R::Err(Error::Make(ErrorCategory::BackendError, "CallTool", "",
                                  "tool '" + tool + "' reported an error: " + message));
    }

    if (!content.is_array() || content.empty()) {
        return R::Ok(nlohmann::json{{"content", content}});
    }
    if (!first_text) {
        return R::Ok(content[0]);
    }
    if (LooksLikeJson(*first_text)) {
        auto parsed = nlohmann::json::parse(*first_text, nullptr, false);
        if (!parsed.is_discarded()) {
            return R::Ok(std::move(parsed));
        }
    }
    return R::Ok(nlohmann::json(*first_text));
}

GatewayFacade::GatewayFacade(BackendRegistry& registry, ToolCatalog& catalog,
                             SessionManager& sessions, GatewayOptions options,
                             const ProcessMonitor* monitor)
    : registry_(registry),
      catalog_(catalog),
      sessions_(sessions),
      options_(std::move(options)),
      monitor_(monitor) {}

// ---------------------------------------------------------------------------
// Backends
// ---------------------------------------------------------------------------
nlohmann::json GatewayFacade::ListBackends() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& status : registry_.List()) {
        out[status.name] = status.ToJson();
    }
    return out;
}

Result<nlohmann::json, Error> GatewayFacade::DescribeBackend(const std::string& name) const {
    auto status = registry_.Describe(name);
    if (status.IsErr()) {
        return Result<nlohmann::json, Error>::Err(status.Error());
    }
    auto j = status.Value().ToJson();
    j["name"] = name;
    j["stream_url"] = options_.http_base_url + "/backends/" + name + "/stream";
    j["socket_url"] = options_.socket_base_url + "/backends/" + name + "/socket";
    j["message_url"] = options_.http_base_url + "/backends/" + name + "/message";
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : catalog_.ToolsFor(name)) {
        tools.push_back(tool.qualified_name);
    }
    j["tool_names"] = tools;
    j["health"] = status.Value().health.ToJson();
    return Result<nlohmann::json, Error>::Ok(std::move(j));
}

Result<nlohmann::json, Error> GatewayFacade::AddBackends(const nlohmann::json& body) {
    using R = Result<nlohmann::json, Error>;
    if (!body.is_object() && !body.is_array()) {
        return R::Err(Error::Make(ErrorCategory::InvalidRequest, "AddBackend", "",
                                  "request body must be a JSON object"));
    }

    const bool has_descriptors = body.is_array() ||
                                 body.contains("descriptors") ||
                                 body.contains("mcp_server_config");
    if (has_descriptors) {
        const auto& descriptors = body.is_object() && body.contains("descriptors")
                                      ? body["descriptors"]
                                      : body;
        auto parsed = ParseRetrievedDescriptors(descriptors);
        if (parsed.IsErr()) {
            return R::Err(parsed.Error());
        }
        nlohmann::json report = nlohmann::json::object();
        size_t ensured = 0;
        for (const auto& backend : parsed.Value()) {
            auto result = registry_.Ensure(backend.name, backend.config);
            if (result.IsErr()) {
                LogWarn("gateway", "could not ensure " + backend.name + ": " +
                                       result.Error().ToString());
                report[backend.name] = {{"ok", false},
                                        {"error", result.Error().ToJsonValue()["error"]}};
                continue;
            }
            ++ensured;
            report[backend.name] = {{"ok", true},
                                    {"tool", backend.tool_name},
                                    {"relevance_score", backend.relevance_score}};
        }
        return R::Ok(nlohmann::json{{"ensured", ensured},
                                    {"requested", parsed.Value().size()},
                                    {"backends", report}});
    }

    auto name_it = body.find("name");
    if (name_it == body.end() || !name_it->is_string()) {
        return R::Err(Error::Make(ErrorCategory::InvalidRequest, "AddBackend", "",
                                  "missing 'name'"));
    }
    const auto name = name_it->get<std::string>();
    auto config = ParseBackendConfigJson(name, body);
    if (config.IsErr()) {
        return R::Err(config.Error());
    }
    auto added = registry_.Add(name, config.Value());
    if (added.IsErr()) {
        return R::Err(added.Error());
    }
    return DescribeBackend(name);
}

Result<void, Error> GatewayFacade::RemoveBackend(const std::string& name) {
    auto removed = registry_.Remove(name);
    if (removed.IsErr()) {
        return removed;
    }
    auto closed = sessions_.DestroyForBackend(name);
    if (closed > 0) {
        LogInfo("gateway", "closed " + std::to_string(closed) + " sessions of " + name);
    }
    return removed;
}

Result<nlohmann::json, Error> GatewayFacade::RestartBackend(const std::string& name) {
    auto restarted = registry_.Restart(name);
    if (restarted.IsErr()) {
        return Result<nlohmann::json, Error>::Err(restarted.Error());
    }
    return DescribeBackend(name);
}

// ---------------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------------
Result<std::optional<protocol::Message>, Error> GatewayFacade::SendMessage(
    const std::string& backend, const nlohmann::json& body) {
    using R = Result<std::optional<protocol::Message>, Error>;
    auto decoded = DecodeClientMessage(backend, body);
    if (decoded.IsErr()) {
        return R::Err(decoded.Error());
    }
    const auto& message = decoded.Value();
    if (const auto* request = std::get_if<protocol::Request>(&message)) {
        auto reply = registry_.Exchange(backend, *request, options_.message_timeout);
        if (reply.IsErr()) {
            return R::Err(reply.Error());
        }
        return R::Ok(std::optional<protocol::Message>(reply.Value()));
    }
    auto sent = registry_.Send(backend, message);
    if (sent.IsErr()) {
        return R::Err(sent.Error());
    }
    return R::Ok(std::nullopt);
}

Result<nlohmann::json, Error> GatewayFacade::Initialize(const std::string& backend,
                                                        const nlohmann::json& params) {
    using R = Result<nlohmann::json, Error>;
    auto effective = params.is_object() && !params.empty() ? params : DefaultInitializeParams();
    auto result = registry_.Call(backend, "initialize", effective, options_.message_timeout);
    if (result.IsErr()) {
        return result;
    }
    auto sent = registry_.Send(backend, protocol::MakeNotification("notifications/initialized"));
    if (sent.IsErr()) {
        return R::Err(sent.Error());
    }
    return result;
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------
nlohmann::json GatewayFacade::ListTools() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : catalog_.Tools()) {
        tools.push_back(tool.ToJson());
    }
    nlohmann::json backends = nlohmann::json::array();
    for (const auto& status : registry_.List()) {
        backends.push_back(status.name);
    }
    return {
        {"tools", tools},
        {"total", tools.size()},
        {"backends", backends},
    };
}

Result<ToolEntry, Error> GatewayFacade::ResolveTool(const std::string& qualified_name) {
    auto resolved = catalog_.Resolve(qualified_name);
    if (resolved.IsOk()) {
        return resolved;
    }
    // A registered backend that has not been started yet has no catalog
    // entries; start it and look again.
    auto parsed = QualifiedToolName::Parse(qualified_name);
    if (parsed.IsErr()) {
        return Result<ToolEntry, Error>::Err(Error::Make(
            ErrorCategory::ToolNotFound, "ResolveTool", "", parsed.Error()));
    }
    const auto& backend = parsed.Value().Backend();
    if (!registry_.Contains(backend) || !catalog_.ToolsFor(backend).empty()) {
        return resolved;
    }
    auto ensured = registry_.Ensure(backend);
    if (ensured.IsErr()) {
        return Result<ToolEntry, Error>::Err(ensured.Error());
    }
    return catalog_.Resolve(qualified_name);
}

Result<nlohmann::json, Error> GatewayFacade::CallToolRaw(const std::string& qualified_name,
                                                         const nlohmann::json& arguments) {
    using R = Result<nlohmann::json, Error>;
    auto resolved = ResolveTool(qualified_name);
    if (resolved.IsErr()) {
        return R::Err(resolved.Error());
    }
    const auto& tool = resolved.Value();
    auto ensured = registry_.Ensure(tool.backend);
    if (ensured.IsErr()) {
        return R::Err(ensured.Error());
    }
    nlohmann::json params = {
        {"name", tool.tool_name},
        {"arguments", arguments.is_object() ? arguments : nlohmann::json::object()},
    };
    LogInfo("gateway", "calling " + tool.tool_name + " on " + tool.backend);
    return registry_.Call(tool.backend, "tools/call", params, options_.tool_timeout);
}

Result<nlohmann::json, Error> GatewayFacade::CallTool(const std::string& qualified_name,
                                                      const nlohmann::json& arguments) {
    auto raw = CallToolRaw(qualified_name, arguments);
    if (raw.IsErr()) {
        return raw;
    }
    auto processed = ProcessToolResult(qualified_name, raw.Value());
    if (processed.IsErr()) {
        auto error = processed.Error();
        auto parsed = QualifiedToolName::Parse(qualified_name);
        if (parsed.IsOk()) {
            error.backend = parsed.Value().Backend();
        }
        return Result<nlohmann::json, Error>::Err(std::move(error));
    }
    return processed;
}

// ---------------------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------------------
Result<std::shared_ptr<Session>, Error> GatewayFacade::OpenSession(const std::string& backend) {
    auto ensured = registry_.Ensure(backend);
    if (ensured.IsErr()) {
        return Result<std::shared_ptr<Session>, Error>::Err(ensured.Error());
    }
    return sessions_.Create(backend);
}

Result<void, Error> GatewayFacade::PostSessionMessage(const std::string& backend,
                                                      const std::string& session_id,
                                                      const nlohmann::json& body) {
    auto session = sessions_.Find(session_id);
    if (session.IsErr()) {
        return Result<void, Error>::Err(session.Error());
    }
    if (session.Value()->Backend() != backend) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::SessionNotFound, "PostSessionMessage", backend,
            "session " + session_id + " does not belong to backend '" + backend + "'"));
    }
    auto decoded = DecodeClientMessage(backend, body);
    if (decoded.IsErr()) {
        return Result<void, Error>::Err(decoded.Error());
    }
    auto observed = sessions_.ObserveClientMessage(session_id, decoded.Value());
    if (observed.IsErr()) {
        return Result<void, Error>::Err(observed.Error());
    }
    return registry_.Send(backend, decoded.Value());
}

Result<void, Error> GatewayFacade::CloseSession(const std::string& session_id) {
    return sessions_.Destroy(session_id);
}

// ---------------------------------------------------------------------------
// Maintenance and reporting
// ---------------------------------------------------------------------------
size_t GatewayFacade::ReapIdleSessions() {
    return sessions_.ReapInactive(options_.session_idle_timeout);
}

std::vector<std::string> GatewayFacade::CleanupIdleBackends(std::chrono::seconds ttl) {
    auto removed = registry_.CleanupIdle(ttl);
    for (const auto& name : removed) {
        sessions_.DestroyForBackend(name);
    }
    return removed;
}

nlohmann::json GatewayFacade::SystemHealth() const {
    nlohmann::json servers = nlohmann::json::object();
    nlohmann::json failed = nlohmann::json::array();
    nlohmann::json degraded = nlohmann::json::array();
    size_t live = 0;

    const auto statuses = registry_.List();
    for (const auto& status : statuses) {
        auto j = status.health.ToJson();
        j["alive"] = status.alive;
        j["popular"] = status.popular;
        j["breaker"] = BreakerStateName(status.breaker);
        servers[status.name] = j;
        if (status.alive) {
            ++live;
        }
        if (status.health.state == HealthState::Failed) {
            failed.push_back(status.name);
        } else if (status.health.state == HealthState::Degraded) {
            degraded.push_back(status.name);
        }
    }

    const bool healthy = failed.empty() && degraded.empty();
    return {
        {"status", healthy ? "healthy" : "degraded"},
        {"timestamp", std::chrono::duration<double>(
                          std::chrono::system_clock::now().time_since_epoch()).count()},
        {"version", kVersion},
        {"servers", servers},
        {"failed_servers", failed},
        {"degraded_servers", degraded},
        {"orphaned_processes", monitor_ ? monitor_->LastOrphanCount() : 0},
        {"metrics", {
            {"total_backends", statuses.size()},
            {"live_backends", live},
            {"total_tools", catalog_.Size()},
            {"open_sessions", sessions_.Count()},
        }},
    };
}

nlohmann::json GatewayFacade::Info() const {
    return {
        {"name", "mcp-fleet"},
        {"version", kVersion},
        {"status", "running"},
        {"protocolVersion", kMcpProtocolVersion},
        {"endpoints", {
            {"health", "GET /health"},
            {"backends", "GET /backends"},
            {"backend", "GET /backends/{name}"},
            {"add_backend", "POST /backends"},
            {"remove_backend", "DELETE /backends/{name}"},
            {"restart_backend", "POST /backends/{name}/restart"},
            {"message", "POST /backends/{name}/message"},
            {"initialize", "POST /backends/{name}/initialize"},
            {"stream", "GET /backends/{name}/stream"},
            {"stream_post", "POST /backends/{name}/stream?session_id={id}"},
            {"socket", options_.socket_base_url + "/backends/{name}/socket"},
            {"tools", "GET /tools"},
            {"call", "POST /call"},
        }},
    };
}

} // namespace mcp_fleet
