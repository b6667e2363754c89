#include <mcp_fleet/config/config_loader.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>
#include <mcp_fleet/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace mcp_fleet {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", "", message);
}

// Parse one backend mapping: {command, args, env, cwd, enabled}.
Result<BackendConfig, Error> ParseYamlBackend(const std::string& name,
                                              const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<BackendConfig, Error>::Err(
            MakeConfigError("Backend '" + name + "' must be a mapping"));
    }
    if (!node["command"]) {
        return Result<BackendConfig, Error>::Err(
            MakeConfigError("Backend '" + name + "' missing 'command' field"));
    }

    BackendConfig backend;
    backend.command = node["command"].as<std::string>();
    if (node["args"]) {
        for (const auto& arg : node["args"]) {
            backend.args.push_back(arg.as<std::string>());
        }
    }
    if (node["env"]) {
        for (const auto& kv : node["env"]) {
            backend.env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (node["cwd"]) {
        backend.cwd = node["cwd"].as<std::string>();
    }
    if (node["enabled"]) {
        backend.enabled = node["enabled"].as<bool>();
    }
    return Result<BackendConfig, Error>::Ok(std::move(backend));
}

Result<void, Error> ParseBackendMap(const YAML::Node& node,
                                    std::map<std::string, BackendConfig>& out) {
    for (const auto& kv : node) {
        auto name = kv.first.as<std::string>();
        auto backend = ParseYamlBackend(name, kv.second);
        if (backend.IsErr()) {
            return Result<void, Error>::Err(backend.Error());
        }
        out[name] = std::move(backend).Value();
    }
    return Result<void, Error>::Ok();
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    AppConfig config;

    // -- Listeners --
    if (const auto gw = root["gateway"]) {
        if (gw["host"]) config.host = gw["host"].as<std::string>();
        if (gw["port"]) config.port = gw["port"].as<uint16_t>();
        if (gw["socket_port"]) config.socket_port = gw["socket_port"].as<uint16_t>();
        if (gw["public_url"]) config.public_url = gw["public_url"].as<std::string>();
        if (gw["http_threads"]) config.http_threads = gw["http_threads"].as<size_t>();
        if (gw["http_max_streams"]) {
            config.http_max_streams = gw["http_max_streams"].as<size_t>();
        }
        if (gw["api_key"]) config.api_key = gw["api_key"].as<std::string>();
    }

    // -- Backends --
    // "mcpServers" is the layout MCP desktop clients use; both are accepted.
    const bool has_backends = root["backends"] || root["mcpServers"];
    if (has_backends) {
        for (const char* key : {"backends", "mcpServers"}) {
            if (const auto node = root[key]) {
                auto parsed = ParseBackendMap(node, config.popular_backends);
                if (parsed.IsErr()) {
                    return Result<AppConfig, Error>::Err(parsed.Error());
                }
            }
        }
    } else {
        config.popular_backends = DefaultPopularBackends();
    }

    // -- Fleet --
    if (const auto fleet = root["fleet"]) {
        if (fleet["idle_ttl"]) {
            config.idle_ttl = std::chrono::seconds(fleet["idle_ttl"].as<int>());
        }
        if (fleet["cleanup_interval"]) {
            config.cleanup_interval = std::chrono::seconds(fleet["cleanup_interval"].as<int>());
        }
        if (fleet["max_dynamic_backends"]) {
            config.max_dynamic_backends = fleet["max_dynamic_backends"].as<size_t>();
        }
        if (fleet["message_timeout_ms"]) {
            config.message_timeout =
                std::chrono::milliseconds(fleet["message_timeout_ms"].as<int>());
        }
        if (fleet["tool_timeout_ms"]) {
            config.tool_timeout = std::chrono::milliseconds(fleet["tool_timeout_ms"].as<int>());
        }
        if (fleet["response_routing"]) {
            auto routing = ParseResponseRouting(fleet["response_routing"].as<std::string>());
            if (routing.IsErr()) {
                return Result<AppConfig, Error>::Err(routing.Error());
            }
            config.response_routing = routing.Value();
        }
        if (fleet["startup_grace_ms"]) {
            config.backend.startup_grace =
                std::chrono::milliseconds(fleet["startup_grace_ms"].as<int>());
        }
        if (fleet["stop_timeout_ms"]) {
            config.backend.stop_timeout =
                std::chrono::milliseconds(fleet["stop_timeout_ms"].as<int>());
        }
    }

    if (const auto breaker = root["breaker"]) {
        if (breaker["failure_threshold"]) {
            config.breaker.failure_threshold = breaker["failure_threshold"].as<int>();
        }
        if (breaker["recovery_timeout"]) {
            config.breaker.recovery_timeout =
                std::chrono::seconds(breaker["recovery_timeout"].as<int>());
        }
    }

    if (const auto monitor = root["monitor"]) {
        if (monitor["interval"]) {
            config.monitor.interval = std::chrono::seconds(monitor["interval"].as<int>());
        }
        if (monitor["orphan_scan"]) {
            config.monitor.orphan_scan = monitor["orphan_scan"].as<bool>();
        }
        if (monitor["orphan_patterns"]) {
            config.monitor.orphan_patterns.clear();
            for (const auto& pattern : monitor["orphan_patterns"]) {
                config.monitor.orphan_patterns.push_back(pattern.as<std::string>());
            }
        }
        if (monitor["orphan_include_init_children"]) {
            config.monitor.orphan_include_init_children =
                monitor["orphan_include_init_children"].as<bool>();
        }
        if (monitor["orphan_kill_timeout_ms"]) {
            config.monitor.orphan_kill_timeout =
                std::chrono::milliseconds(monitor["orphan_kill_timeout_ms"].as<int>());
        }
    }

    if (const auto session = root["session"]) {
        if (session["queue_capacity"]) {
            config.session.queue_capacity = session["queue_capacity"].as<size_t>();
        }
        if (session["idle_timeout"]) {
            config.session.idle_timeout = std::chrono::seconds(session["idle_timeout"].as<int>());
        }
        if (session["heartbeat"]) {
            config.session.heartbeat = std::chrono::seconds(session["heartbeat"].as<int>());
        }
    }

    if (const auto catalog = root["catalog"]) {
        if (catalog["resources"]) {
            config.catalog.discover_resources = catalog["resources"].as<bool>();
        }
        if (catalog["prompts"]) {
            config.catalog.discover_prompts = catalog["prompts"].as<bool>();
        }
    }

    // -- Logging --
    if (const auto logging = root["logging"]) {
        if (logging["level"]) config.log_level = logging["level"].as<std::string>();
        if (logging["json"]) config.log_json = logging["json"].as<bool>();
        if (logging["file"]) config.log_file = logging["file"].as<std::string>();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

std::optional<int> ParseInt(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Expand every ${NAME} in value. Returns the names that were not set.
Result<std::string, Error> ExpandReferences(const std::string& value,
                                            const EnvLookup& env,
                                            std::vector<std::string>& missing) {
    std::string out;
    size_t pos = 0;
    while (pos < value.size()) {
        auto start = value.find("${", pos);
        if (start == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, start - pos);
        auto end = value.find('}', start + 2);
        if (end == std::string::npos) {
            return Result<std::string, Error>::Err(
                MakeConfigError("Unterminated ${ in value '" + value + "'"));
        }
        auto name = value.substr(start + 2, end - start - 2);
        if (name.empty()) {
            return Result<std::string, Error>::Err(
                MakeConfigError("Empty ${} reference in value '" + value + "'"));
        }
        auto resolved = env(name);
        if (resolved.has_value()) {
            out += *resolved;
        } else {
            missing.push_back(name);
        }
        pos = end + 1;
    }
    return Result<std::string, Error>::Ok(std::move(out));
}

} // anonymous namespace

std::optional<std::string> ProcessEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

Result<ResponseRouting, Error> ParseResponseRouting(std::string_view value) {
    if (value == "broadcast") {
        return Result<ResponseRouting, Error>::Ok(ResponseRouting::Broadcast);
    }
    if (value == "owner") {
        return Result<ResponseRouting, Error>::Ok(ResponseRouting::Owner);
    }
    return Result<ResponseRouting, Error>::Err(MakeConfigError(
        "Invalid response_routing '" + std::string(value) +
        "' (expected 'broadcast' or 'owner')"));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    std::ifstream in{std::string(file_path)};
    if (!in) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Cannot open config file: " + std::string(file_path)));
    }
    std::ostringstream text;
    text << in.rdbuf();
    return LoadFromYamlString(text.str());
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml_text) {
    try {
        auto root = YAML::Load(std::string(yaml_text));
        if (root.IsNull()) {
            AppConfig config;
            config.popular_backends = DefaultPopularBackends();
            return Result<AppConfig, Error>::Ok(std::move(config));
        }
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config root must be a mapping"));
        }
        return ParseYamlRoot(root);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-fleet", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--host")
        .help("Address the HTTP and socket listeners bind to");
    program.add_argument("--port")
        .help("HTTP port")
        .scan<'i', int>();
    program.add_argument("--socket-port")
        .help("WebSocket port")
        .scan<'i', int>();
    program.add_argument("--public-url")
        .help("Base URL advertised in backend detail responses");
    program.add_argument("--api-key")
        .help("Require this key on every request (X-API-Key or Bearer)");
    program.add_argument("--idle-ttl")
        .help("Seconds before an idle dynamic backend is removed")
        .scan<'i', int>();
    program.add_argument("--response-routing")
        .help("broadcast or owner");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Also append log lines to this file");
    program.add_argument("--log-json")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-popular")
        .help("Do not start the configured popular backends")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    auto port_flag = [&](const char* name) -> Result<std::optional<uint16_t>, Error> {
        auto val = program.present<int>(name);
        if (!val) {
            return Result<std::optional<uint16_t>, Error>::Ok(std::nullopt);
        }
        if (*val <= 0 || *val > 65535) {
            return Result<std::optional<uint16_t>, Error>::Err(
                MakeConfigError(std::string("Invalid ") + name + ": " + std::to_string(*val)));
        }
        return Result<std::optional<uint16_t>, Error>::Ok(static_cast<uint16_t>(*val));
    };

    CliOptions cli;
    cli.config_path = program.present("--config");
    cli.host = program.present("--host");

    auto port = port_flag("--port");
    if (port.IsErr()) {
        return Result<CliOptions, Error>::Err(port.Error());
    }
    cli.port = port.Value();
    auto socket_port = port_flag("--socket-port");
    if (socket_port.IsErr()) {
        return Result<CliOptions, Error>::Err(socket_port.Error());
    }
    cli.socket_port = socket_port.Value();

    cli.public_url = program.present("--public-url");
    cli.api_key = program.present("--api-key");
    cli.idle_ttl_seconds = program.present<int>("--idle-ttl");
    if (auto routing = program.present("--response-routing")) {
        auto parsed = ParseResponseRouting(*routing);
        if (parsed.IsErr()) {
            return Result<CliOptions, Error>::Err(parsed.Error());
        }
        cli.response_routing = parsed.Value();
    }
    cli.log_level = program.present("--log-level");
    cli.log_file = program.present("--log-file");
    cli.log_json = program.get<bool>("--log-json");
    cli.no_popular = program.get<bool>("--no-popular");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli) {
    AppConfig merged = base;

    if (cli.host) merged.host = *cli.host;
    if (cli.port) merged.port = *cli.port;
    if (cli.socket_port) merged.socket_port = *cli.socket_port;
    if (cli.public_url) merged.public_url = cli.public_url;
    if (cli.api_key) merged.api_key = cli.api_key;
    if (cli.idle_ttl_seconds) merged.idle_ttl = std::chrono::seconds(*cli.idle_ttl_seconds);
    if (cli.log_level) merged.log_level = *cli.log_level;
    if (cli.log_file) merged.log_file = cli.log_file;
    if (cli.log_json) merged.log_json = true;
    if (cli.no_popular) merged.popular_backends.clear();
    if (cli.response_routing) merged.response_routing = *cli.response_routing;

    return merged;
}

// ---------------------------------------------------------------------------
// ApplyEnvOverrides
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ApplyEnvOverrides(AppConfig config, const EnvLookup& env) {
    auto int_var = [&](const char* name) -> Result<std::optional<int>, Error> {
        auto raw = env(name);
        if (!raw) {
            return Result<std::optional<int>, Error>::Ok(std::nullopt);
        }
        auto parsed = ParseInt(*raw);
        if (!parsed) {
            return Result<std::optional<int>, Error>::Err(MakeConfigError(
                std::string("Environment variable ") + name + " is not an integer: '" +
                *raw + "'"));
        }
        return Result<std::optional<int>, Error>::Ok(parsed);
    };

    if (auto host = env("MCP_FLEET_HOST")) config.host = *host;
    if (auto key = env("MCP_FLEET_API_KEY")) config.api_key = *key;
    if (auto url = env("MCP_FLEET_PUBLIC_URL")) config.public_url = *url;
    if (auto level = env("MCP_FLEET_LOG_LEVEL")) config.log_level = *level;
    if (auto routing = env("MCP_FLEET_RESPONSE_ROUTING")) {
        auto parsed = ParseResponseRouting(*routing);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(parsed.Error());
        }
        config.response_routing = parsed.Value();
    }

    struct IntOverride {
        const char* name;
        std::function<void(int)> apply;
    };
    const IntOverride overrides[] = {
        {"MCP_FLEET_PORT", [&](int v) { config.port = static_cast<uint16_t>(v); }},
        {"MCP_FLEET_SOCKET_PORT", [&](int v) { config.socket_port = static_cast<uint16_t>(v); }},
        {"MCP_FLEET_IDLE_TTL", [&](int v) { config.idle_ttl = std::chrono::seconds(v); }},
        {"MCP_FLEET_MAX_DYNAMIC_BACKENDS",
         [&](int v) { config.max_dynamic_backends = static_cast<size_t>(v < 0 ? 0 : v); }},
        {"MCP_FLEET_HEALTH_CHECK_INTERVAL",
         [&](int v) { config.monitor.interval = std::chrono::seconds(v); }},
        {"MCP_FLEET_BREAKER_THRESHOLD", [&](int v) { config.breaker.failure_threshold = v; }},
        {"MCP_FLEET_BREAKER_RECOVERY",
         [&](int v) { config.breaker.recovery_timeout = std::chrono::seconds(v); }},
    };
    for (const auto& entry : overrides) {
        auto value = int_var(entry.name);
        if (value.IsErr()) {
            return Result<AppConfig, Error>::Err(value.Error());
        }
        if (value.Value()) {
            entry.apply(*value.Value());
        }
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ResolveEnvReferences
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveEnvReferences(AppConfig config, const EnvLookup& env) {
    for (auto& [name, backend] : config.popular_backends) {
        std::vector<std::string> missing;
        for (auto& [key, value] : backend.env) {
            auto expanded = ExpandReferences(value, env, missing);
            if (expanded.IsErr()) {
                auto error = expanded.Error();
                error.backend = name;
                return Result<AppConfig, Error>::Err(std::move(error));
            }
            value = std::move(expanded).Value();
        }
        if (!missing.empty() && backend.enabled) {
            backend.enabled = false;
            LogWarn("config", "backend '" + name + "' disabled: environment variable " +
                                  missing.front() + " is not set");
        }
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: host"));
    }
    if (config.port == 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
    }
    if (config.socket_port == 0 || config.socket_port == config.port) {
        return Result<void, Error>::Err(MakeConfigError(
            "socket_port must be non-zero and differ from port"));
    }
    if (config.http_threads < 2) {
        return Result<void, Error>::Err(MakeConfigError("http_threads must be at least 2"));
    }
    if (config.http_max_streams >= config.http_threads) {
        return Result<void, Error>::Err(
            MakeConfigError("http_max_streams must be below http_threads"));
    }
    if (config.idle_ttl.count() <= 0 || config.cleanup_interval.count() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("idle_ttl and cleanup_interval must be positive"));
    }
    if (config.message_timeout.count() <= 0 || config.tool_timeout.count() <= 0) {
        return Result<void, Error>::Err(MakeConfigError("Timeouts must be positive"));
    }
    if (config.breaker.failure_threshold < 1) {
        return Result<void, Error>::Err(MakeConfigError(
            "breaker failure_threshold must be at least 1, got " +
            std::to_string(config.breaker.failure_threshold)));
    }
    if (config.breaker.recovery_timeout.count() < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("breaker recovery_timeout must not be negative"));
    }
    if (config.monitor.interval.count() <= 0) {
        return Result<void, Error>::Err(MakeConfigError("monitor interval must be positive"));
    }
    if (config.session.queue_capacity == 0) {
        return Result<void, Error>::Err(MakeConfigError("session queue_capacity must be positive"));
    }
    if (config.session.heartbeat.count() <= 0) {
        return Result<void, Error>::Err(MakeConfigError("session heartbeat must be positive"));
    }
    if (!ParseLogLevel(config.log_level).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid log level: " + config.log_level));
    }
    if (config.api_key.has_value() && config.api_key->empty()) {
        return Result<void, Error>::Err(MakeConfigError("api_key must not be empty"));
    }
    for (const auto& [name, backend] : config.popular_backends) {
        auto valid = BackendName::Create(name);
        if (valid.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid backend name '" + name + "': " + valid.Error()));
        }
        if (backend.enabled && backend.command.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Backend '" + name + "' has an empty command"));
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_fleet
