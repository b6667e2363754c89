#include <mcp_fleet/catalog/tool_catalog.hpp>
#include <mcp_fleet/config/config_loader.hpp>
#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/terminal.hpp>
#include <mcp_fleet/core/version.hpp>
#include <mcp_fleet/gateway/gateway_facade.hpp>
#include <mcp_fleet/gateway/http_server.hpp>
#include <mcp_fleet/gateway/request_gate.hpp>
#include <mcp_fleet/gateway/socket_server.hpp>
#include <mcp_fleet/health/process_monitor.hpp>
#include <mcp_fleet/mcp/mcp_server.hpp>
#include <mcp_fleet/process/process_table.hpp>
#include <mcp_fleet/registry/backend_registry.hpp>
#include <mcp_fleet/runtime/periodic_task.hpp>
#include <mcp_fleet/runtime/session_manager.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <pthread.h>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

enum class Mode {
    Serve,
    Mcp,
};

// Flags handled here rather than by LoadFromCli.
struct FrontFlags {
    Mode mode = Mode::Serve;
    std::optional<mcp_fleet::LogLevel> verbosity;
    bool force_color = false;
    bool force_no_color = false;
    std::vector<const char*> rest;   // argv[0] plus everything LoadFromCli parses
};

FrontFlags ParseFrontFlags(int argc, const char* const* argv) {
    FrontFlags flags;
    flags.rest.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (i == 1 && arg == "serve") { continue; }
        if (i == 1 && arg == "mcp") { flags.mode = Mode::Mcp; continue; }
        if (arg == "-vv") { flags.verbosity = mcp_fleet::LogLevel::Debug; continue; }
        if (arg == "-v") {
            if (!flags.verbosity) flags.verbosity = mcp_fleet::LogLevel::Info;
            continue;
        }
        if (arg == "--color") { flags.force_color = true; continue; }
        if (arg == "--no-color") { flags.force_no_color = true; continue; }
        flags.rest.push_back(argv[i]);
    }
    return flags;
}

mcp_fleet::Result<mcp_fleet::AppConfig, mcp_fleet::Error> BuildConfig(const FrontFlags& flags) {
    using namespace mcp_fleet;

    auto cli = LoadFromCli(static_cast<int>(flags.rest.size()), flags.rest.data());
    if (cli.IsErr()) {
        return Result<AppConfig, Error>::Err(cli.Error());
    }

    AppConfig base;
    if (cli.Value().config_path) {
        auto loaded = LoadFromYaml(*cli.Value().config_path);
        if (loaded.IsErr()) {
            return loaded;
        }
        base = std::move(loaded).Value();
    } else {
        base.popular_backends = DefaultPopularBackends();
    }

    auto merged = ApplyEnvOverrides(MergeConfigs(base, cli.Value()));
    if (merged.IsErr()) {
        return merged;
    }
    auto resolved = ResolveEnvReferences(std::move(merged).Value());
    if (resolved.IsErr()) {
        return resolved;
    }
    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return resolved;
}

void InitLogging(const mcp_fleet::AppConfig& config, const FrontFlags& flags) {
    using namespace mcp_fleet;

    auto level = ParseLogLevel(config.log_level).value_or(LogLevel::Info);
    if (flags.verbosity) {
        level = *flags.verbosity;
    }

    // stdout carries MCP traffic in mcp mode, so every sink writes to stderr.
    std::unique_ptr<ILogSink> sink;
    if (config.log_json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(
            ResolveLogColor(flags.force_color, flags.force_no_color));
    }
    if (config.log_file) {
        sink = std::make_unique<TeeSink>(std::move(sink),
                                         std::make_unique<FileSink>(*config.log_file,
                                                                    config.log_json));
    }
    InitGlobalLogger(std::move(sink), level);
}

// Blocks until SIGINT or SIGTERM. The signals must already be blocked in
// every thread.
int WaitForShutdownSignal(const sigset_t& signals) {
    int received = 0;
    if (sigwait(&signals, &received) != 0) {
        return 0;
    }
    return received;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_fleet;

    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version" || arg == "-V") {
            std::cout << "mcp-fleet " << kVersion << "\n";
            return kExitSuccess;
        }
    }

    auto flags = ParseFrontFlags(argc, argv);
    auto config_result = BuildConfig(flags);
    if (config_result.IsErr()) {
        std::cerr << "mcp-fleet: " << config_result.Error().ToString() << "\n";
        return config_result.Error().ExitCode();
    }
    const AppConfig config = std::move(config_result).Value();
    InitLogging(config, flags);

    // Block the shutdown signals before any thread starts so that they are
    // delivered only to sigwait below.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    // -- Core services --
    ToolCatalog catalog(config.catalog);
    BackendRegistry registry(RegistryOptions::FromConfig(config), catalog,
                             PosixProcessFactory(config.backend));
    SessionManager sessions(registry, config.session);
    ProcfsProcessTable process_table;
    ProcessMonitor monitor(registry, process_table, config.monitor);
    GatewayFacade gateway(registry, catalog, sessions, GatewayOptions::FromConfig(config),
                          &monitor);

    for (const auto& [name, backend] : config.popular_backends) {
        if (!backend.enabled) {
            LogInfo("main", "popular backend " + name + " is disabled, skipping");
            continue;
        }
        auto registered = registry.RegisterPopular(name, backend);
        if (registered.IsErr()) {
            LogWarn("main", registered.Error().ToString());
        }
    }
    const size_t running = registry.StartPopular();
    LogInfo("main", std::to_string(running) + " popular backend(s) running");

    monitor.Start();
    PeriodicTask backend_cleanup("backend-cleanup", config.cleanup_interval, [&] {
        auto removed = gateway.CleanupIdleBackends(config.idle_ttl);
        if (!removed.empty()) {
            LogInfo("main", "removed " + std::to_string(removed.size()) + " idle backend(s)");
        }
    });
    PeriodicTask session_reaper("session-reaper", config.cleanup_interval, [&] {
        gateway.ReapIdleSessions();
    });
    backend_cleanup.Start();
    session_reaper.Start();

    auto shutdown = [&] {
        session_reaper.Stop();
        backend_cleanup.Stop();
        monitor.Stop();
        sessions.DestroyAll();
        registry.Shutdown();
        LogInfo("main", "shutdown complete");
    };

    if (flags.mode == Mode::Mcp) {
        // Headless: the fleet is served on our own stdio until EOF.
        McpServer server(gateway);
        server.Run();
        shutdown();
        return kExitSuccess;
    }

    auto gate = MakeRequestGate(config.api_key);

    HttpServerOptions http_options;
    http_options.host = config.host;
    http_options.port = config.port;
    http_options.threads = config.http_threads;
    http_options.max_streams = config.http_max_streams;
    http_options.heartbeat = config.session.heartbeat;
    HttpServer http(gateway, *gate, http_options);

    SocketServerOptions socket_options;
    socket_options.host = config.host;
    socket_options.port = config.socket_port;
    SocketServer socket(gateway, *gate, socket_options);

    auto http_started = http.Start();
    if (http_started.IsErr()) {
        LogError("main", http_started.Error().ToString());
        shutdown();
        return http_started.Error().ExitCode();
    }
    auto socket_started = socket.Start();
    if (socket_started.IsErr()) {
        LogError("main", socket_started.Error().ToString());
        http.Stop();
        shutdown();
        return socket_started.Error().ExitCode();
    }

    LogInfo("main", std::string("mcp-fleet ") + kVersion + " ready: http " +
                        std::to_string(http.BoundPort()) + ", socket " +
                        std::to_string(socket.BoundPort()));

    const int signal = WaitForShutdownSignal(signals);
    LogInfo("main", "received signal " + std::to_string(signal) + ", shutting down");

    http.Stop();
    socket.Stop();
    shutdown();
    return kExitSuccess;
}
