#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_fleet {

// Launch configuration for one stdio MCP backend.
struct BackendConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // merged over the gateway's environment
    std::optional<std::string> cwd;
    bool enabled = true;

    bool operator==(const BackendConfig& other) const {
        return command == other.command && args == other.args &&
               env == other.env && cwd == other.cwd && enabled == other.enabled;
    }
    bool operator!=(const BackendConfig& other) const { return !(*this == other); }
};

// How backend messages reach Sessions.
//   Broadcast: every message goes to every Session of the backend.
//   Owner:     a response whose id was claimed by a Session goes only there.
enum class ResponseRouting {
    Broadcast,
    Owner,
};

struct BackendOptions {
    std::chrono::milliseconds startup_grace{500};
    std::chrono::milliseconds stop_timeout{5000};
};

struct BreakerOptions {
    int failure_threshold = 5;
    std::chrono::seconds recovery_timeout{60};
};

struct MonitorOptions {
    std::chrono::seconds interval{60};
    std::vector<std::string> orphan_patterns = {
        "mcp-server",
        "tavily-mcp",
        "server-sequential-thinking",
        "mcp-server-time",
        "server-everything",
        "dynamic-tool-retriever",
    };
    std::chrono::milliseconds orphan_kill_timeout{5000};
    bool orphan_scan = true;
    // Also treat matching processes whose parent is init (pid 1) as orphans.
    bool orphan_include_init_children = false;
};

struct SessionOptions {
    size_t queue_capacity = 256;
    std::chrono::seconds idle_timeout{1800};
    std::chrono::seconds heartbeat{30};
};

struct CatalogOptions {
    bool discover_resources = true;
    bool discover_prompts = true;
};

struct AppConfig {
    // -- Listeners --
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    uint16_t socket_port = 8001;
    std::optional<std::string> public_url;   // base URL advertised in backend detail
    size_t http_threads = 32;
    size_t http_max_streams = 0;             // 0: http_threads minus a reserve
    std::optional<std::string> api_key;

    // -- Fleet --
    std::map<std::string, BackendConfig> popular_backends;
    std::chrono::seconds idle_ttl{600};
    std::chrono::seconds cleanup_interval{60};
    size_t max_dynamic_backends = 20;
    std::chrono::milliseconds message_timeout{10000};
    std::chrono::milliseconds tool_timeout{60000};
    ResponseRouting response_routing = ResponseRouting::Broadcast;

    BackendOptions backend;
    BreakerOptions breaker;
    MonitorOptions monitor;
    SessionOptions session;
    CatalogOptions catalog;

    // -- Logging --
    std::string log_level = "info";
    bool log_json = false;
    std::optional<std::string> log_file;
};

/// Built-in popular backends used when the config file names none.
std::map<std::string, BackendConfig> DefaultPopularBackends();

} // namespace mcp_fleet
