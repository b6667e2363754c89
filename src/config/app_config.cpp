#include <mcp_fleet/config/app_config.hpp>

namespace mcp_fleet {

std::map<std::string, BackendConfig> DefaultPopularBackends() {
    std::map<std::string, BackendConfig> backends;

    BackendConfig tavily;
    tavily.command = "npx";
    tavily.args = {"-y", "tavily-mcp@latest"};
    tavily.env = {{"TAVILY_API_KEY", "${TAVILY_API_KEY}"}};
    backends.emplace("tavily-mcp", std::move(tavily));

    BackendConfig thinking;
    thinking.command = "npx";
    thinking.args = {"-y", "@modelcontextprotocol/server-sequential-thinking"};
    backends.emplace("sequential-thinking", std::move(thinking));

    BackendConfig time;
    time.command = "uvx";
    time.args = {"mcp-server-time"};
    backends.emplace("time", std::move(time));

    return backends;
}

} // namespace mcp_fleet
