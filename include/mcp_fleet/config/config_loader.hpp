#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_fleet {

// Flags given on the command line. Unset flags leave the file value alone.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<uint16_t> socket_port;
    std::optional<std::string> public_url;
    std::optional<std::string> api_key;
    std::optional<int> idle_ttl_seconds;
    std::optional<ResponseRouting> response_routing;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool log_json = false;
    bool no_popular = false;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Reads the process environment.
std::optional<std::string> ProcessEnv(const std::string& name);

// Parse a YAML config file into an AppConfig (defaults for absent keys).
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text; LoadFromYaml reads the file and forwards here.
Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml_text);

// Parse CLI arguments (argv[0] plus flags, no subcommand token).
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI flags on top of a base config.
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli);

// Apply MCP_FLEET_* environment variables on top of the config.
Result<AppConfig, Error> ApplyEnvOverrides(AppConfig config,
                                           const EnvLookup& env = ProcessEnv);

// Expand ${VAR} references inside backend env values. A backend that
// references an unset variable is disabled with a warning, not rejected.
Result<AppConfig, Error> ResolveEnvReferences(AppConfig config,
                                              const EnvLookup& env = ProcessEnv);

// Validate that all values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

Result<ResponseRouting, Error> ParseResponseRouting(std::string_view value);

} // namespace mcp_fleet
