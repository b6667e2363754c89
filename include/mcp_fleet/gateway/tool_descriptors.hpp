#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/result.hpp>

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// One backend launch configuration extracted from a tool-retriever result.
struct RetrievedBackend {
    std::string name;
    BackendConfig config;
    std::string tool_name;          // descriptor that named it first
    double relevance_score = 0.0;
};

/// Parse ranked tool descriptors of the shape
///   {tool_name, description, relevance_score,
///    mcp_server_config: {mcpServers: {name: {command, args, env}}}}
/// given as an array, a single object, or {"tools": [...]}. Backends named by
/// several descriptors are returned once, in rank order.
[[nodiscard]] Result<std::vector<RetrievedBackend>, Error> ParseRetrievedDescriptors(
    const nlohmann::json& descriptors);

/// Parse one {command, args, env, cwd} object.
[[nodiscard]] Result<BackendConfig, Error> ParseBackendConfigJson(const std::string& name,
                                                                  const nlohmann::json& value);

} // namespace mcp_fleet
