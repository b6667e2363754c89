#pragma once

namespace mcp_fleet {

constexpr const char* kVersion = "0.4.0";

/// MCP protocol revision the gateway negotiates with backends and clients.
constexpr const char* kMcpProtocolVersion = "2024-11-05";

} // namespace mcp_fleet
