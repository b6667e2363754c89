#pragma once

namespace mcp_fleet {
namespace ansi {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";
constexpr const char* kMagenta = "\033[35m";

} // namespace ansi
} // namespace mcp_fleet
