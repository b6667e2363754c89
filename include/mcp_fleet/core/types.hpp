#pragma once

#include <mcp_fleet/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// BackendName: validated backend identifier.
//
// Rules:
//   - Non-empty, max 64 characters
//   - ASCII letters, digits, '-' and '_' only
//   - No '.', which separates backend and tool in qualified names
// ---------------------------------------------------------------------------
class BackendName {
public:
    static Result<BackendName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const BackendName& other) const { return value_ == other.value_; }
    bool operator!=(const BackendName& other) const { return value_ != other.value_; }

private:
    explicit BackendName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// QualifiedToolName: "backend.tool", split at the first '.'.
// The tool part may itself contain dots.
// ---------------------------------------------------------------------------
class QualifiedToolName {
public:
    static Result<QualifiedToolName, std::string> Parse(std::string_view qualified);
    static QualifiedToolName Join(const std::string& backend, const std::string& tool);

    [[nodiscard]] const std::string& Backend() const noexcept { return backend_; }
    [[nodiscard]] const std::string& Tool() const noexcept { return tool_; }
    [[nodiscard]] std::string ToString() const { return backend_ + "." + tool_; }

    bool operator==(const QualifiedToolName& other) const {
        return backend_ == other.backend_ && tool_ == other.tool_;
    }

private:
    QualifiedToolName(std::string backend, std::string tool)
        : backend_(std::move(backend)), tool_(std::move(tool)) {}
    std::string backend_;
    std::string tool_;
};

/// Random 128-bit hex identifier for sessions.
std::string GenerateSessionId();

} // namespace mcp_fleet
