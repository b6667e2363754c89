#pragma once

#include <mcp_fleet/core/result.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mcp_fleet {

// Case-insensitive header lookup supplied by each transport.
using HeaderLookup = std::function<std::optional<std::string>(const std::string& name)>;

// ---------------------------------------------------------------------------
// IRequestGate: admission check run at the transport boundary before any
// endpoint except the root and health endpoints.
// ---------------------------------------------------------------------------
class IRequestGate {
public:
    virtual ~IRequestGate() = default;

    /// Ok to admit, Unauthorized otherwise.
    [[nodiscard]] virtual Result<void, Error> Admit(const HeaderLookup& headers) const = 0;
};

class AllowAllGate : public IRequestGate {
public:
    [[nodiscard]] Result<void, Error> Admit(const HeaderLookup& headers) const override;
};

// Accepts "X-API-Key: <key>" or "Authorization: Bearer <key>".
class ApiKeyGate : public IRequestGate {
public:
    explicit ApiKeyGate(std::string api_key);
    [[nodiscard]] Result<void, Error> Admit(const HeaderLookup& headers) const override;

private:
    std::string api_key_;
};

/// ApiKeyGate when a key is configured, AllowAllGate otherwise.
std::unique_ptr<IRequestGate> MakeRequestGate(const std::optional<std::string>& api_key);

} // namespace mcp_fleet
